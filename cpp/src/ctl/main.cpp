/**
 * @file main.cpp
 * @brief Точка входа clipdeckctl
 *
 * Утилита командной строки для управления демоном clipdeck
 * через IPC сокет. Удобна для привязки к горячим клавишам окружения.
 */

#include "clipdeck/ipc_client.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_version() {
  std::cout << "clipdeckctl 1.0.0\n"
            << "Управление демоном clipdeck\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции] <команда> [аргумент]\n"
            << "\n"
            << "Команды:\n"
            << "  status         Показать состояние мониторинга\n"
            << "  pause          Приостановить запись истории\n"
            << "  resume         Возобновить запись истории\n"
            << "  capture        Снять все дисплеи\n"
            << "  close          Закрыть окна захвата\n"
            << "  count          Число элементов в истории\n"
            << "  clear          Очистить историю\n"
            << "  reload [PATH]  Перечитать конфигурацию\n"
            << "  ocr PATH       Распознать текст на изображении\n"
            << "\n"
            << "Опции:\n"
            << "  -s, --socket PATH  Путь к сокету демона\n"
            << "  -h, --help         Показать эту справку\n"
            << "  -v, --version      Показать версию\n";
}

/// Переводит подкоманду в строку IPC протокола; пусто при ошибке
std::string to_ipc_command(std::string_view name, std::string_view arg) {
  if (name == "status") {
    return "GET_PAUSED";
  }
  if (name == "pause") {
    return "SET_PAUSED 1";
  }
  if (name == "resume") {
    return "SET_PAUSED 0";
  }
  if (name == "capture") {
    return "CAPTURE";
  }
  if (name == "close") {
    return "CLOSE_CAPTURE";
  }
  if (name == "count") {
    return "COUNT";
  }
  if (name == "clear") {
    return "CLEAR";
  }
  if (name == "reload") {
    return arg.empty() ? std::string{"RELOAD"}
                       : "RELOAD " + std::string{arg};
  }
  if (name == "ocr" && !arg.empty()) {
    return "OCR " + std::string{arg};
  }
  return {};
}

} // namespace

int main(int argc, char *argv[]) {
  std::string socket_path;
  std::vector<std::string_view> positional;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "-s" || arg == "--socket") {
      if (i + 1 >= argc) {
        std::cerr << "Не указан путь к сокету\n";
        return 1;
      }
      socket_path = argv[++i];
      continue;
    }
    positional.push_back(arg);
  }

  if (positional.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  const std::string_view name = positional[0];
  const std::string_view arg =
      positional.size() > 1 ? positional[1] : std::string_view{};

  const std::string command = to_ipc_command(name, arg);
  if (command.empty()) {
    std::cerr << "Неизвестная команда: " << name << "\n";
    print_usage(argv[0]);
    return 1;
  }

  clipdeck::IpcClient client{socket_path};
  auto reply = client.send(command);
  if (!reply) {
    std::cerr << "Демон clipdeck недоступен (" << client.socket_path()
              << ")\n";
    return 1;
  }

  if (!reply->success) {
    std::cerr << "Ошибка: " << reply->message << "\n";
    return 1;
  }

  std::cout << (reply->message.empty() ? "OK" : reply->message) << "\n";
  return 0;
}
