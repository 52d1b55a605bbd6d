/**
 * @file ipc_server.hpp
 * @brief IPC сервер для управления clipdeck через Unix Domain Socket
 *
 * Позволяет clipdeckctl и горячим клавишам окружения рабочего стола:
 * - Ставить мониторинг на паузу и снимать с паузы
 * - Запускать и закрывать захват экрана
 * - Очищать историю и перезагружать конфигурацию
 * - Распознавать текст на изображении
 */

#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <thread>

#include "clipdeck/commands.hpp"

namespace clipdeck {

/// Команды IPC протокола
enum class IpcCommand {
  Unknown,
  GetPaused,    // GET_PAUSED -> PAUSED|RUNNING
  SetPaused,    // SET_PAUSED 0|1 -> PAUSED|RUNNING
  Capture,      // CAPTURE -> "<n> displays"
  CloseCapture, // CLOSE_CAPTURE -> OK
  Count,        // COUNT -> число элементов
  Clear,        // CLEAR -> OK
  Reload,       // RELOAD [path] -> OK|ERROR
  Ocr           // OCR <path> -> распознанный текст
};

/// Результат выполнения команды
struct IpcResult {
  bool success = false;
  std::string message;
};

/// Разбор имени команды (аргументы не проверяются)
[[nodiscard]] IpcCommand parse_ipc_command(std::string_view line);

/**
 * @brief IPC сервер на Unix Domain Socket
 *
 * Работает в отдельном потоке, не блокирует главный цикл GTK.
 * Использует poll для неблокирующего приёма соединений.
 */
class IpcServer {
public:
  /**
   * @param commands Команды приложения (вызываются из IPC-потока)
   * @param socket_path Путь сокета; пусто = default_socket_path()
   */
  explicit IpcServer(Commands &commands, std::string socket_path = {});

  ~IpcServer();

  // Запрет копирования
  IpcServer(const IpcServer &) = delete;
  IpcServer &operator=(const IpcServer &) = delete;

  /**
   * @brief Запускает IPC сервер в отдельном потоке
   * @return true если сервер успешно запущен
   */
  bool start();

  /**
   * @brief Останавливает IPC сервер
   *
   * Ожидает завершения потока (join).
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

  /// Парсит и выполняет одну команду (без сокета)
  IpcResult execute_command(std::string_view cmd);

private:
  /// Основной цикл сервера (выполняется в отдельном потоке)
  void server_loop(std::stop_token st);

  /// Обрабатывает входящее соединение
  void handle_client(int client_fd);

  /// Создаёт и настраивает серверный сокет
  [[nodiscard]] int create_socket();

  Commands &commands_;

  std::atomic<bool> running_{false};
  std::jthread server_thread_;
  int server_fd_ = -1;
  std::string socket_path_;
};

} // namespace clipdeck
