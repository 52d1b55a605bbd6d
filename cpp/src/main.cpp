/**
 * @file main.cpp
 * @brief Точка входа clipdeck
 *
 * Демон истории буфера обмена со снимками экрана для X11.
 * Главный поток крутит gtk_main() и владеет overlay-окнами; монитор
 * буфера, горячая клавиша и IPC работают в своих потоках.
 */

#include "clipdeck/commands.hpp"
#include "clipdeck/config.hpp"
#include "clipdeck/gtk_window_system.hpp"
#include "clipdeck/history_store.hpp"
#include "clipdeck/hotkey_binder.hpp"
#include "clipdeck/clipboard_monitor.hpp"
#include "clipdeck/ipc_server.hpp"
#include "clipdeck/ocr.hpp"
#include "clipdeck/overlay_orchestrator.hpp"
#include "clipdeck/ui_dispatcher.hpp"
#include "clipdeck/x11_clipboard.hpp"
#include "clipdeck/x11_display_source.hpp"

#include <X11/Xlib.h>
#include <glib-unix.h>
#include <gtk/gtk.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace {

void print_version() {
  std::cout << "clipdeck 1.0.0\n"
            << "История буфера обмена и снимки экрана для X11\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -c, --config PATH  Файл конфигурации\n"
            << "  -h, --help         Показать эту справку\n"
            << "  -v, --version      Показать версию\n"
            << "\n"
            << "Конфигурация: " << clipdeck::default_config_path().string()
            << "\n"
            << "Управление: clipdeckctl (сокет "
            << clipdeck::default_socket_path() << ")\n";
}

/// X11 ошибки не должны завершать процесс (по умолчанию Xlib делает exit)
int on_x_error(Display *display, XErrorEvent *event) {
  char text[256] = {};
  XGetErrorText(display, event->error_code, text, sizeof(text));
  std::cerr << "[clipdeck] X11 error: " << text << " (request "
            << static_cast<int>(event->request_code) << ")\n";
  return 0;
}

gboolean on_quit_signal(gpointer user_data) {
  (void)user_data;
  std::cerr << "[clipdeck] Shutdown requested\n";
  gtk_main_quit();
  return G_SOURCE_CONTINUE;
}

bool ensure_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "[clipdeck] Cannot create " << dir.string() << ": "
              << ec.message() << "\n";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  std::filesystem::path config_path;

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
    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      config_path = argv[++i];
    }
  }

  // Xlib используется из нескольких потоков (монитор, захват, GTK)
  if (!XInitThreads()) {
    std::cerr << "[clipdeck] XInitThreads failed\n";
    return 1;
  }

  if (!gtk_init_check(&argc, &argv)) {
    std::cerr << "[clipdeck] Cannot initialize GTK (no display?)\n";
    return 1;
  }
  XSetErrorHandler(&on_x_error);

  // Загрузка конфигурации
  clipdeck::Config config = clipdeck::load_config(config_path);

  const std::filesystem::path data_dir = clipdeck::default_data_dir();
  clipdeck::CommandPaths paths;
  paths.images_dir = data_dir / clipdeck::kImagesDirName;
  paths.captures_dir = data_dir / clipdeck::kCapturesDirName;
  paths.screenshot_dir = clipdeck::default_screenshot_dir();

  if (!ensure_dir(data_dir) || !ensure_dir(paths.images_dir)) {
    return 1;
  }

  auto opened =
      clipdeck::HistoryStore::open(data_dir / clipdeck::kDatabaseFileName);
  if (!opened.ok()) {
    std::cerr << "[clipdeck] Cannot open history: " << opened.error << "\n";
    return 1;
  }
  clipdeck::HistoryStore &store = *opened.value;

  clipdeck::AppState state{config};
  clipdeck::EventBus bus;

  clipdeck::X11Clipboard clipboard;
  if (!clipboard.open()) {
    return 1;
  }

  clipdeck::X11DisplaySource displays;
  clipdeck::DisplayCaptureService capture{displays};

  clipdeck::UiDispatcher dispatcher;
  clipdeck::GtkWindowSystem windows{dispatcher};
  auto level = clipdeck::make_window_level_capability();
  clipdeck::OverlayOrchestrator overlays{windows, *level, bus};

  clipdeck::TesseractOcr ocr;
  clipdeck::HotkeyBinder hotkey{bus};

  clipdeck::Commands commands{
      store,    state, bus,   clipboard,
      capture,  overlays, ocr, paths,
      [&hotkey](const std::string &shortcut) {
        return hotkey.rebind(shortcut);
      }};

  windows.set_dismiss_handler([&commands] { (void)commands.close_capture(); });

  (void)bus.subscribe([](const clipdeck::Event &event) {
    std::cerr << "[clipdeck] Event: " << clipdeck::to_string(event.kind);
    if (event.kind == clipdeck::EventKind::CaptureCompleted) {
      std::cerr << " (" << event.captures.size() << " displays)";
    } else if (event.kind == clipdeck::EventKind::PauseStateChanged) {
      std::cerr << (event.paused ? " (paused)" : " (running)");
    }
    std::cerr << "\n";
  });

  clipdeck::ClipboardMonitor monitor{clipboard, store, state, bus,
                                     paths.images_dir};
  monitor.start();

  if (!hotkey.start(config.shortcut)) {
    std::cerr << "[clipdeck] Warning: global shortcut disabled\n";
  }

  clipdeck::IpcServer ipc{commands};
  if (!ipc.start()) {
    std::cerr << "[clipdeck] Warning: IPC server failed to start. "
              << "clipdeckctl will not work.\n";
  }

  g_unix_signal_add(SIGINT, on_quit_signal, nullptr);
  g_unix_signal_add(SIGTERM, on_quit_signal, nullptr);

  std::cerr << "[clipdeck] Running, history limit " << config.max_history_size
            << ", window level " << level->name() << "\n";

  gtk_main();

  // Потоки, ждущие главный цикл, должны освободиться до join
  dispatcher.shutdown();
  ipc.stop();
  hotkey.stop();
  monitor.stop();
  (void)commands.close_capture();

  std::cerr << "[clipdeck] Terminated gracefully\n";
  return 0;
}
