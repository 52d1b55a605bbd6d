/**
 * @file clipboard_monitor.hpp
 * @brief Фоновое отслеживание изменений буфера обмена
 *
 * Раз в секунду читает текст и изображение CLIPBOARD и сравнивает их
 * с последними увиденными. Изменение классифицируется и сохраняется
 * в историю; собственные записи приложения (метка в AppState)
 * пропускаются.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>

#include "clipdeck/app_state.hpp"
#include "clipdeck/clipboard_backend.hpp"
#include "clipdeck/event_bus.hpp"
#include "clipdeck/history_store.hpp"

namespace clipdeck {

/// Итог одного опроса
struct TickReport {
  std::size_t inserted = 0;
  std::size_t self_writes = 0; // изменения, вызванные нами
  std::size_t paused_skips = 0;
  std::size_t failures = 0;
  std::size_t evicted = 0;

  [[nodiscard]] bool changed() const noexcept {
    return inserted + self_writes + paused_skips + failures > 0;
  }
};

class ClipboardMonitor {
public:
  /**
   * @param images_dir Каталог для PNG-файлов изображений из буфера
   * @param interval Период опроса
   */
  ClipboardMonitor(ClipboardBackend &backend, HistoryStore &store,
                   AppState &state, EventBus &bus,
                   std::filesystem::path images_dir,
                   std::chrono::milliseconds interval = kMonitorInterval);

  ~ClipboardMonitor();

  ClipboardMonitor(const ClipboardMonitor &) = delete;
  ClipboardMonitor &operator=(const ClipboardMonitor &) = delete;

  /// Запоминает текущее содержимое и запускает фоновый поток
  void start();

  /// Останавливает поток (join)
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  /// Запоминает текущее содержимое буфера без записи в историю
  void prime();

  /// Один опрос буфера обмена (вызывается потоком; открыт для тестов)
  TickReport tick();

private:
  void run(std::stop_token st);

  void handle_text(const std::string &text, TickReport &report);
  void handle_image(const RawImage &image, TickReport &report);
  void store_item(const ClipboardItem &item, TickReport &report);

  ClipboardBackend &backend_;
  HistoryStore &store_;
  AppState &state_;
  EventBus &bus_;
  std::filesystem::path images_dir_;
  std::chrono::milliseconds interval_;

  // Отпечатки последнего увиденного содержимого (только поток монитора)
  std::optional<std::string> last_text_;
  std::optional<RawImage> last_image_;

  std::jthread thread_;
};

} // namespace clipdeck
