/**
 * @file commands.hpp
 * @brief Командный интерфейс для UI-слоя и IPC
 *
 * Каждая команда возвращает значение или строку ошибки для показа
 * пользователю. Ошибки мониторинга и сохранения конфига только
 * логируются.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clipdeck/app_state.hpp"
#include "clipdeck/clipboard_backend.hpp"
#include "clipdeck/display_capture.hpp"
#include "clipdeck/event_bus.hpp"
#include "clipdeck/history_store.hpp"
#include "clipdeck/ocr.hpp"
#include "clipdeck/overlay_orchestrator.hpp"

namespace clipdeck {

/// Результат команды без значения
struct CommandStatus {
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/// Значение команды или текст ошибки
template <typename T> struct CommandResult {
  T value{};
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/// Каталоги, с которыми работают команды
struct CommandPaths {
  std::filesystem::path images_dir;     // изображения из истории
  std::filesystem::path captures_dir;   // сохранённые скриншоты
  std::filesystem::path screenshot_dir; // временные снимки дисплеев
};

class Commands {
public:
  /// Перерегистрация глобальной горячей клавиши; false при ошибке
  using RebindCallback = std::function<bool(const std::string &)>;

  Commands(HistoryStore &store, AppState &state, EventBus &bus,
           ClipboardBackend &clipboard, DisplayCaptureService &capture,
           OverlayOrchestrator &overlays, OcrEngine &ocr, CommandPaths paths,
           RebindCallback rebind = {});

  Commands(const Commands &) = delete;
  Commands &operator=(const Commands &) = delete;

  // =========================================================================
  // Захват экрана
  // =========================================================================

  /// Снимает все дисплеи и показывает overlay-окна
  [[nodiscard]] CommandResult<std::vector<CaptureResult>> start_capture();

  /// Результаты последнего захвата
  [[nodiscard]] CommandResult<std::vector<CaptureResult>>
  get_capture_data() const;

  /// Закрывает все overlay-окна и удаляет временные снимки
  CommandStatus close_capture();

  CommandStatus close_overlay(std::uint32_t display_id);

  /**
   * @brief Сохраняет изображение из base64 или data-URL
   * @return Путь "captures/capture_<YYYYmmdd_HHMMSS_микросекунды>.png"
   */
  [[nodiscard]] CommandResult<std::string>
  save_captured_image(std::string_view payload);

  // =========================================================================
  // История
  // =========================================================================

  [[nodiscard]] CommandResult<std::vector<ClipboardItem>>
  get_history(const HistoryQuery &query) const;

  [[nodiscard]] CommandResult<std::int64_t> get_history_count() const;

  [[nodiscard]] CommandResult<std::string>
  get_item_content(std::int64_t id) const;

  /**
   * @brief Записывает элемент в буфер обмена
   *
   * Для текста content содержит сам текст, для изображения путь к файлу
   * или base64/data-URL (тогда файл создаётся в каталоге изображений).
   * С id обновляется существующий элемент, иначе вставляется новый.
   */
  CommandStatus
  set_clipboard_item(const std::string &content, ItemKind kind,
                     std::optional<std::int64_t> id = std::nullopt,
                     const std::optional<std::string> &html = std::nullopt);

  /// Удаляет элемент и его файл; отсутствие элемента не ошибка
  CommandStatus delete_item(std::int64_t id);

  [[nodiscard]] CommandResult<bool> toggle_sensitive(std::int64_t id);
  [[nodiscard]] CommandResult<bool> toggle_pin(std::int64_t id);

  CommandStatus update_clipboard_item_content(
      std::int64_t id, const std::string &content, const std::string &data_type,
      const std::optional<std::string> &note = std::nullopt,
      const std::optional<std::string> &html = std::nullopt);

  /// Очистка по флагам clear_*_on_clear текущего конфига
  CommandStatus clear_history();

  // =========================================================================
  // Конфигурация и пауза
  // =========================================================================

  [[nodiscard]] Config get_config() const;

  /**
   * @brief Применяет и сохраняет конфигурацию
   *
   * Некорректный конфиг отклоняется. Ошибка записи файла только
   * логируется: конфиг в памяти всё равно обновлён.
   */
  CommandStatus save_config(Config config);

  /// Перечитывает файл конфигурации (пусто = текущий путь) без записи
  CommandStatus reload_config(const std::filesystem::path &path = {});

  void set_paused(bool paused);
  [[nodiscard]] bool get_paused() const;

  // =========================================================================
  // Коллекции, стек вставки, OCR
  // =========================================================================

  [[nodiscard]] CommandResult<Collection>
  create_collection(const std::string &name);
  [[nodiscard]] CommandResult<std::vector<Collection>> get_collections() const;
  CommandStatus delete_collection(std::int64_t id);
  CommandStatus set_item_collection(std::int64_t item_id,
                                    std::optional<std::int64_t> collection_id);

  CommandStatus set_paste_stack(std::vector<ClipboardItem> items);

  [[nodiscard]] CommandResult<std::string>
  ocr_image(const std::filesystem::path &path);

private:
  /// Применяет конфиг в памяти, перерегистрирует клавишу, шлёт событие
  void apply_config(const Config &previous, const Config &next);

  /// Готовит изображение для записи: путь к файлу и PNG-байты
  CommandStatus prepare_image(const std::string &content,
                              std::string &stored_path,
                              std::vector<std::uint8_t> &png,
                              std::string &marker);

  HistoryStore &store_;
  AppState &state_;
  EventBus &bus_;
  ClipboardBackend &clipboard_;
  DisplayCaptureService &capture_;
  OverlayOrchestrator &overlays_;
  OcrEngine &ocr_;
  CommandPaths paths_;
  RebindCallback rebind_;
};

/// Имя файла сохранённого скриншота для момента времени
[[nodiscard]] std::string
capture_file_name(std::chrono::system_clock::time_point when);

} // namespace clipdeck
