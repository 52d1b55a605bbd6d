/**
 * @file types.hpp
 * @brief Базовые типы и структуры данных clipdeck
 *
 * Элементы истории буфера обмена, коллекции, результаты захвата экранов
 * и коды результатов операций, общие для всего приложения.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clipdeck {

// ===========================================================================
// Константы
// ===========================================================================

/// Конфиг относительно $XDG_CONFIG_HOME (или $HOME/.config)
inline constexpr std::string_view kConfigRelPath = "clipdeck/config.yaml";

/// Каталог данных относительно $XDG_DATA_HOME (или $HOME/.local/share)
inline constexpr std::string_view kDataDirName = "clipdeck";

/// Имя файла базы истории внутри каталога данных
inline constexpr std::string_view kDatabaseFileName = "history.db";

/// Подкаталог для изображений из буфера обмена
inline constexpr std::string_view kImagesDirName = "images";

/// Подкаталог для сохранённых (отредактированных) скриншотов
inline constexpr std::string_view kCapturesDirName = "captures";

/// Префикс метки overlay-окна: "screenshot_<display id>"
inline constexpr std::string_view kOverlayLabelPrefix = "screenshot_";

/// Период опроса буфера обмена
inline constexpr std::chrono::milliseconds kMonitorInterval{1000};

// ===========================================================================
// История буфера обмена
// ===========================================================================

/// Вид содержимого элемента истории
enum class ItemKind { Text, Image };

[[nodiscard]] constexpr std::string_view to_string(ItemKind kind) noexcept {
  return kind == ItemKind::Image ? "image" : "text";
}

[[nodiscard]] constexpr std::optional<ItemKind>
parse_item_kind(std::string_view sv) noexcept {
  if (sv == "text") {
    return ItemKind::Text;
  }
  if (sv == "image") {
    return ItemKind::Image;
  }
  return std::nullopt;
}

/**
 * @brief Элемент истории буфера обмена
 *
 * Для изображений `content` хранит путь к PNG-файлу, жизненный цикл которого
 * привязан к элементу: удаление или вытеснение элемента удаляет файл.
 */
struct ClipboardItem {
  std::optional<std::int64_t> id; // нет, пока элемент не сохранён
  std::string content;
  ItemKind kind = ItemKind::Text;
  std::string data_type = "text"; // url / email / color / code / text / image
  std::chrono::system_clock::time_point timestamp{};
  bool is_pinned = false;
  bool is_sensitive = false;
  std::optional<std::string> source_app;
  std::optional<std::int64_t> collection_id;
  std::optional<std::string> note;
  std::optional<std::string> html_content;

  /// Закреплённые и входящие в коллекцию элементы не вытесняются лимитом
  [[nodiscard]] bool is_exempt() const noexcept {
    return is_pinned || collection_id.has_value();
  }
};

/// Именованная коллекция элементов
struct Collection {
  std::int64_t id = 0;
  std::string name;
};

// ===========================================================================
// Захват экранов
// ===========================================================================

/**
 * @brief Снимок одного дисплея
 *
 * x/y: логические координаты начала дисплея, width/height: физические
 * пиксели снимка.
 */
struct CaptureResult {
  std::uint32_t id = 0;
  std::string path;
  std::int32_t x = 0;
  std::int32_t y = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  double scale_factor = 1.0;
};

/// Несжатое изображение: 4 байта на пиксель (RGBA), без padding строк
struct RawImage {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> rgba;

  [[nodiscard]] bool empty() const noexcept {
    return width == 0 || height == 0 || rgba.empty();
  }
};

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult {
  Ok,
  FileNotFound,
  ParseError,
  InvalidValue,
  IoError
};

/// Результат операции с буфером обмена
enum class ClipboardResult {
  Ok,
  NoConnection,
  NoSelection,
  ConversionFailed,
  Timeout
};

/// Результат операции хранилища истории
enum class StoreResult { Ok, NotFound, InvalidPattern, InvalidArgument, Io };

[[nodiscard]] constexpr std::string_view to_string(StoreResult r) noexcept {
  switch (r) {
  case StoreResult::Ok:
    return "ok";
  case StoreResult::NotFound:
    return "not found";
  case StoreResult::InvalidPattern:
    return "invalid pattern";
  case StoreResult::InvalidArgument:
    return "invalid argument";
  case StoreResult::Io:
    return "storage error";
  }
  return "unknown";
}

} // namespace clipdeck
