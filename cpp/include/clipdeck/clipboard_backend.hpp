/**
 * @file clipboard_backend.hpp
 * @brief Абстракция системного буфера обмена
 *
 * Монитор и команды работают только через этот интерфейс; в тестах
 * подставляется фейк.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "clipdeck/types.hpp"

namespace clipdeck {

class ClipboardBackend {
public:
  virtual ~ClipboardBackend() = default;

  /// Текст CLIPBOARD; nullopt если текста нет или чтение не удалось
  [[nodiscard]] virtual std::optional<std::string> read_text() = 0;

  /// Изображение CLIPBOARD в RGBA; nullopt если изображения нет
  [[nodiscard]] virtual std::optional<RawImage> read_image() = 0;

  /// Записывает текст (html: необязательный вариант text/html)
  virtual ClipboardResult
  write_text(std::string_view text,
             const std::optional<std::string> &html = std::nullopt) = 0;

  /// Записывает закодированный PNG как image/png
  virtual ClipboardResult write_png(std::span<const std::uint8_t> png) = 0;

  /// WM_CLASS активного окна (источник копирования)
  [[nodiscard]] virtual std::optional<std::string> active_window_class() = 0;
};

} // namespace clipdeck
