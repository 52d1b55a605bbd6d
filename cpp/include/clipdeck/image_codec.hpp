/**
 * @file image_codec.hpp
 * @brief PNG-кодек для RGBA-буферов (gdk-pixbuf) и декодирование base64
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "clipdeck/types.hpp"

namespace clipdeck {

/// Закодированные байты или текст ошибки
struct EncodeOutcome {
  std::vector<std::uint8_t> bytes;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/// Декодированное изображение или текст ошибки
struct DecodeOutcome {
  RawImage image;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/// Кодирует RGBA-буфер в PNG
[[nodiscard]] EncodeOutcome encode_png(const RawImage &image);

/**
 * @brief Декодирует изображение в RGBA
 *
 * Формат определяет gdk-pixbuf (PNG, JPEG, BMP, ...). Изображение без
 * альфа-канала получает непрозрачную альфу.
 */
[[nodiscard]] DecodeOutcome decode_image(std::span<const std::uint8_t> data);

/// Кодирует в PNG и пишет файл (temp + rename). Пустая строка при успехе
[[nodiscard]] std::string write_png_file(const RawImage &image,
                                         const std::filesystem::path &path);

/// Пишет готовые байты в файл (temp + rename). Пустая строка при успехе
[[nodiscard]] std::string write_bytes_file(std::span<const std::uint8_t> bytes,
                                           const std::filesystem::path &path);

/// Читает файл и декодирует его
[[nodiscard]] DecodeOutcome load_image_file(const std::filesystem::path &path);

/**
 * @brief Декодирует base64 или data-URL ("data:image/png;base64,....")
 * @return Байты; пустой вектор если данных нет или они некорректны
 */
[[nodiscard]] std::vector<std::uint8_t>
decode_base64_payload(std::string_view payload);

/// FNV-1a по пикселям и размеру изображения
[[nodiscard]] std::uint64_t pixel_hash(const RawImage &image);

/// Имя файла изображения из истории: "<hash hex>.png"
[[nodiscard]] std::string image_file_name(const RawImage &image);

} // namespace clipdeck
