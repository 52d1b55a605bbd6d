/**
 * @file content_classifier.hpp
 * @brief Классификация текстового содержимого буфера обмена
 *
 * Определяет data_type элемента по виду текста: ссылка, e-mail,
 * цвет, фрагмент кода или обычный текст.
 */

#pragma once

#include <string_view>

namespace clipdeck {

inline constexpr std::string_view kDataTypeUrl = "url";
inline constexpr std::string_view kDataTypeEmail = "email";
inline constexpr std::string_view kDataTypeColor = "color";
inline constexpr std::string_view kDataTypeCode = "code";
inline constexpr std::string_view kDataTypeText = "text";
inline constexpr std::string_view kDataTypeImage = "image";

/**
 * @brief Классифицирует текст
 * @param content Текст из буфера обмена
 * @return Один из kDataType* (никогда не kDataTypeImage)
 */
[[nodiscard]] std::string_view classify_content(std::string_view content);

/// #RGB, #RGBA, #RRGGBB, #RRGGBBAA, rgb()/rgba()/hsl()/hsla()
[[nodiscard]] bool is_color(std::string_view sv);

/// http(s)/ftp/file ссылки и "www." адреса без пробелов
[[nodiscard]] bool is_url(std::string_view sv);

[[nodiscard]] bool is_email(std::string_view sv);

/// Эвристика: скобки, ';', ключевые слова, отступы в многострочном тексте
[[nodiscard]] bool looks_like_code(std::string_view sv);

} // namespace clipdeck
