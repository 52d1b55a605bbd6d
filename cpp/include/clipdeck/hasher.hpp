/**
 * @file hasher.hpp
 * @brief FNV-1a хеширование буферов изображений и строк
 *
 * Используется для отпечатков (fingerprint) изображений из буфера обмена
 * и для имён файлов изображений: одинаковые пиксели дают одинаковое имя,
 * поэтому повторное копирование картинки дедуплицируется в истории.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace clipdeck {

/**
 * @brief FNV-1a 64-bit хешер
 */
class Hasher {
public:
  // FNV-1a константы для 64-bit
  static constexpr std::uint64_t kFnvBasis = 14695981039346656037ULL;
  static constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

  [[nodiscard]] static constexpr std::uint64_t
  hash_string(std::string_view str) noexcept {
    std::uint64_t hash = kFnvBasis;
    for (char c : str) {
      hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
      hash *= kFnvPrime;
    }
    return hash;
  }

  /**
   * @brief Хеширует произвольный байтовый буфер
   * @param bytes Буфер (например, RGBA пиксели)
   * @return 64-bit хеш (kFnvBasis для пустого буфера)
   */
  [[nodiscard]] static std::uint64_t
  hash_bytes(std::span<const std::uint8_t> bytes) noexcept {
    std::uint64_t hash = kFnvBasis;
    for (std::uint8_t b : bytes) {
      hash ^= static_cast<std::uint64_t>(b);
      hash *= kFnvPrime;
    }
    return hash;
  }

  /// 16 hex-символов, фиксированная ширина (для имён файлов)
  [[nodiscard]] static std::string to_hex(std::uint64_t hash) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
      out[static_cast<std::size_t>(i)] = kHex[hash & 0x0F];
      hash >>= 4;
    }
    return out;
  }
};

} // namespace clipdeck
