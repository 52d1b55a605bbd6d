/**
 * @file key_combo.hpp
 * @brief Разбор строки глобального сочетания клавиш ("Ctrl+Shift+V")
 *
 * Чистый парсер без зависимостей от X11: возвращает маску модификаторов
 * и имя клавиши. Преобразование в keysym делает HotkeyBinder.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clipdeck {

/// Биты модификаторов (не совпадают с X11 масками)
enum ModifierBits : std::uint8_t {
  kModNone = 0,
  kModCtrl = 1U << 0U,
  kModShift = 1U << 1U,
  kModAlt = 1U << 2U,
  kModSuper = 1U << 3U,
};

struct KeyCombo {
  std::uint8_t modifiers = kModNone;
  std::string key; // каноничное имя: "V", "F5", "space", "Return", ...

  bool operator==(const KeyCombo &) const = default;
};

/**
 * @brief Разбирает строку сочетания
 *
 * Разделитель '+', регистр модификаторов не важен. Поддерживаются
 * Ctrl/Control, Shift, Alt/Option, Super/Meta/Win/Cmd/Command и
 * CommandOrControl/CmdOrCtrl (на Linux это Ctrl). Последний токен
 * задаёт клавишу; одиночная буква приводится к верхнему регистру.
 *
 * @return KeyCombo или nullopt, если клавиши нет или токен неизвестен
 */
[[nodiscard]] std::optional<KeyCombo> parse_key_combo(std::string_view text);

/// Обратное преобразование: "Ctrl+Shift+V"
[[nodiscard]] std::string format_key_combo(const KeyCombo &combo);

} // namespace clipdeck
