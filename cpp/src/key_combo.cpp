/**
 * @file key_combo.cpp
 * @brief Реализация парсера сочетаний клавиш
 */

#include "clipdeck/key_combo.hpp"

#include <array>
#include <cctype>
#include <charconv>

namespace clipdeck {

namespace {

struct KeyNameMapping {
  std::string_view alias; // lowercase
  std::string_view keysym;
};

/// Имена клавиш -> имена X11 keysym
inline constexpr std::array kKeyNames = std::to_array<KeyNameMapping>({
    {"space", "space"},       {"tab", "Tab"},
    {"enter", "Return"},      {"return", "Return"},
    {"esc", "Escape"},        {"escape", "Escape"},
    {"backspace", "BackSpace"}, {"delete", "Delete"},
    {"insert", "Insert"},     {"home", "Home"},
    {"end", "End"},           {"pageup", "Prior"},
    {"pagedown", "Next"},     {"up", "Up"},
    {"down", "Down"},         {"left", "Left"},
    {"right", "Right"},       {"grave", "grave"},
    {"`", "grave"},           {"print", "Print"},
    {"printscreen", "Print"}, {"pause", "Pause"},
});

struct ModifierMapping {
  std::string_view alias; // lowercase
  std::uint8_t bit;
};

inline constexpr std::array kModifierNames = std::to_array<ModifierMapping>({
    {"ctrl", kModCtrl},
    {"control", kModCtrl},
    {"commandorcontrol", kModCtrl},
    {"cmdorctrl", kModCtrl},
    {"shift", kModShift},
    {"alt", kModAlt},
    {"option", kModAlt},
    {"super", kModSuper},
    {"meta", kModSuper},
    {"win", kModSuper},
    {"cmd", kModSuper},
    {"command", kModSuper},
});

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

std::string to_lower(std::string_view sv) {
  std::string out{sv};
  for (char &c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/// F1..F24
std::optional<std::string> parse_function_key(std::string_view lower) {
  if (lower.size() < 2 || lower.front() != 'f') {
    return std::nullopt;
  }
  std::string_view digits = lower.substr(1);
  int n = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), n);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || n < 1 ||
      n > 24) {
    return std::nullopt;
  }
  return "F" + std::to_string(n);
}

std::optional<std::string> canonical_key(std::string_view token) {
  if (token.size() == 1) {
    const unsigned char c = static_cast<unsigned char>(token.front());
    if (std::isalpha(c)) {
      return std::string(1, static_cast<char>(std::toupper(c)));
    }
    if (std::isdigit(c)) {
      return std::string(1, static_cast<char>(c));
    }
  }

  const std::string lower = to_lower(token);
  for (const auto &mapping : kKeyNames) {
    if (mapping.alias == lower) {
      return std::string{mapping.keysym};
    }
  }
  return parse_function_key(lower);
}

} // namespace

std::optional<KeyCombo> parse_key_combo(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  KeyCombo combo;
  bool have_key = false;

  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('+', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view token = trim(text.substr(start, end - start));
    start = end + 1;

    if (token.empty()) {
      return std::nullopt;
    }
    // Клавиша должна быть последней
    if (have_key) {
      return std::nullopt;
    }

    const std::string lower = to_lower(token);
    bool is_modifier = false;
    for (const auto &mapping : kModifierNames) {
      if (mapping.alias == lower) {
        combo.modifiers |= mapping.bit;
        is_modifier = true;
        break;
      }
    }
    if (is_modifier) {
      continue;
    }

    auto key = canonical_key(token);
    if (!key) {
      return std::nullopt;
    }
    combo.key = std::move(*key);
    have_key = true;
  }

  if (!have_key) {
    return std::nullopt;
  }
  return combo;
}

std::string format_key_combo(const KeyCombo &combo) {
  std::string out;
  auto append = [&out](std::string_view part) {
    if (!out.empty()) {
      out += '+';
    }
    out += part;
  };

  if (combo.modifiers & kModCtrl) {
    append("Ctrl");
  }
  if (combo.modifiers & kModShift) {
    append("Shift");
  }
  if (combo.modifiers & kModAlt) {
    append("Alt");
  }
  if (combo.modifiers & kModSuper) {
    append("Super");
  }
  append(combo.key);
  return out;
}

} // namespace clipdeck
