/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "clipdeck/config.hpp"
#include "clipdeck/key_combo.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace clipdeck {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Снимает одинарные или двойные кавычки
std::string_view unquote(std::string_view sv) {
  sv = trim(sv);
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    sv = sv.substr(1, sv.size() - 2);
  }
  return sv;
}

/// Парсит беззнаковое целое из строки
std::optional<std::uint32_t> parse_uint(std::string_view sv) {
  sv = trim(sv);
  std::uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

/// Значение переменной окружения или пустая строка
std::string env_or_empty(const char *name) {
  const char *v = std::getenv(name);
  return (v && *v) ? std::string{v} : std::string{};
}

/// Каталог XDG: $var, иначе $HOME/<fallback>
std::filesystem::path xdg_dir(const char *var, std::string_view fallback) {
  std::string dir = env_or_empty(var);
  if (!dir.empty()) {
    return dir;
  }
  std::string home = env_or_empty("HOME");
  if (home.empty()) {
    home = "/tmp";
  }
  return std::filesystem::path{home} / fallback;
}

std::string quote_if_needed(std::string_view value) {
  if (value.empty() || value.find_first_of(":#'\"") != std::string_view::npos ||
      std::isspace(static_cast<unsigned char>(value.front())) ||
      std::isspace(static_cast<unsigned char>(value.back()))) {
    std::string out = "\"";
    out += value;
    out += '"';
    return out;
  }
  return std::string{value};
}

} // namespace

ConfigLoadOutcome parse_config_text(std::string_view text) {
  ConfigLoadOutcome out;
  Config &config = out.config;

  auto fail = [&out](std::size_t line_no, std::string_view what) {
    out.result = ConfigResult::ParseError;
    out.error = "line " + std::to_string(line_no) + ": " + std::string{what};
  };

  bool in_sensitive_list = false;
  std::size_t line_no = 0;
  std::size_t start = 0;

  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view sv = trim(text.substr(start, end - start));
    start = end + 1;
    ++line_no;

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Элемент списка sensitive_apps
    if (sv.front() == '-') {
      if (!in_sensitive_list) {
        fail(line_no, "list item outside of a list");
        return out;
      }
      std::string_view app = unquote(sv.substr(1));
      if (!app.empty()) {
        config.sensitive_apps.emplace_back(app);
      }
      continue;
    }
    in_sensitive_list = false;

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      fail(line_no, "expected 'key: value'");
      return out;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view raw = trim(sv.substr(colon_pos + 1));
    std::string_view value = unquote(raw);

    if (key == "sensitive_apps") {
      config.sensitive_apps.clear();
      if (raw.empty()) {
        in_sensitive_list = true;
      } else if (raw != "[]") {
        fail(line_no, "sensitive_apps must be a list");
        return out;
      }
    } else if (key == "shortcut") {
      config.shortcut = std::string{value};
    } else if (key == "max_history_size") {
      auto val = parse_uint(value);
      if (!val) {
        fail(line_no, "max_history_size is not a number");
        return out;
      }
      config.max_history_size = *val;
    } else if (key == "language") {
      config.language = std::string{value};
    } else if (key == "theme") {
      config.theme = std::string{value};
    } else if (key == "compact_mode" || key == "clear_pinned_on_clear" ||
               key == "clear_collected_on_clear") {
      auto val = parse_bool(value);
      if (!val) {
        fail(line_no, std::string{key} + " is not a boolean");
        return out;
      }
      if (key == "compact_mode") {
        config.compact_mode = *val;
      } else if (key == "clear_pinned_on_clear") {
        config.clear_pinned_on_clear = *val;
      } else {
        config.clear_collected_on_clear = *val;
      }
    }
  }

  return out;
}

std::string serialize_config(const Config &config) {
  std::ostringstream file;
  file << "# clipdeck configuration\n\n";
  file << "shortcut: " << quote_if_needed(config.shortcut) << "\n";
  file << "max_history_size: " << config.max_history_size << "\n";
  file << "language: " << quote_if_needed(config.language) << "\n";
  file << "theme: " << quote_if_needed(config.theme) << "\n";
  file << "compact_mode: " << (config.compact_mode ? "true" : "false") << "\n";
  file << "clear_pinned_on_clear: "
       << (config.clear_pinned_on_clear ? "true" : "false") << "\n";
  file << "clear_collected_on_clear: "
       << (config.clear_collected_on_clear ? "true" : "false") << "\n";

  if (config.sensitive_apps.empty()) {
    file << "sensitive_apps: []\n";
  } else {
    file << "sensitive_apps:\n";
    for (const auto &app : config.sensitive_apps) {
      file << "  - " << quote_if_needed(app) << "\n";
    }
  }
  return file.str();
}

bool validate_config(const Config &config) {
  if (config.max_history_size < kMinHistorySize ||
      config.max_history_size > kMaxHistorySize) {
    return false;
  }

  // Горячая клавиша должна разбираться
  if (config.shortcut.empty() || !parse_key_combo(config.shortcut)) {
    return false;
  }

  return true;
}

bool is_sensitive_app(const Config &config, std::string_view app) {
  if (app.empty()) {
    return false;
  }
  return std::any_of(config.sensitive_apps.begin(), config.sensitive_apps.end(),
                     [app](const std::string &s) { return iequals(s, app); });
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  std::ostringstream buf;
  buf << file.rdbuf();

  ConfigLoadOutcome parsed = parse_config_text(buf.str());
  if (parsed.result != ConfigResult::Ok) {
    out.result = parsed.result;
    out.error = "Parse error in " + out.used_path.string() + ", " + parsed.error;
    return out;
  }

  out.config = std::move(parsed.config);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    out.config.config_path = out.used_path;
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(const std::filesystem::path &path) {
  std::filesystem::path effective_path =
      path.empty() ? default_config_path() : path;

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден или битый: используем дефолты
    if (out.result != ConfigResult::FileNotFound) {
      std::cerr << "[clipdeck] Warning: " << out.error << "\n";
    }
    Config defaults;
    defaults.config_path = effective_path;
    return defaults;
  }

  std::cerr << "[clipdeck] Using config: " << effective_path.string() << "\n";
  return out.config;
}

ConfigResult save_config(const Config &config,
                         const std::filesystem::path &path) {
  if (path.empty()) {
    return ConfigResult::IoError;
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "[clipdeck] Cannot create " << path.parent_path().string()
                << ": " << ec.message() << "\n";
      return ConfigResult::IoError;
    }
  }

  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream file{tmp_path, std::ios::trunc};
    if (!file.is_open()) {
      std::cerr << "[clipdeck] Cannot write " << tmp_path.string() << "\n";
      return ConfigResult::IoError;
    }

    file << serialize_config(config);

    file.flush();
    if (!file.good()) {
      std::cerr << "[clipdeck] Write failed: " << tmp_path.string() << "\n";
      return ConfigResult::IoError;
    }
  }

  // Атомарно заменяем файл (rename в пределах одной ФС атомарен).
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::cerr << "[clipdeck] Cannot replace " << path.string() << ": "
              << ec.message() << "\n";
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return ConfigResult::IoError;
  }

  return ConfigResult::Ok;
}

// ===========================================================================
// Пути XDG
// ===========================================================================

std::filesystem::path default_config_path() {
  return xdg_dir("XDG_CONFIG_HOME", ".config") / kConfigRelPath;
}

std::filesystem::path default_data_dir() {
  return xdg_dir("XDG_DATA_HOME", ".local/share") / kDataDirName;
}

std::filesystem::path default_screenshot_dir() {
  return xdg_dir("XDG_CACHE_HOME", ".cache") / kDataDirName / "screenshots";
}

std::string default_socket_path() {
  std::string runtime = env_or_empty("XDG_RUNTIME_DIR");
  if (!runtime.empty()) {
    return runtime + "/clipdeck.sock";
  }
  return "/tmp/clipdeck-" + std::to_string(::getuid()) + ".sock";
}

} // namespace clipdeck
