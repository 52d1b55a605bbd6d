#include "clipdeck/config.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using clipdeck::Config;
using clipdeck::ConfigResult;

std::filesystem::path scratch_dir() {
  auto dir = std::filesystem::temp_directory_path() /
             ("clipdeck-config-" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  return dir;
}

void test_defaults() {
  Config config;
  CHECK(config.shortcut == "Ctrl+Shift+V");
  CHECK(config.max_history_size == 20);
  CHECK(config.language == "en");
  CHECK(config.theme == "system");
  CHECK(config.sensitive_apps.empty());
  CHECK(!config.compact_mode);
  CHECK(!config.clear_pinned_on_clear);
  CHECK(!config.clear_collected_on_clear);
  CHECK(clipdeck::validate_config(config));
}

void test_parse_full_file() {
  constexpr std::string_view kText = R"(# user settings
shortcut: "Super+Alt+H"
max_history_size: 150
language: ru
theme: dark
compact_mode: yes
clear_pinned_on_clear: true
clear_collected_on_clear: off

sensitive_apps:
  - KeePassXC
  - "1Password"
unknown_key: ignored
)";

  auto parsed = clipdeck::parse_config_text(kText);
  CHECK(parsed.result == ConfigResult::Ok);

  const Config &c = parsed.config;
  CHECK(c.shortcut == "Super+Alt+H");
  CHECK(c.max_history_size == 150);
  CHECK(c.language == "ru");
  CHECK(c.theme == "dark");
  CHECK(c.compact_mode);
  CHECK(c.clear_pinned_on_clear);
  CHECK(!c.clear_collected_on_clear);
  CHECK(c.sensitive_apps.size() == 2);
  CHECK(c.sensitive_apps[0] == "KeePassXC");
  CHECK(c.sensitive_apps[1] == "1Password");
}

void test_parse_errors() {
  CHECK(clipdeck::parse_config_text("max_history_size: lots").result ==
        ConfigResult::ParseError);
  CHECK(clipdeck::parse_config_text("compact_mode: maybe").result ==
        ConfigResult::ParseError);
  CHECK(clipdeck::parse_config_text("- orphan item").result ==
        ConfigResult::ParseError);
  CHECK(clipdeck::parse_config_text("no colon here").result ==
        ConfigResult::ParseError);
  CHECK(clipdeck::parse_config_text("sensitive_apps: firefox").result ==
        ConfigResult::ParseError);

  auto parsed = clipdeck::parse_config_text("theme: dark\nbroken line\n");
  CHECK(parsed.error.find("line 2") != std::string::npos);
}

void test_validation() {
  Config config;
  config.max_history_size = 0;
  CHECK(!clipdeck::validate_config(config));

  config.max_history_size = 100000;
  CHECK(clipdeck::validate_config(config));

  config.max_history_size = 100001;
  CHECK(!clipdeck::validate_config(config));

  config = Config{};
  config.shortcut = "";
  CHECK(!clipdeck::validate_config(config));

  config.shortcut = "Ctrl+Shift";
  CHECK(!clipdeck::validate_config(config));

  config.shortcut = "CommandOrControl+Shift+C";
  CHECK(clipdeck::validate_config(config));
}

void test_sensitive_apps_case_insensitive() {
  Config config;
  config.sensitive_apps = {"KeePassXC", "Bitwarden"};
  CHECK(clipdeck::is_sensitive_app(config, "keepassxc"));
  CHECK(clipdeck::is_sensitive_app(config, "BITWARDEN"));
  CHECK(!clipdeck::is_sensitive_app(config, "firefox"));
  CHECK(!clipdeck::is_sensitive_app(config, ""));
}

void test_save_and_load() {
  const auto dir = scratch_dir();
  const auto path = dir / "nested" / "config.yaml";

  Config config;
  config.shortcut = "Ctrl+Alt+V";
  config.max_history_size = 500;
  config.theme = "light";
  config.sensitive_apps = {"KeePassXC", "app: with colon"};
  config.clear_collected_on_clear = true;

  CHECK(clipdeck::save_config(config, path) == ConfigResult::Ok);
  CHECK(std::filesystem::exists(path));
  CHECK(!std::filesystem::exists(path.string() + ".tmp"));

  auto loaded = clipdeck::load_config_checked(path);
  CHECK(loaded.result == ConfigResult::Ok);
  CHECK(loaded.used_path == path);
  CHECK(loaded.config.config_path == path);

  config.config_path = path;
  CHECK(loaded.config == config);

  std::filesystem::remove_all(dir);
}

void test_load_missing_and_invalid() {
  const auto dir = scratch_dir();
  std::filesystem::create_directories(dir);

  auto missing = clipdeck::load_config_checked(dir / "absent.yaml");
  CHECK(missing.result == ConfigResult::FileNotFound);

  // best-effort: дефолты, но путь запомнен
  Config fallback = clipdeck::load_config(dir / "absent.yaml");
  CHECK(fallback.max_history_size == 20);
  CHECK(fallback.config_path == dir / "absent.yaml");

  const auto invalid = dir / "invalid.yaml";
  {
    std::ofstream out{invalid};
    out << "max_history_size: 0\n";
  }
  auto checked = clipdeck::load_config_checked(invalid);
  CHECK(checked.result == ConfigResult::InvalidValue);
  CHECK(checked.config.max_history_size == 20);

  std::filesystem::remove_all(dir);
}

void test_xdg_paths() {
  ::setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
  ::setenv("XDG_DATA_HOME", "/xdg/data", 1);
  ::setenv("XDG_CACHE_HOME", "/xdg/cache", 1);
  ::setenv("XDG_RUNTIME_DIR", "/run/user/1000", 1);

  CHECK(clipdeck::default_config_path() == "/xdg/config/clipdeck/config.yaml");
  CHECK(clipdeck::default_data_dir() == "/xdg/data/clipdeck");
  CHECK(clipdeck::default_screenshot_dir() ==
        "/xdg/cache/clipdeck/screenshots");
  CHECK(clipdeck::default_socket_path() == "/run/user/1000/clipdeck.sock");

  ::unsetenv("XDG_CONFIG_HOME");
  ::unsetenv("XDG_RUNTIME_DIR");
  ::setenv("HOME", "/home/tester", 1);
  CHECK(clipdeck::default_config_path() ==
        "/home/tester/.config/clipdeck/config.yaml");
  CHECK(clipdeck::default_socket_path().starts_with("/tmp/clipdeck-"));
}

} // namespace

#undef CHECK

int main() {
  test_defaults();
  test_parse_full_file();
  test_parse_errors();
  test_validation();
  test_sensitive_apps_case_insensitive();
  test_save_and_load();
  test_load_missing_and_invalid();
  test_xdg_paths();

  std::cout << "OK\n";
  return 0;
}
