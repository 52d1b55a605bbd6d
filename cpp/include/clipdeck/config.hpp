/**
 * @file config.hpp
 * @brief Конфигурация clipdeck
 *
 * Плоский YAML-подобный файл с дефолтами для всех значений.
 * Пути к данным приложения строятся по XDG Base Directory.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "clipdeck/types.hpp"

namespace clipdeck {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Границы допустимого размера истории
inline constexpr std::uint32_t kMinHistorySize = 1;
inline constexpr std::uint32_t kMaxHistorySize = 100000;

/// Полная конфигурация приложения
struct Config {
  std::string shortcut = "Ctrl+Shift+V";
  std::uint32_t max_history_size = 20;
  std::string language = "en";
  std::string theme = "system";

  /// WM_CLASS приложений, скопированное из которых помечается чувствительным
  std::vector<std::string> sensitive_apps;

  bool compact_mode = false;

  /// При очистке истории удалять и закреплённые элементы
  bool clear_pinned_on_clear = false;
  /// При очистке истории удалять и элементы коллекций
  bool clear_collected_on_clear = false;

  std::filesystem::path config_path;

  bool operator==(const Config &) const = default;
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение.
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию (best-effort)
 *
 * Пустой путь означает default_config_path(). При отсутствии файла или
 * ошибке валидации возвращает дефолты (config_path всё равно заполнен,
 * чтобы последующее сохранение попало в нужное место).
 */
[[nodiscard]] Config load_config(const std::filesystem::path &path = {});

/**
 * @brief Разбирает текст конфигурации
 *
 * Неизвестные ключи игнорируются. Значение, которое не удалось
 * разобрать, даёт ParseError.
 */
[[nodiscard]] ConfigLoadOutcome parse_config_text(std::string_view text);

/// Сериализация в формат, который понимает parse_config_text()
[[nodiscard]] std::string serialize_config(const Config &config);

/**
 * @brief Сохраняет конфигурацию атомарно (temp файл + rename)
 *
 * Создаёт родительский каталог при необходимости.
 * @return Ok или IoError
 */
[[nodiscard]] ConfigResult save_config(const Config &config,
                                       const std::filesystem::path &path);

/**
 * @brief Валидирует конфигурацию
 *
 * @return true если max_history_size в [1, 100000] и shortcut разбирается
 */
[[nodiscard]] bool validate_config(const Config &config);

/// Принадлежит ли приложение списку sensitive_apps (без учёта регистра)
[[nodiscard]] bool is_sensitive_app(const Config &config,
                                    std::string_view app);

// ===========================================================================
// Пути XDG
// ===========================================================================

/// $XDG_CONFIG_HOME/clipdeck/config.yaml (или ~/.config/...)
[[nodiscard]] std::filesystem::path default_config_path();

/// $XDG_DATA_HOME/clipdeck (или ~/.local/share/clipdeck)
[[nodiscard]] std::filesystem::path default_data_dir();

/// $XDG_CACHE_HOME/clipdeck/screenshots (или ~/.cache/...)
[[nodiscard]] std::filesystem::path default_screenshot_dir();

/// $XDG_RUNTIME_DIR/clipdeck.sock, иначе /tmp/clipdeck-<uid>.sock
[[nodiscard]] std::string default_socket_path();

} // namespace clipdeck
