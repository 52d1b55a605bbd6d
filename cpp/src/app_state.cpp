/**
 * @file app_state.cpp
 * @brief Реализация общего состояния приложения
 */

#include "clipdeck/app_state.hpp"
#include "clipdeck/hasher.hpp"
#include "clipdeck/image_codec.hpp"

namespace clipdeck {

AppState::AppState(Config config) : config_{std::move(config)} {}

Config AppState::config() const {
  std::lock_guard lock{config_mutex_};
  return config_;
}

void AppState::set_config(Config config) {
  std::lock_guard lock{config_mutex_};
  config_ = std::move(config);
}

std::uint32_t AppState::max_history_size() const {
  std::lock_guard lock{config_mutex_};
  return config_.max_history_size;
}

bool AppState::is_sensitive_source(std::string_view app) const {
  std::lock_guard lock{config_mutex_};
  return is_sensitive_app(config_, app);
}

bool AppState::paused() const {
  std::lock_guard lock{paused_mutex_};
  return paused_;
}

void AppState::set_paused(bool paused) {
  std::lock_guard lock{paused_mutex_};
  paused_ = paused;
}

std::vector<CaptureResult> AppState::last_capture() const {
  std::lock_guard lock{capture_mutex_};
  return last_capture_;
}

void AppState::set_last_capture(std::vector<CaptureResult> captures) {
  std::lock_guard lock{capture_mutex_};
  last_capture_ = std::move(captures);
}

std::vector<ClipboardItem> AppState::paste_stack() const {
  std::lock_guard lock{paste_stack_mutex_};
  return paste_stack_;
}

void AppState::set_paste_stack(std::vector<ClipboardItem> items) {
  std::lock_guard lock{paste_stack_mutex_};
  paste_stack_ = std::move(items);
}

void AppState::set_self_write_marker(std::string key) {
  std::lock_guard lock{marker_mutex_};
  self_write_marker_ = std::move(key);
}

bool AppState::consume_self_write_marker(std::string_view key) {
  std::lock_guard lock{marker_mutex_};
  // Любое наблюдённое изменение снимает метку, иначе она переживёт
  // запись, совпавшую с текущим содержимым буфера
  const bool matched = self_write_marker_ && *self_write_marker_ == key;
  self_write_marker_.reset();
  return matched;
}

std::optional<std::string> AppState::self_write_marker() const {
  std::lock_guard lock{marker_mutex_};
  return self_write_marker_;
}

std::string content_key_for_image(const RawImage &image) {
  return "image:" + Hasher::to_hex(pixel_hash(image));
}

} // namespace clipdeck
