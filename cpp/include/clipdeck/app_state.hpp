/**
 * @file app_state.hpp
 * @brief Общее состояние приложения
 *
 * У каждого ресурса свой мьютекс; блокировка держится только на время
 * чтения/изменения в памяти, никогда во время I/O.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clipdeck/config.hpp"
#include "clipdeck/types.hpp"

namespace clipdeck {

class AppState {
public:
  explicit AppState(Config config = {});

  AppState(const AppState &) = delete;
  AppState &operator=(const AppState &) = delete;

  [[nodiscard]] Config config() const;
  void set_config(Config config);

  /// Короткие чтения без копирования всего Config
  [[nodiscard]] std::uint32_t max_history_size() const;
  [[nodiscard]] bool is_sensitive_source(std::string_view app) const;

  [[nodiscard]] bool paused() const;
  void set_paused(bool paused);

  [[nodiscard]] std::vector<CaptureResult> last_capture() const;
  void set_last_capture(std::vector<CaptureResult> captures);

  [[nodiscard]] std::vector<ClipboardItem> paste_stack() const;
  void set_paste_stack(std::vector<ClipboardItem> items);

  /**
   * @brief Метка собственной записи в буфер обмена
   *
   * Ставится непосредственно перед программной записью. Ключ: сам текст
   * или "image:<hash>" для изображения (см. content_key_for_image).
   */
  void set_self_write_marker(std::string key);

  /// Совпала ли метка с ключом; метка снимается в любом случае
  [[nodiscard]] bool consume_self_write_marker(std::string_view key);

  [[nodiscard]] std::optional<std::string> self_write_marker() const;

private:
  mutable std::mutex config_mutex_;
  Config config_;

  mutable std::mutex paused_mutex_;
  bool paused_ = false;

  mutable std::mutex capture_mutex_;
  std::vector<CaptureResult> last_capture_;

  mutable std::mutex paste_stack_mutex_;
  std::vector<ClipboardItem> paste_stack_;

  mutable std::mutex marker_mutex_;
  std::optional<std::string> self_write_marker_;
};

/// Ключ содержимого для метки собственной записи изображения
[[nodiscard]] std::string content_key_for_image(const RawImage &image);

} // namespace clipdeck
