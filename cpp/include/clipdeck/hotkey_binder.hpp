/**
 * @file hotkey_binder.hpp
 * @brief Глобальная горячая клавиша через XGrabKey
 *
 * Собственное соединение с X сервером и поток std::jthread, который
 * ждёт KeyPress на корневом окне и публикует shortcut-triggered.
 */

#pragma once

#include <X11/Xlib.h>

#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "clipdeck/event_bus.hpp"
#include "clipdeck/key_combo.hpp"

namespace clipdeck {

class HotkeyBinder {
public:
  explicit HotkeyBinder(EventBus &bus);
  ~HotkeyBinder();

  HotkeyBinder(const HotkeyBinder &) = delete;
  HotkeyBinder &operator=(const HotkeyBinder &) = delete;

  /**
   * @brief Открывает соединение, захватывает сочетание и запускает поток
   * @return false если нет X сервера; ошибка захвата только логируется
   */
  bool start(const std::string &shortcut);

  void stop();

  /**
   * @brief Снимает старый захват и ставит новый
   * @return true если новое сочетание разобрано и захвачено
   */
  bool rebind(const std::string &shortcut);

  [[nodiscard]] bool is_running() const noexcept;

  /// Текущее захваченное сочетание ("" если нет)
  [[nodiscard]] std::string shortcut() const;

private:
  void run(std::stop_token st);

  /// Под mutex_
  bool grab_locked(const KeyCombo &combo);
  void ungrab_locked();

  EventBus &bus_;

  mutable std::mutex mutex_;
  Display *display_ = nullptr;
  Window root_ = None;
  KeyCode keycode_ = 0;
  unsigned int modifiers_ = 0;
  std::optional<KeyCombo> combo_;

  std::jthread thread_;
};

} // namespace clipdeck
