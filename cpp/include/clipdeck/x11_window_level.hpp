/**
 * @file x11_window_level.hpp
 * @brief Уровень overlay-окна для X11 (EWMH _NET_WM_STATE)
 */

#pragma once

#include "clipdeck/window_system.hpp"

namespace clipdeck {

/**
 * @brief Поднимает окно через EWMH
 *
 * _NET_WM_STATE_ABOVE и _NET_WM_STATE_STICKY (на всех рабочих столах),
 * _NET_WM_STATE_FULLSCREEN (поверх панелей), _NET_WM_DESKTOP = все.
 * Окно должно быть отображено: оконный менеджер обрабатывает
 * клиентские сообщения только для отображённых окон.
 */
class X11WindowLevel final : public WindowLevelCapability {
public:
  bool elevate(const NativeWindow &window) override;

  [[nodiscard]] const char *name() const noexcept override { return "x11"; }
};

} // namespace clipdeck
