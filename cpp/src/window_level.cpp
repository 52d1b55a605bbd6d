/**
 * @file window_level.cpp
 * @brief Выбор реализации уровня окна при сборке
 */

#include "clipdeck/window_system.hpp"

#ifdef CLIPDECK_WITH_X11_WINDOW_LEVEL
#include "clipdeck/x11_window_level.hpp"
#endif

namespace clipdeck {

std::unique_ptr<WindowLevelCapability> make_window_level_capability() {
#ifdef CLIPDECK_WITH_X11_WINDOW_LEVEL
  return std::make_unique<X11WindowLevel>();
#else
  return std::make_unique<NoopWindowLevel>();
#endif
}

} // namespace clipdeck
