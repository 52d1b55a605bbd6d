/**
 * @file window_system.hpp
 * @brief Абстракции оконной системы для overlay-окон захвата
 *
 * WindowSystem создаёт и показывает окна по строковой метке,
 * WindowLevelCapability поднимает окно над панелями и рабочими столами.
 * Реализация уровня выбирается при сборке (CLIPDECK_WITH_X11_WINDOW_LEVEL);
 * на остальных платформах используется пустая реализация.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clipdeck/types.hpp"

namespace clipdeck {

/**
 * @brief Геометрия overlay-окна
 *
 * Логический размер = физический / scale_factor, логическое начало
 * берётся из CaptureResult без изменений. Физическое начало нужно для
 * второго прохода (move/resize в физических пикселях).
 */
struct OverlayGeometry {
  std::int32_t x = 0;
  std::int32_t y = 0;
  std::uint32_t logical_width = 0;
  std::uint32_t logical_height = 0;

  std::int32_t physical_x = 0;
  std::int32_t physical_y = 0;
  std::uint32_t physical_width = 0;
  std::uint32_t physical_height = 0;

  bool operator==(const OverlayGeometry &) const = default;
};

/// Нативный дескриптор окна X11 (Display* и XID)
struct NativeWindow {
  void *display = nullptr;
  unsigned long window = 0;
};

/**
 * @brief Повышение уровня окна средствами платформы
 *
 * Пустая реализация остаётся полноценной: вызывающий код не делает
 * для неё особых случаев.
 */
class WindowLevelCapability {
public:
  virtual ~WindowLevelCapability() = default;

  /// @return true если уровень применён (или применять нечего)
  virtual bool elevate(const NativeWindow &window) = 0;

  [[nodiscard]] virtual const char *name() const noexcept = 0;
};

class NoopWindowLevel final : public WindowLevelCapability {
public:
  bool elevate(const NativeWindow &) override { return true; }

  [[nodiscard]] const char *name() const noexcept override { return "noop"; }
};

/// Реализация, выбранная при сборке
[[nodiscard]] std::unique_ptr<WindowLevelCapability>
make_window_level_capability();

/**
 * @brief Оконная система для overlay-окон
 *
 * Методы можно вызывать из любого потока: реализация сама переносит
 * вызов в поток, владеющий окнами, и дожидается результата.
 */
class WindowSystem {
public:
  virtual ~WindowSystem() = default;

  [[nodiscard]] virtual bool exists(const std::string &label) = 0;

  /**
   * @brief Создаёт скрытое окно без рамки
   *
   * Окно всегда поверх остальных, не попадает в панель задач и pager,
   * размер и позиция логические. Для существующей метки ничего не делает.
   */
  virtual bool create(const std::string &label,
                      const OverlayGeometry &geometry) = 0;

  /// Повторный move/resize в физических пикселях
  virtual bool set_physical_geometry(const std::string &label,
                                     const OverlayGeometry &geometry) = 0;

  virtual bool show(const std::string &label) = 0;
  virtual bool focus(const std::string &label) = 0;

  /// Вызывает capability для нативного окна в потоке оконной системы
  virtual bool apply_window_level(const std::string &label,
                                  WindowLevelCapability &capability) = 0;

  /// Передаёт окну полный список результатов захвата
  virtual void deliver(const std::string &label,
                       const std::vector<CaptureResult> &results) = 0;

  virtual bool close(const std::string &label) = 0;

  [[nodiscard]] virtual std::vector<std::string> labels() = 0;
};

} // namespace clipdeck
