/**
 * @file overlay_orchestrator.hpp
 * @brief Overlay-окна поверх каждого захваченного дисплея
 *
 * Одно окно на дисплей с меткой "screenshot_<id>"; повторный показ
 * переиспользует существующее окно. После показа всех окон каждому
 * из них передаётся полный список результатов, а в шину уходит
 * capture-completed.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clipdeck/event_bus.hpp"
#include "clipdeck/types.hpp"
#include "clipdeck/window_system.hpp"

namespace clipdeck {

/// Итог show_overlays
struct OverlayOutcome {
  std::size_t created = 0;
  std::size_t reused = 0;
  std::vector<std::uint32_t> failed; // id дисплеев без окна
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/// Логическая и физическая геометрия окна для результата захвата
[[nodiscard]] OverlayGeometry overlay_geometry(const CaptureResult &result);

/// "screenshot_<id>"
[[nodiscard]] std::string overlay_label(std::uint32_t display_id);

/// id дисплея из метки; nullopt для окон не из этой подсистемы
[[nodiscard]] std::optional<std::uint32_t>
parse_overlay_label(std::string_view label);

class OverlayOrchestrator {
public:
  OverlayOrchestrator(WindowSystem &windows, WindowLevelCapability &level,
                      EventBus &bus);

  OverlayOrchestrator(const OverlayOrchestrator &) = delete;
  OverlayOrchestrator &operator=(const OverlayOrchestrator &) = delete;

  /**
   * @brief Показывает окна для результатов захвата
   *
   * Порядок для каждого дисплея: создать (или найти) скрытое окно
   * логического размера, move/resize в физических пикселях, показать,
   * поднять уровень, отдать фокус. Ошибка только если не показано
   * ни одного окна.
   */
  [[nodiscard]] OverlayOutcome
  show_overlays(const std::vector<CaptureResult> &results);

  /// Закрывает все overlay-окна; прочие окна не трогает
  std::size_t close_all();

  /// Закрывает окно одного дисплея; false если его не было
  bool close(std::uint32_t display_id);

private:
  /// Готовит и показывает окно одного дисплея
  bool present(const CaptureResult &result, bool &created);

  /// Рассылает полный список каждому overlay-окну
  void broadcast(const std::vector<CaptureResult> &results);

  WindowSystem &windows_;
  WindowLevelCapability &level_;
  EventBus &bus_;
};

} // namespace clipdeck
