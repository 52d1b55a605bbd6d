/**
 * @file overlay_orchestrator.cpp
 * @brief Реализация управления overlay-окнами
 */

#include "clipdeck/overlay_orchestrator.hpp"

#include <charconv>
#include <cmath>
#include <iostream>

namespace clipdeck {

namespace {

std::uint32_t to_logical(std::uint32_t physical, double scale) {
  return static_cast<std::uint32_t>(
      std::lround(static_cast<double>(physical) / scale));
}

} // namespace

OverlayGeometry overlay_geometry(const CaptureResult &result) {
  const double scale = result.scale_factor < 1.0 ? 1.0 : result.scale_factor;

  OverlayGeometry g;
  g.x = result.x;
  g.y = result.y;
  g.logical_width = to_logical(result.width, scale);
  g.logical_height = to_logical(result.height, scale);

  g.physical_x = static_cast<std::int32_t>(std::lround(result.x * scale));
  g.physical_y = static_cast<std::int32_t>(std::lround(result.y * scale));
  g.physical_width = result.width;
  g.physical_height = result.height;
  return g;
}

std::string overlay_label(std::uint32_t display_id) {
  return std::string(kOverlayLabelPrefix) + std::to_string(display_id);
}

std::optional<std::uint32_t> parse_overlay_label(std::string_view label) {
  if (!label.starts_with(kOverlayLabelPrefix)) {
    return std::nullopt;
  }
  label.remove_prefix(kOverlayLabelPrefix.size());
  if (label.empty()) {
    return std::nullopt;
  }

  std::uint32_t id = 0;
  const auto [ptr, ec] =
      std::from_chars(label.data(), label.data() + label.size(), id);
  if (ec != std::errc{} || ptr != label.data() + label.size()) {
    return std::nullopt;
  }
  return id;
}

OverlayOrchestrator::OverlayOrchestrator(WindowSystem &windows,
                                         WindowLevelCapability &level,
                                         EventBus &bus)
    : windows_{windows}, level_{level}, bus_{bus} {}

OverlayOutcome
OverlayOrchestrator::show_overlays(const std::vector<CaptureResult> &results) {
  OverlayOutcome out;
  if (results.empty()) {
    out.error = "No capture results to show";
    return out;
  }

  for (const auto &result : results) {
    bool created = false;
    if (!present(result, created)) {
      out.failed.push_back(result.id);
      continue;
    }
    if (created) {
      ++out.created;
    } else {
      ++out.reused;
    }
  }

  if (out.created + out.reused == 0) {
    out.error = "No overlay window could be shown";
    std::cerr << "[clipdeck-overlay] " << out.error << "\n";
    return out;
  }

  broadcast(results);
  bus_.emit_captures(results);

  std::cerr << "[clipdeck-overlay] Shown " << (out.created + out.reused)
            << " overlays (" << out.created << " new, level "
            << level_.name() << ")\n";
  return out;
}

bool OverlayOrchestrator::present(const CaptureResult &result, bool &created) {
  const std::string label = overlay_label(result.id);
  const OverlayGeometry geometry = overlay_geometry(result);

  created = !windows_.exists(label);
  if (created && !windows_.create(label, geometry)) {
    std::cerr << "[clipdeck-overlay] Cannot create " << label << "\n";
    return false;
  }

  // Второй проход в физических пикселях: оконная система могла
  // округлить логический размер под свой масштаб
  if (!windows_.set_physical_geometry(label, geometry)) {
    std::cerr << "[clipdeck-overlay] Cannot place " << label << " at "
              << geometry.physical_x << "," << geometry.physical_y << "\n";
  }

  if (!windows_.show(label)) {
    std::cerr << "[clipdeck-overlay] Cannot show " << label << "\n";
    return false;
  }

  if (!windows_.apply_window_level(label, level_)) {
    std::cerr << "[clipdeck-overlay] Window level not applied to " << label
              << "\n";
  }

  if (!windows_.focus(label)) {
    std::cerr << "[clipdeck-overlay] Cannot focus " << label << "\n";
  }
  return true;
}

void OverlayOrchestrator::broadcast(const std::vector<CaptureResult> &results) {
  for (const auto &label : windows_.labels()) {
    if (parse_overlay_label(label)) {
      windows_.deliver(label, results);
    }
  }
}

std::size_t OverlayOrchestrator::close_all() {
  std::size_t closed = 0;
  for (const auto &label : windows_.labels()) {
    if (!parse_overlay_label(label)) {
      continue;
    }
    if (windows_.close(label)) {
      ++closed;
    }
  }
  if (closed > 0) {
    std::cerr << "[clipdeck-overlay] Closed " << closed << " overlays\n";
  }
  return closed;
}

bool OverlayOrchestrator::close(std::uint32_t display_id) {
  const std::string label = overlay_label(display_id);
  if (!windows_.exists(label)) {
    return false;
  }
  return windows_.close(label);
}

} // namespace clipdeck
