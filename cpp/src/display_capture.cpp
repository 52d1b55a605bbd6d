/**
 * @file display_capture.cpp
 * @brief Реализация параллельного захвата дисплеев
 */

#include "clipdeck/display_capture.hpp"
#include "clipdeck/image_codec.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <thread>

namespace clipdeck {

namespace {

std::int64_t epoch_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/// Снимает и сохраняет один дисплей; nullopt при ошибке (уже залогирована)
std::optional<CaptureResult> capture_one(DisplaySource &source,
                                         const DisplayInfo &display,
                                         const std::filesystem::path &dir) {
  const auto start = std::chrono::steady_clock::now();

  FrameOutcome frame = source.capture(display);
  if (!frame.ok()) {
    std::cerr << "[clipdeck-capture] Display " << display.id
              << " capture failed: " << frame.error << "\n";
    return std::nullopt;
  }
  if (frame.image.empty()) {
    std::cerr << "[clipdeck-capture] Display " << display.id
              << " returned an empty frame\n";
    return std::nullopt;
  }

  const std::filesystem::path path =
      dir / screenshot_file_name(display.id, epoch_millis());
  const std::string error = write_png_file(frame.image, path);
  if (!error.empty()) {
    std::cerr << "[clipdeck-capture] Display " << display.id
              << " save failed: " << error << "\n";
    return std::nullopt;
  }

  const double scale = display.scale_factor < 1.0 ? 1.0 : display.scale_factor;

  CaptureResult result;
  result.id = display.id;
  result.path = path.string();
  // Начало дисплея в логических координатах, размер снимка в физических
  result.x = static_cast<std::int32_t>(std::lround(display.x / scale));
  result.y = static_cast<std::int32_t>(std::lround(display.y / scale));
  result.width = frame.image.width;
  result.height = frame.image.height;
  result.scale_factor = scale;

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  std::cerr << "[clipdeck-capture] Display " << display.id << " ("
            << result.width << "x" << result.height << ") took "
            << elapsed.count() << " ms\n";
  return result;
}

} // namespace

std::string screenshot_file_name(std::uint32_t display_id,
                                 std::int64_t epoch_ms) {
  return "screenshot_" + std::to_string(display_id) + "_" +
         std::to_string(epoch_ms) + ".png";
}

DisplayCaptureService::DisplayCaptureService(DisplaySource &source)
    : source_{source} {}

CaptureOutcome
DisplayCaptureService::capture_all(const std::filesystem::path &output_dir) {
  CaptureOutcome out;
  const auto start = std::chrono::steady_clock::now();

  EnumerateOutcome listed = source_.enumerate();
  if (!listed.ok()) {
    out.error = "Cannot enumerate displays: " + listed.error;
    std::cerr << "[clipdeck-capture] " << out.error << "\n";
    return out;
  }
  if (listed.displays.empty()) {
    out.error = "No displays found";
    std::cerr << "[clipdeck-capture] " << out.error << "\n";
    return out;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    out.error = "Cannot create " + output_dir.string() + ": " + ec.message();
    std::cerr << "[clipdeck-capture] " << out.error << "\n";
    return out;
  }

  std::cerr << "[clipdeck-capture] Found " << listed.displays.size()
            << " displays\n";

  // Каждый поток пишет только в свой слот
  std::vector<std::optional<CaptureResult>> slots(listed.displays.size());
  {
    std::vector<std::jthread> workers;
    workers.reserve(listed.displays.size());
    for (std::size_t i = 0; i < listed.displays.size(); ++i) {
      workers.emplace_back([this, &slots, &listed, &output_dir, i] {
        slots[i] = capture_one(source_, listed.displays[i], output_dir);
      });
    }
    // jthread присоединяется в деструкторе
  }

  for (auto &slot : slots) {
    if (slot) {
      out.results.push_back(std::move(*slot));
    }
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  std::cerr << "[clipdeck-capture] Captured " << out.results.size() << "/"
            << listed.displays.size() << " displays in " << elapsed.count()
            << " ms\n";

  if (out.results.empty()) {
    out.error = "No screens captured";
  }
  return out;
}

} // namespace clipdeck
