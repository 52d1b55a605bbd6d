#include "clipdeck/overlay_orchestrator.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using clipdeck::CaptureResult;
using clipdeck::EventBus;
using clipdeck::EventKind;
using clipdeck::OverlayGeometry;
using clipdeck::OverlayOrchestrator;

/// Оконная система в памяти: пишет журнал вызовов
class FakeWindowSystem final : public clipdeck::WindowSystem {
public:
  struct Window {
    OverlayGeometry created_with;
    OverlayGeometry physical;
    bool visible = false;
    bool elevated = false;
    std::vector<CaptureResult> delivered;
  };

  std::map<std::string, Window> windows;
  std::vector<std::string> calls;
  std::set<std::string> refuse_create;

  bool exists(const std::string &label) override {
    return windows.count(label) > 0;
  }

  bool create(const std::string &label,
              const OverlayGeometry &geometry) override {
    calls.push_back("create " + label);
    if (refuse_create.count(label) > 0) {
      return false;
    }
    if (!exists(label)) {
      windows[label].created_with = geometry;
    }
    return true;
  }

  bool set_physical_geometry(const std::string &label,
                             const OverlayGeometry &geometry) override {
    calls.push_back("place " + label);
    windows[label].physical = geometry;
    return true;
  }

  bool show(const std::string &label) override {
    calls.push_back("show " + label);
    windows[label].visible = true;
    return true;
  }

  bool focus(const std::string &label) override {
    calls.push_back("focus " + label);
    return true;
  }

  bool apply_window_level(const std::string &label,
                          clipdeck::WindowLevelCapability &capability) override {
    calls.push_back("level " + label);
    // Уровень применяется к уже показанному окну
    CHECK(windows[label].visible);
    windows[label].elevated = capability.elevate(clipdeck::NativeWindow{});
    return windows[label].elevated;
  }

  void deliver(const std::string &label,
               const std::vector<CaptureResult> &results) override {
    windows[label].delivered = results;
  }

  bool close(const std::string &label) override {
    calls.push_back("close " + label);
    return windows.erase(label) > 0;
  }

  std::vector<std::string> labels() override {
    std::vector<std::string> out;
    for (const auto &[label, window] : windows) {
      out.push_back(label);
    }
    return out;
  }
};

class CountingLevel final : public clipdeck::WindowLevelCapability {
public:
  int elevated = 0;

  bool elevate(const clipdeck::NativeWindow &) override {
    ++elevated;
    return true;
  }

  [[nodiscard]] const char *name() const noexcept override {
    return "counting";
  }
};

CaptureResult result(std::uint32_t id, std::int32_t x, std::uint32_t w,
                     std::uint32_t h, double scale) {
  CaptureResult r;
  r.id = id;
  r.path = "/tmp/screenshot_" + std::to_string(id) + ".png";
  r.x = x;
  r.y = 0;
  r.width = w;
  r.height = h;
  r.scale_factor = scale;
  return r;
}

void test_geometry_hidpi() {
  const OverlayGeometry g =
      clipdeck::overlay_geometry(result(1, 100, 1920, 1080, 2.0));
  CHECK(g.logical_width == 960);
  CHECK(g.logical_height == 540);
  CHECK(g.x == 100);
  CHECK(g.y == 0);
  CHECK(g.physical_width == 1920);
  CHECK(g.physical_height == 1080);
  CHECK(g.physical_x == 200);
}

void test_geometry_unscaled_and_fractional() {
  OverlayGeometry g = clipdeck::overlay_geometry(result(1, 0, 1920, 1080, 1.0));
  CHECK(g.logical_width == 1920);
  CHECK(g.logical_height == 1080);

  g = clipdeck::overlay_geometry(result(1, 0, 2880, 1800, 1.5));
  CHECK(g.logical_width == 1920);
  CHECK(g.logical_height == 1200);

  // Масштаб меньше единицы не уменьшает окно
  g = clipdeck::overlay_geometry(result(1, 0, 800, 600, 0.0));
  CHECK(g.logical_width == 800);
  CHECK(g.logical_height == 600);
}

void test_labels() {
  CHECK(clipdeck::overlay_label(42) == "screenshot_42");
  CHECK(clipdeck::parse_overlay_label("screenshot_42") == 42u);
  CHECK(!clipdeck::parse_overlay_label("main").has_value());
  CHECK(!clipdeck::parse_overlay_label("screenshot_").has_value());
  CHECK(!clipdeck::parse_overlay_label("screenshot_4x").has_value());
}

void test_show_creates_and_broadcasts() {
  FakeWindowSystem windows;
  CountingLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  std::vector<clipdeck::Event> events;
  (void)bus.subscribe(
      [&events](const clipdeck::Event &e) { events.push_back(e); });

  const std::vector<CaptureResult> results = {
      result(1, 0, 1920, 1080, 2.0), result(2, 960, 1280, 1024, 1.0)};

  auto outcome = overlays.show_overlays(results);
  CHECK(outcome.ok());
  CHECK(outcome.created == 2);
  CHECK(outcome.reused == 0);
  CHECK(level.elevated == 2);

  const auto &first = windows.windows.at("screenshot_1");
  CHECK(first.created_with.logical_width == 960);
  CHECK(first.created_with.logical_height == 540);
  CHECK(first.physical.physical_width == 1920);
  CHECK(first.visible);
  CHECK(first.elevated);

  // Каждое окно получает полный список
  for (const auto &[label, window] : windows.windows) {
    CHECK(window.delivered.size() == 2);
  }

  CHECK(events.size() == 1);
  CHECK(events[0].kind == EventKind::CaptureCompleted);
  CHECK(events[0].captures.size() == 2);

  // Порядок: create, place, show, level, focus
  std::vector<std::string> expected = {
      "create screenshot_1", "place screenshot_1", "show screenshot_1",
      "level screenshot_1",  "focus screenshot_1"};
  CHECK(std::vector<std::string>(windows.calls.begin(),
                                 windows.calls.begin() + 5) == expected);
}

void test_second_show_reuses_windows() {
  FakeWindowSystem windows;
  CountingLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  const std::vector<CaptureResult> results = {result(1, 0, 800, 600, 1.0)};
  CHECK(overlays.show_overlays(results).created == 1);

  windows.calls.clear();
  auto again = overlays.show_overlays(results);
  CHECK(again.ok());
  CHECK(again.created == 0);
  CHECK(again.reused == 1);
  CHECK(windows.windows.size() == 1);
  for (const auto &call : windows.calls) {
    CHECK(!call.starts_with("create"));
  }
}

void test_partial_window_failure() {
  FakeWindowSystem windows;
  windows.refuse_create.insert("screenshot_2");
  CountingLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  auto outcome = overlays.show_overlays(
      {result(1, 0, 800, 600, 1.0), result(2, 800, 800, 600, 1.0)});
  CHECK(outcome.ok());
  CHECK(outcome.created == 1);
  CHECK(outcome.failed.size() == 1);
  CHECK(outcome.failed[0] == 2);
}

void test_nothing_to_show_is_error() {
  FakeWindowSystem windows;
  CountingLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  int events = 0;
  (void)bus.subscribe([&events](const clipdeck::Event &) { ++events; });

  CHECK(!overlays.show_overlays({}).ok());

  windows.refuse_create.insert("screenshot_1");
  CHECK(!overlays.show_overlays({result(1, 0, 800, 600, 1.0)}).ok());
  CHECK(events == 0);
}

void test_close_all_leaves_other_windows() {
  FakeWindowSystem windows;
  CountingLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  windows.windows["main"] = {};
  (void)overlays.show_overlays(
      {result(1, 0, 800, 600, 1.0), result(2, 800, 800, 600, 1.0)});
  CHECK(windows.windows.size() == 3);

  CHECK(overlays.close_all() == 2);
  CHECK(windows.windows.size() == 1);
  CHECK(windows.windows.count("main") == 1);
  CHECK(windows.windows.at("main").delivered.empty());

  CHECK(overlays.close_all() == 0);
}

void test_close_single() {
  FakeWindowSystem windows;
  CountingLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  (void)overlays.show_overlays(
      {result(1, 0, 800, 600, 1.0), result(2, 800, 800, 600, 1.0)});
  CHECK(overlays.close(2));
  CHECK(!overlays.close(2));
  CHECK(windows.windows.count("screenshot_1") == 1);
}

void test_noop_level_is_total() {
  FakeWindowSystem windows;
  clipdeck::NoopWindowLevel level;
  EventBus bus;
  OverlayOrchestrator overlays{windows, level, bus};

  auto outcome = overlays.show_overlays({result(1, 0, 800, 600, 1.0)});
  CHECK(outcome.ok());
  CHECK(windows.windows.at("screenshot_1").elevated);
}

} // namespace

#undef CHECK

int main() {
  test_geometry_hidpi();
  test_geometry_unscaled_and_fractional();
  test_labels();
  test_show_creates_and_broadcasts();
  test_second_show_reuses_windows();
  test_partial_window_failure();
  test_nothing_to_show_is_error();
  test_close_all_leaves_other_windows();
  test_close_single();
  test_noop_level_is_total();

  std::cout << "OK\n";
  return 0;
}
