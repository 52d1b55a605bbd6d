#include "clipdeck/clipboard_monitor.hpp"
#include "clipdeck/image_codec.hpp"

#include "fake_clipboard.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
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

using clipdeck::AppState;
using clipdeck::ClipboardMonitor;
using clipdeck::Config;
using clipdeck::EventBus;
using clipdeck::EventKind;
using clipdeck::HistoryQuery;
using clipdeck::HistoryStore;
using clipdeck::ItemKind;
using clipdeck::testing::FakeClipboard;
using clipdeck::testing::solid_image;

/// Всё, что нужно монитору, в одном месте
struct Fixture {
  explicit Fixture(Config config = {})
      : store{open_store()}, state{std::move(config)},
        images_dir{std::filesystem::temp_directory_path() /
                   ("clipdeck-monitor-" + std::to_string(::getpid()))},
        monitor{clipboard, *store, state, bus, images_dir} {
    std::filesystem::remove_all(images_dir);
    (void)bus.subscribe([this](const clipdeck::Event &e) {
      if (e.kind == EventKind::ClipboardUpdate) {
        ++updates;
      }
    });
  }

  ~Fixture() { std::filesystem::remove_all(images_dir); }

  static std::unique_ptr<HistoryStore> open_store() {
    auto opened = HistoryStore::open(":memory:");
    CHECK(opened.ok());
    return std::move(opened.value);
  }

  std::vector<clipdeck::ClipboardItem> history() {
    HistoryQuery query;
    query.page_size = 100;
    auto page = store->get(query);
    CHECK(page.ok());
    return page.value;
  }

  FakeClipboard clipboard;
  std::unique_ptr<HistoryStore> store;
  AppState state;
  EventBus bus;
  std::filesystem::path images_dir;
  ClipboardMonitor monitor;
  int updates = 0;
};

void test_records_new_text() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_text("https://example.com");
  auto report = f.monitor.tick();
  CHECK(report.inserted == 1);
  CHECK(f.updates == 1);

  auto items = f.history();
  CHECK(items.size() == 1);
  CHECK(items[0].content == "https://example.com");
  CHECK(items[0].kind == ItemKind::Text);
  CHECK(items[0].data_type == "url");
}

void test_unchanged_content_is_ignored() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_text("same");
  CHECK(f.monitor.tick().inserted == 1);
  CHECK(!f.monitor.tick().changed());
  CHECK(!f.monitor.tick().changed());
  CHECK(f.history().size() == 1);
  CHECK(f.updates == 1);
}

void test_prime_skips_existing_content() {
  Fixture f;
  f.clipboard.user_copy_text("stale from before launch");
  f.monitor.prime();

  CHECK(!f.monitor.tick().changed());
  CHECK(f.history().empty());
}

void test_blank_text_is_skipped() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_text("   \n\t");
  CHECK(f.monitor.tick().inserted == 0);
  CHECK(f.history().empty());
}

void test_recopy_moves_to_front() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_text("first");
  (void)f.monitor.tick();
  f.clipboard.user_copy_text("second");
  (void)f.monitor.tick();
  f.clipboard.user_copy_text("first");
  (void)f.monitor.tick();

  auto items = f.history();
  CHECK(items.size() == 2);
  CHECK(items[0].content == "first");
  CHECK(items[1].content == "second");
}

void test_self_write_marker() {
  Fixture f;
  f.monitor.prime();

  // Программная запись: метка ставится до записи
  f.state.set_self_write_marker("X");
  CHECK(f.clipboard.write_text("X", std::nullopt) ==
        clipdeck::ClipboardResult::Ok);

  auto report = f.monitor.tick();
  CHECK(report.self_writes == 1);
  CHECK(report.inserted == 0);
  CHECK(f.history().empty());
  CHECK(!f.state.self_write_marker().has_value());

  // Метка одноразовая: копирование пользователем записывается
  f.clipboard.user_copy_text("Y");
  (void)f.monitor.tick();
  f.clipboard.user_copy_text("X");
  CHECK(f.monitor.tick().inserted == 1);
}

void test_marker_for_unchanged_content_does_not_linger() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_text("X");
  CHECK(f.monitor.tick().inserted == 1);

  // Повторная запись того же текста: монитор изменения не видит
  f.state.set_self_write_marker("X");
  CHECK(f.clipboard.write_text("X", std::nullopt) ==
        clipdeck::ClipboardResult::Ok);
  CHECK(!f.monitor.tick().changed());

  // Следующее реальное копирование снимает метку
  f.clipboard.user_copy_text("Y");
  auto report = f.monitor.tick();
  CHECK(report.inserted == 1);
  CHECK(report.self_writes == 0);
  CHECK(!f.state.self_write_marker().has_value());

  f.clipboard.user_copy_text("X");
  report = f.monitor.tick();
  CHECK(report.inserted == 1);
  CHECK(report.self_writes == 0);

  auto items = f.history();
  CHECK(items.size() == 2);
  CHECK(items[0].content == "X");
}

void test_pause_skips_but_tracks() {
  Fixture f;
  f.monitor.prime();

  f.state.set_paused(true);
  f.clipboard.user_copy_text("secret");
  auto report = f.monitor.tick();
  CHECK(report.paused_skips == 1);
  CHECK(f.history().empty());

  // После снятия паузы то же содержимое уже не новое
  f.state.set_paused(false);
  CHECK(!f.monitor.tick().changed());
  CHECK(f.history().empty());
}

void test_sensitive_source() {
  Config config;
  config.sensitive_apps = {"KeePassXC"};
  Fixture f{config};
  f.monitor.prime();

  f.clipboard.set_window_class("keepassxc");
  f.clipboard.user_copy_text("hunter2");
  (void)f.monitor.tick();

  f.clipboard.set_window_class("firefox");
  f.clipboard.user_copy_text("hello");
  (void)f.monitor.tick();

  auto items = f.history();
  CHECK(items.size() == 2);
  CHECK(items[0].content == "hello");
  CHECK(!items[0].is_sensitive);
  CHECK(items[0].source_app.value_or("") == "firefox");
  CHECK(items[1].is_sensitive);
}

void test_image_is_saved_as_png() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_image(solid_image(4, 3, 10, 20, 30));
  auto report = f.monitor.tick();
  CHECK(report.inserted == 1);

  auto items = f.history();
  CHECK(items.size() == 1);
  CHECK(items[0].kind == ItemKind::Image);
  CHECK(items[0].data_type == "image");
  CHECK(std::filesystem::path{items[0].content}.parent_path() == f.images_dir);
  CHECK(std::filesystem::exists(items[0].content));

  auto decoded = clipdeck::load_image_file(items[0].content);
  CHECK(decoded.ok());
  CHECK(decoded.image.width == 4);
  CHECK(decoded.image.height == 3);
}

void test_same_pixels_share_one_entry() {
  Fixture f;
  f.monitor.prime();

  f.clipboard.user_copy_image(solid_image(2, 2, 255, 0, 0));
  (void)f.monitor.tick();
  f.clipboard.user_copy_image(solid_image(2, 2, 0, 255, 0));
  (void)f.monitor.tick();
  f.clipboard.user_copy_image(solid_image(2, 2, 255, 0, 0));
  (void)f.monitor.tick();

  auto items = f.history();
  CHECK(items.size() == 2);
  CHECK(items[0].content != items[1].content);
}

void test_eviction_removes_image_files() {
  Config config;
  config.max_history_size = 1;
  Fixture f{config};
  f.monitor.prime();

  f.clipboard.user_copy_image(solid_image(2, 2, 1, 2, 3));
  (void)f.monitor.tick();
  const std::string first_path = f.history().at(0).content;
  CHECK(std::filesystem::exists(first_path));

  f.clipboard.user_copy_text("pushes the image out");
  auto report = f.monitor.tick();
  CHECK(report.evicted == 1);
  CHECK(!std::filesystem::exists(first_path));
  CHECK(f.history().size() == 1);
}

void test_image_self_write_marker() {
  Fixture f;
  f.monitor.prime();

  const clipdeck::RawImage image = solid_image(3, 3, 40, 50, 60);
  auto png = clipdeck::encode_png(image);
  CHECK(png.ok());

  f.state.set_self_write_marker(clipdeck::content_key_for_image(image));
  CHECK(f.clipboard.write_png(png.bytes) == clipdeck::ClipboardResult::Ok);

  auto report = f.monitor.tick();
  CHECK(report.self_writes == 1);
  CHECK(f.history().empty());
}

} // namespace

#undef CHECK

int main() {
  test_records_new_text();
  test_unchanged_content_is_ignored();
  test_prime_skips_existing_content();
  test_blank_text_is_skipped();
  test_recopy_moves_to_front();
  test_self_write_marker();
  test_marker_for_unchanged_content_does_not_linger();
  test_pause_skips_but_tracks();
  test_sensitive_source();
  test_image_is_saved_as_png();
  test_same_pixels_share_one_entry();
  test_eviction_removes_image_files();
  test_image_self_write_marker();

  std::cout << "OK\n";
  return 0;
}
