/**
 * @file clipboard_monitor.cpp
 * @brief Реализация монитора буфера обмена
 */

#include "clipdeck/clipboard_monitor.hpp"
#include "clipdeck/content_classifier.hpp"
#include "clipdeck/image_codec.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <iostream>
#include <mutex>

namespace clipdeck {

namespace {

bool is_blank(std::string_view sv) {
  return std::all_of(sv.begin(), sv.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

bool same_pixels(const RawImage &a, const RawImage &b) {
  return a.width == b.width && a.height == b.height && a.rgba == b.rgba;
}

} // namespace

ClipboardMonitor::ClipboardMonitor(ClipboardBackend &backend,
                                   HistoryStore &store, AppState &state,
                                   EventBus &bus,
                                   std::filesystem::path images_dir,
                                   std::chrono::milliseconds interval)
    : backend_{backend}, store_{store}, state_{state}, bus_{bus},
      images_dir_{std::move(images_dir)}, interval_{interval} {}

ClipboardMonitor::~ClipboardMonitor() { stop(); }

void ClipboardMonitor::start() {
  if (thread_.joinable()) {
    return;
  }

  prime();
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
  std::cerr << "[clipdeck-monitor] Started, interval " << interval_.count()
            << " ms\n";
}

void ClipboardMonitor::stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
  std::cerr << "[clipdeck-monitor] Stopped\n";
}

bool ClipboardMonitor::is_running() const noexcept {
  return thread_.joinable();
}

void ClipboardMonitor::prime() {
  last_text_ = backend_.read_text();
  last_image_ = backend_.read_image();
}

void ClipboardMonitor::run(std::stop_token st) {
  std::mutex mutex;
  std::condition_variable_any cv;

  while (!st.stop_requested()) {
    {
      // Прерываемое ожидание: request_stop() будит поток сразу
      std::unique_lock lock{mutex};
      (void)cv.wait_for(lock, st, interval_, [] { return false; });
    }
    if (st.stop_requested()) {
      break;
    }
    (void)tick();
  }
}

TickReport ClipboardMonitor::tick() {
  TickReport report;

  // Отсутствие данных в буфере не ошибка
  std::optional<std::string> text = backend_.read_text();
  if (text && text != last_text_) {
    last_text_ = text;
    if (!is_blank(*text)) {
      handle_text(*text, report);
    }
  }

  std::optional<RawImage> image = backend_.read_image();
  if (image && !image->empty() &&
      !(last_image_ && same_pixels(*image, *last_image_))) {
    last_image_ = image;
    handle_image(*image, report);
  }

  return report;
}

void ClipboardMonitor::handle_text(const std::string &text,
                                   TickReport &report) {
  if (state_.consume_self_write_marker(text)) {
    ++report.self_writes;
    return;
  }

  if (state_.paused()) {
    ++report.paused_skips;
    return;
  }

  ClipboardItem item;
  item.content = text;
  item.kind = ItemKind::Text;
  item.data_type = std::string{classify_content(text)};
  item.timestamp = std::chrono::system_clock::now();
  item.source_app = backend_.active_window_class();
  if (item.source_app) {
    item.is_sensitive = state_.is_sensitive_source(*item.source_app);
  }

  store_item(item, report);
}

void ClipboardMonitor::handle_image(const RawImage &image,
                                    TickReport &report) {
  if (state_.consume_self_write_marker(content_key_for_image(image))) {
    ++report.self_writes;
    return;
  }

  if (state_.paused()) {
    ++report.paused_skips;
    return;
  }

  const std::filesystem::path path = images_dir_ / image_file_name(image);

  // Одинаковые пиксели дают одинаковое имя: файл уже может существовать
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    const std::string error = write_png_file(image, path);
    if (!error.empty()) {
      std::cerr << "[clipdeck-monitor] Image save failed: " << error << "\n";
      ++report.failures;
      return;
    }
  }

  ClipboardItem item;
  item.content = path.string();
  item.kind = ItemKind::Image;
  item.data_type = std::string{kDataTypeImage};
  item.timestamp = std::chrono::system_clock::now();
  item.source_app = backend_.active_window_class();
  if (item.source_app) {
    item.is_sensitive = state_.is_sensitive_source(*item.source_app);
  }

  store_item(item, report);
}

void ClipboardMonitor::store_item(const ClipboardItem &item,
                                  TickReport &report) {
  auto inserted = store_.insert(item, state_.max_history_size());
  if (!inserted.ok()) {
    std::cerr << "[clipdeck-monitor] Insert failed: " << inserted.error
              << "\n";
    ++report.failures;
    return;
  }

  remove_backing_files(inserted.value.evicted);
  report.evicted += inserted.value.evicted.size();
  ++report.inserted;

  bus_.emit(EventKind::ClipboardUpdate);
}

} // namespace clipdeck
