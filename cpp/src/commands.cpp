/**
 * @file commands.cpp
 * @brief Реализация командного интерфейса
 */

#include "clipdeck/commands.hpp"
#include "clipdeck/content_classifier.hpp"
#include "clipdeck/image_codec.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>

namespace clipdeck {

namespace {

/// Удаляет снимки прошлого захвата, которых нет в новом
void remove_screenshot_files(const std::vector<CaptureResult> &stale,
                             const std::vector<CaptureResult> &keep = {}) {
  for (const auto &capture : stale) {
    bool kept = false;
    for (const auto &k : keep) {
      if (k.path == capture.path) {
        kept = true;
        break;
      }
    }
    if (kept || capture.path.empty()) {
      continue;
    }

    std::error_code ec;
    std::filesystem::remove(capture.path, ec);
    if (ec) {
      std::cerr << "[clipdeck-capture] Cannot remove " << capture.path << ": "
                << ec.message() << "\n";
    }
  }
}

std::optional<std::vector<std::uint8_t>>
read_file_bytes(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
  return bytes;
}

} // namespace

std::string capture_file_name(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[32] = {};
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          when.time_since_epoch())
                          .count() %
                      1000000;
  char fraction[8] = {};
  std::snprintf(fraction, sizeof(fraction), "%06lld",
                static_cast<long long>(micros));

  return std::string("capture_") + stamp + "_" + fraction + ".png";
}

Commands::Commands(HistoryStore &store, AppState &state, EventBus &bus,
                   ClipboardBackend &clipboard, DisplayCaptureService &capture,
                   OverlayOrchestrator &overlays, OcrEngine &ocr,
                   CommandPaths paths, RebindCallback rebind)
    : store_{store}, state_{state}, bus_{bus}, clipboard_{clipboard},
      capture_{capture}, overlays_{overlays}, ocr_{ocr},
      paths_{std::move(paths)}, rebind_{std::move(rebind)} {}

// ===========================================================================
// Захват экрана
// ===========================================================================

CommandResult<std::vector<CaptureResult>> Commands::start_capture() {
  CommandResult<std::vector<CaptureResult>> out;

  // Снимаем до показа окон, чтобы они не попали в кадр
  CaptureOutcome captured = capture_.capture_all(paths_.screenshot_dir);
  if (!captured.ok()) {
    out.error = captured.error;
    return out;
  }

  const std::vector<CaptureResult> previous = state_.last_capture();
  state_.set_last_capture(captured.results);
  remove_screenshot_files(previous, captured.results);

  OverlayOutcome shown = overlays_.show_overlays(captured.results);
  if (!shown.ok()) {
    out.error = shown.error;
    return out;
  }

  out.value = std::move(captured.results);
  return out;
}

CommandResult<std::vector<CaptureResult>> Commands::get_capture_data() const {
  CommandResult<std::vector<CaptureResult>> out;
  out.value = state_.last_capture();
  if (out.value.empty()) {
    out.error = "No capture data available";
  }
  return out;
}

CommandStatus Commands::close_capture() {
  (void)overlays_.close_all();

  const std::vector<CaptureResult> previous = state_.last_capture();
  state_.set_last_capture({});
  remove_screenshot_files(previous);
  return {};
}

CommandStatus Commands::close_overlay(std::uint32_t display_id) {
  if (!overlays_.close(display_id)) {
    return {"No overlay for display " + std::to_string(display_id)};
  }
  return {};
}

CommandResult<std::string>
Commands::save_captured_image(std::string_view payload) {
  CommandResult<std::string> out;

  const std::vector<std::uint8_t> bytes = decode_base64_payload(payload);
  if (bytes.empty()) {
    out.error = "Invalid base64 payload";
    return out;
  }
  const DecodeOutcome decoded = decode_image(bytes);
  if (!decoded.ok()) {
    out.error = "Payload is not an image: " + decoded.error;
    return out;
  }

  std::error_code ec;
  std::filesystem::create_directories(paths_.captures_dir, ec);
  if (ec) {
    out.error = "Cannot create " + paths_.captures_dir.string() + ": " +
                ec.message();
    return out;
  }

  const std::filesystem::path path =
      paths_.captures_dir /
      capture_file_name(std::chrono::system_clock::now());
  const std::string error = write_bytes_file(bytes, path);
  if (!error.empty()) {
    out.error = error;
    return out;
  }

  std::cerr << "[clipdeck-capture] Saved " << path.string() << "\n";
  out.value = path.string();
  return out;
}

// ===========================================================================
// История
// ===========================================================================

CommandResult<std::vector<ClipboardItem>>
Commands::get_history(const HistoryQuery &query) const {
  auto page = store_.get(query);
  return {std::move(page.value), std::move(page.error)};
}

CommandResult<std::int64_t> Commands::get_history_count() const {
  auto count = store_.count();
  return {count.value, std::move(count.error)};
}

CommandResult<std::string> Commands::get_item_content(std::int64_t id) const {
  auto content = store_.get_item_content(id);
  return {std::move(content.value), std::move(content.error)};
}

CommandStatus Commands::prepare_image(const std::string &content,
                                      std::string &stored_path,
                                      std::vector<std::uint8_t> &png,
                                      std::string &marker) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(content, ec)) {
    auto bytes = read_file_bytes(content);
    if (!bytes) {
      return {"Cannot read " + content};
    }
    DecodeOutcome decoded = decode_image(*bytes);
    if (!decoded.ok()) {
      return {decoded.error};
    }
    // Монитор прочитает обратно тот же PNG и получит те же пиксели
    EncodeOutcome encoded = encode_png(decoded.image);
    if (!encoded.ok()) {
      return {encoded.error};
    }
    stored_path = content;
    png = std::move(encoded.bytes);
    marker = content_key_for_image(decoded.image);
    return {};
  }

  const std::vector<std::uint8_t> bytes = decode_base64_payload(content);
  if (bytes.empty()) {
    return {"Image is neither a file nor base64 data"};
  }
  DecodeOutcome decoded = decode_image(bytes);
  if (!decoded.ok()) {
    return {decoded.error};
  }
  EncodeOutcome encoded = encode_png(decoded.image);
  if (!encoded.ok()) {
    return {encoded.error};
  }

  std::filesystem::create_directories(paths_.images_dir, ec);
  const std::filesystem::path path =
      paths_.images_dir / image_file_name(decoded.image);
  if (!std::filesystem::exists(path, ec)) {
    const std::string error = write_bytes_file(encoded.bytes, path);
    if (!error.empty()) {
      return {error};
    }
  }

  stored_path = path.string();
  png = std::move(encoded.bytes);
  marker = content_key_for_image(decoded.image);
  return {};
}

CommandStatus
Commands::set_clipboard_item(const std::string &content, ItemKind kind,
                             std::optional<std::int64_t> id,
                             const std::optional<std::string> &html) {
  if (content.empty()) {
    return {"Empty content"};
  }

  ClipboardItem item;
  item.kind = kind;
  item.timestamp = std::chrono::system_clock::now();
  item.html_content = html;

  std::string marker;
  ClipboardResult written = ClipboardResult::Ok;

  if (kind == ItemKind::Text) {
    item.content = content;
    item.data_type = std::string{classify_content(content)};
    marker = content;

    // Метка ставится до записи: монитор может увидеть изменение сразу
    state_.set_self_write_marker(marker);
    written = clipboard_.write_text(content, html);
  } else {
    std::vector<std::uint8_t> png;
    CommandStatus prepared = prepare_image(content, item.content, png, marker);
    if (!prepared.ok()) {
      return prepared;
    }
    item.data_type = std::string{kDataTypeImage};

    state_.set_self_write_marker(marker);
    written = clipboard_.write_png(png);
  }

  if (written != ClipboardResult::Ok) {
    // Записи не было: метка не должна скрыть будущее копирование
    (void)state_.consume_self_write_marker(marker);
    std::cerr << "[clipdeck] Clipboard write failed\n";
    return {"Failed to write to clipboard"};
  }

  if (id) {
    StoreStatus touched = store_.update_timestamp(*id);
    if (!touched.ok()) {
      return {touched.error};
    }
  } else {
    auto inserted = store_.insert(item, state_.max_history_size());
    if (!inserted.ok()) {
      return {inserted.error};
    }
    remove_backing_files(inserted.value.evicted);
  }

  bus_.emit(EventKind::ClipboardUpdate);
  return {};
}

CommandStatus Commands::delete_item(std::int64_t id) {
  auto removed = store_.remove(id);
  if (!removed.ok()) {
    return {removed.error};
  }

  if (!removed.value) {
    std::cerr << "[clipdeck] Item " << id << " not found, nothing deleted\n";
    return {};
  }

  remove_backing_files({*removed.value});
  bus_.emit(EventKind::ClipboardUpdate);
  return {};
}

CommandResult<bool> Commands::toggle_sensitive(std::int64_t id) {
  auto toggled = store_.toggle_sensitive(id);
  return {toggled.value, std::move(toggled.error)};
}

CommandResult<bool> Commands::toggle_pin(std::int64_t id) {
  auto toggled = store_.toggle_pin(id);
  return {toggled.value, std::move(toggled.error)};
}

CommandStatus Commands::update_clipboard_item_content(
    std::int64_t id, const std::string &content, const std::string &data_type,
    const std::optional<std::string> &note,
    const std::optional<std::string> &html) {
  StoreStatus updated = store_.update_content(id, content, data_type, note, html);
  if (!updated.ok()) {
    return {updated.error};
  }
  return {};
}

CommandStatus Commands::clear_history() {
  const Config config = state_.config();

  auto removed = store_.clear(!config.clear_pinned_on_clear,
                              !config.clear_collected_on_clear);
  if (!removed.ok()) {
    return {removed.error};
  }

  remove_backing_files(removed.value);
  std::cerr << "[clipdeck] History cleared, removed " << removed.value.size()
            << " items\n";
  bus_.emit(EventKind::ClipboardUpdate);
  return {};
}

// ===========================================================================
// Конфигурация и пауза
// ===========================================================================

Config Commands::get_config() const { return state_.config(); }

void Commands::apply_config(const Config &previous, const Config &next) {
  state_.set_config(next);

  if (next.shortcut != previous.shortcut && rebind_) {
    if (!rebind_(next.shortcut)) {
      std::cerr << "[clipdeck] Failed to register shortcut '" << next.shortcut
                << "'\n";
    }
  }

  bus_.emit_config(next);
}

CommandStatus Commands::save_config(Config config) {
  const Config previous = state_.config();
  if (config.config_path.empty()) {
    config.config_path = previous.config_path.empty() ? default_config_path()
                                                      : previous.config_path;
  }

  if (!validate_config(config)) {
    return {"Invalid configuration: max_history_size must be in [" +
            std::to_string(kMinHistorySize) + ", " +
            std::to_string(kMaxHistorySize) +
            "] and shortcut must be a key combination"};
  }

  apply_config(previous, config);

  // Запись best-effort: конфиг в памяти уже обновлён
  if (::clipdeck::save_config(config, config.config_path) != ConfigResult::Ok) {
    std::cerr << "[clipdeck] Failed to save config to "
              << config.config_path.string() << "\n";
  }
  return {};
}

CommandStatus Commands::reload_config(const std::filesystem::path &path) {
  const Config previous = state_.config();

  std::filesystem::path effective = path;
  if (effective.empty()) {
    effective = previous.config_path.empty() ? default_config_path()
                                             : previous.config_path;
  }

  ConfigLoadOutcome loaded = load_config_checked(effective);
  if (loaded.result != ConfigResult::Ok) {
    return {loaded.error.empty() ? "Cannot load " + effective.string()
                                 : loaded.error};
  }

  loaded.config.config_path = effective;
  apply_config(previous, loaded.config);
  std::cerr << "[clipdeck] Config reloaded from " << effective.string()
            << "\n";
  return {};
}

void Commands::set_paused(bool paused) {
  state_.set_paused(paused);
  std::cerr << "[clipdeck] Monitoring " << (paused ? "paused" : "resumed")
            << "\n";
  bus_.emit_paused(paused);
}

bool Commands::get_paused() const { return state_.paused(); }

// ===========================================================================
// Коллекции, стек вставки, OCR
// ===========================================================================

CommandResult<Collection> Commands::create_collection(const std::string &name) {
  auto created = store_.create_collection(name);
  return {std::move(created.value), std::move(created.error)};
}

CommandResult<std::vector<Collection>> Commands::get_collections() const {
  auto listed = store_.list_collections();
  return {std::move(listed.value), std::move(listed.error)};
}

CommandStatus Commands::delete_collection(std::int64_t id) {
  StoreStatus deleted = store_.delete_collection(id);
  if (!deleted.ok()) {
    return {deleted.error};
  }
  bus_.emit(EventKind::ClipboardUpdate);
  return {};
}

CommandStatus
Commands::set_item_collection(std::int64_t item_id,
                              std::optional<std::int64_t> collection_id) {
  StoreStatus assigned = store_.set_item_collection(item_id, collection_id);
  if (!assigned.ok()) {
    return {assigned.error};
  }
  return {};
}

CommandStatus Commands::set_paste_stack(std::vector<ClipboardItem> items) {
  state_.set_paste_stack(std::move(items));
  return {};
}

CommandResult<std::string>
Commands::ocr_image(const std::filesystem::path &path) {
  CommandResult<std::string> out;
  if (path.empty()) {
    out.error = "No image path";
    return out;
  }

  std::cerr << "[clipdeck] OCR: " << path.string() << "\n";
  OcrOutcome recognized = ocr_.recognize(path);
  if (!recognized.ok()) {
    std::cerr << "[clipdeck] OCR failed: " << recognized.error << "\n";
    out.error = std::move(recognized.error);
    return out;
  }

  std::cerr << "[clipdeck] OCR: " << recognized.text.size()
            << " bytes of text\n";
  out.value = std::move(recognized.text);
  return out;
}

} // namespace clipdeck
