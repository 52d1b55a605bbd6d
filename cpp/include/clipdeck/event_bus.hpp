/**
 * @file event_bus.hpp
 * @brief Шина уведомлений для UI-слоя
 *
 * Подписчики вызываются синхронно в потоке, который сделал emit().
 * Список подписчиков копируется под мьютексом, вызовы идут без него:
 * подписчик может отписаться или подписать другого изнутри колбэка.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "clipdeck/config.hpp"
#include "clipdeck/types.hpp"

namespace clipdeck {

enum class EventKind {
  CaptureCompleted,  // payload: captures
  ConfigUpdated,     // payload: config
  PauseStateChanged, // payload: paused
  ClipboardUpdate,
  ShortcutTriggered,
};

[[nodiscard]] constexpr std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
  case EventKind::CaptureCompleted:
    return "capture-completed";
  case EventKind::ConfigUpdated:
    return "config-updated";
  case EventKind::PauseStateChanged:
    return "pause-state-changed";
  case EventKind::ClipboardUpdate:
    return "clipboard-update";
  case EventKind::ShortcutTriggered:
    return "shortcut-triggered";
  }
  return "unknown";
}

struct Event {
  EventKind kind = EventKind::ClipboardUpdate;
  std::vector<CaptureResult> captures;
  std::optional<Config> config;
  bool paused = false;
};

using EventCallback = std::function<void(const Event &)>;

class EventBus {
public:
  using SubscriptionId = std::uint64_t;

  EventBus() = default;

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  SubscriptionId subscribe(EventCallback callback);
  void unsubscribe(SubscriptionId id);

  void emit(const Event &event);

  // Упрощённые emit для событий с одним полем
  void emit(EventKind kind);
  void emit_captures(std::vector<CaptureResult> captures);
  void emit_config(Config config);
  void emit_paused(bool paused);

  [[nodiscard]] std::size_t subscriber_count() const;

private:
  struct Subscriber {
    SubscriptionId id = 0;
    EventCallback callback;
  };

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscriber>> subscribers_;
  SubscriptionId next_id_ = 1;
};

} // namespace clipdeck
