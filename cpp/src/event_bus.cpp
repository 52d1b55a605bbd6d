/**
 * @file event_bus.cpp
 * @brief Реализация шины уведомлений
 */

#include "clipdeck/event_bus.hpp"

#include <algorithm>

namespace clipdeck {

EventBus::SubscriptionId EventBus::subscribe(EventCallback callback) {
  std::lock_guard lock{mutex_};
  auto sub = std::make_shared<Subscriber>();
  sub->id = next_id_++;
  sub->callback = std::move(callback);
  subscribers_.push_back(sub);
  return sub->id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock{mutex_};
  auto it = std::remove_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const std::shared_ptr<Subscriber> &s) { return s->id == id; });
  subscribers_.erase(it, subscribers_.end());
}

void EventBus::emit(const Event &event) {
  std::vector<std::shared_ptr<Subscriber>> snapshot;
  {
    std::lock_guard lock{mutex_};
    snapshot = subscribers_;
  }

  for (const auto &sub : snapshot) {
    if (sub->callback) {
      sub->callback(event);
    }
  }
}

void EventBus::emit(EventKind kind) {
  Event event;
  event.kind = kind;
  emit(event);
}

void EventBus::emit_captures(std::vector<CaptureResult> captures) {
  Event event;
  event.kind = EventKind::CaptureCompleted;
  event.captures = std::move(captures);
  emit(event);
}

void EventBus::emit_config(Config config) {
  Event event;
  event.kind = EventKind::ConfigUpdated;
  event.config = std::move(config);
  emit(event);
}

void EventBus::emit_paused(bool paused) {
  Event event;
  event.kind = EventKind::PauseStateChanged;
  event.paused = paused;
  emit(event);
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard lock{mutex_};
  return subscribers_.size();
}

} // namespace clipdeck
