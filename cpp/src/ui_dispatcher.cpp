/**
 * @file ui_dispatcher.cpp
 * @brief Реализация переноса вызовов в главный цикл
 */

#include "clipdeck/ui_dispatcher.hpp"

#include <memory>

namespace clipdeck {

struct UiDispatcher::PendingCall {
  UiDispatcher *owner = nullptr;
  std::function<void()> fn;
  bool done = false; // под owner->mutex_
};

UiDispatcher::UiDispatcher(GMainContext *context)
    : context_{context ? context : g_main_context_default()} {}

bool UiDispatcher::invoke(std::function<void()> fn) {
  if (g_main_context_is_owner(context_)) {
    fn();
    return true;
  }

  auto call = std::make_shared<PendingCall>();
  call->owner = this;
  call->fn = std::move(fn);

  {
    std::lock_guard lock{mutex_};
    if (shut_down_) {
      return false;
    }
  }

  // Копия shared_ptr принадлежит источнику GLib и освобождается free_call
  g_main_context_invoke_full(context_, G_PRIORITY_DEFAULT, &run_call,
                             new std::shared_ptr<PendingCall>(call),
                             &free_call);

  std::unique_lock lock{mutex_};
  cv_.wait(lock, [&] { return call->done || shut_down_; });
  return call->done;
}

void UiDispatcher::shutdown() {
  {
    std::lock_guard lock{mutex_};
    shut_down_ = true;
  }
  cv_.notify_all();
}

gboolean UiDispatcher::run_call(gpointer data) {
  auto &call = *static_cast<std::shared_ptr<PendingCall> *>(data);
  UiDispatcher *owner = call->owner;

  {
    std::lock_guard lock{owner->mutex_};
    if (owner->shut_down_) {
      return G_SOURCE_REMOVE;
    }
  }

  call->fn();

  {
    std::lock_guard lock{owner->mutex_};
    call->done = true;
  }
  owner->cv_.notify_all();
  return G_SOURCE_REMOVE;
}

void UiDispatcher::free_call(gpointer data) {
  delete static_cast<std::shared_ptr<PendingCall> *>(data);
}

} // namespace clipdeck
