/**
 * @file ui_dispatcher.hpp
 * @brief Синхронный перенос вызовов в поток главного цикла GLib
 *
 * Все GTK-окна живут в потоке gtk_main(). Другие потоки (IPC, горячая
 * клавиша) отправляют туда функцию через g_main_context_invoke и ждут
 * её завершения.
 */

#pragma once

#include <glib.h>

#include <condition_variable>
#include <functional>
#include <mutex>

namespace clipdeck {

class UiDispatcher {
public:
  /// @param context Контекст главного цикла (nullptr = контекст по умолчанию)
  explicit UiDispatcher(GMainContext *context = nullptr);

  UiDispatcher(const UiDispatcher &) = delete;
  UiDispatcher &operator=(const UiDispatcher &) = delete;

  /**
   * @brief Выполняет fn в потоке главного цикла и ждёт завершения
   *
   * Из самого потока цикла fn вызывается сразу.
   * @return false если диспетчер остановлен и fn не выполнялась
   */
  bool invoke(std::function<void()> fn);

  /**
   * @brief Останавливает диспетчер
   *
   * Вызывается из потока главного цикла. Ожидающие вызовы возвращают
   * false, ещё не выполненные функции отбрасываются.
   */
  void shutdown();

private:
  struct PendingCall;

  static gboolean run_call(gpointer data);
  static void free_call(gpointer data);

  GMainContext *context_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool shut_down_ = false;
};

} // namespace clipdeck
