/**
 * @file gtk_window_system.hpp
 * @brief Overlay-окна на GTK3 (X11)
 *
 * Каждое окно является GtkWindow без рамки с GtkImage, в котором показывается
 * снимок своего дисплея. Escape в любом окне вызывает обработчик
 * закрытия (обычно закрывает весь захват).
 */

#pragma once

#include <gtk/gtk.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "clipdeck/ui_dispatcher.hpp"
#include "clipdeck/window_system.hpp"

namespace clipdeck {

class GtkWindowSystem final : public WindowSystem {
public:
  using DismissHandler = std::function<void()>;

  explicit GtkWindowSystem(UiDispatcher &dispatcher);
  ~GtkWindowSystem() override;

  GtkWindowSystem(const GtkWindowSystem &) = delete;
  GtkWindowSystem &operator=(const GtkWindowSystem &) = delete;

  /// Вызывается в потоке GTK по Escape
  void set_dismiss_handler(DismissHandler handler);

  [[nodiscard]] bool exists(const std::string &label) override;
  bool create(const std::string &label,
              const OverlayGeometry &geometry) override;
  bool set_physical_geometry(const std::string &label,
                             const OverlayGeometry &geometry) override;
  bool show(const std::string &label) override;
  bool focus(const std::string &label) override;
  bool apply_window_level(const std::string &label,
                          WindowLevelCapability &capability) override;
  void deliver(const std::string &label,
               const std::vector<CaptureResult> &results) override;
  bool close(const std::string &label) override;
  [[nodiscard]] std::vector<std::string> labels() override;

private:
  struct Surface {
    GtkWidget *window = nullptr;
    GtkWidget *image = nullptr;
    OverlayGeometry geometry;
  };

  static gboolean on_key_press(GtkWidget *widget, GdkEventKey *event,
                               gpointer user_data);

  /// Только в потоке GTK
  Surface *find(const std::string &label);

  UiDispatcher &dispatcher_;
  DismissHandler dismiss_handler_;

  // Доступ только из потока GTK
  std::map<std::string, Surface> surfaces_;
};

} // namespace clipdeck
