/**
 * @file gtk_window_system.cpp
 * @brief Реализация overlay-окон на GTK3
 */

#include "clipdeck/gtk_window_system.hpp"
#include "clipdeck/overlay_orchestrator.hpp"

#include <gdk/gdkx.h>

#include <algorithm>
#include <iostream>

namespace clipdeck {

GtkWindowSystem::GtkWindowSystem(UiDispatcher &dispatcher)
    : dispatcher_{dispatcher} {}

GtkWindowSystem::~GtkWindowSystem() {
  // Деструктор вызывается в потоке GTK после выхода из gtk_main()
  for (auto &[label, surface] : surfaces_) {
    if (surface.window) {
      gtk_widget_destroy(surface.window);
    }
  }
  surfaces_.clear();
}

void GtkWindowSystem::set_dismiss_handler(DismissHandler handler) {
  dismiss_handler_ = std::move(handler);
}

GtkWindowSystem::Surface *GtkWindowSystem::find(const std::string &label) {
  auto it = surfaces_.find(label);
  return it == surfaces_.end() ? nullptr : &it->second;
}

bool GtkWindowSystem::exists(const std::string &label) {
  bool found = false;
  dispatcher_.invoke([&] { found = find(label) != nullptr; });
  return found;
}

bool GtkWindowSystem::create(const std::string &label,
                             const OverlayGeometry &geometry) {
  bool ok = false;
  dispatcher_.invoke([&] {
    if (find(label)) {
      ok = true;
      return;
    }

    GtkWidget *window = gtk_window_new(GTK_WINDOW_TOPLEVEL);
    gtk_window_set_title(GTK_WINDOW(window), label.c_str());
    gtk_window_set_decorated(GTK_WINDOW(window), FALSE);
    gtk_window_set_keep_above(GTK_WINDOW(window), TRUE);
    gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window), TRUE);
    gtk_window_set_skip_pager_hint(GTK_WINDOW(window), TRUE);
    gtk_window_set_resizable(GTK_WINDOW(window), FALSE);
    gtk_window_stick(GTK_WINDOW(window));

    gtk_window_set_default_size(GTK_WINDOW(window),
                                static_cast<gint>(geometry.logical_width),
                                static_cast<gint>(geometry.logical_height));
    gtk_window_move(GTK_WINDOW(window), geometry.x, geometry.y);

    GtkWidget *image = gtk_image_new();
    gtk_container_add(GTK_CONTAINER(window), image);
    gtk_widget_show(image);

    gtk_widget_add_events(window, GDK_KEY_PRESS_MASK);
    g_signal_connect(window, "key-press-event", G_CALLBACK(on_key_press),
                     this);

    // Нужен GdkWindow (XID) до показа
    gtk_widget_realize(window);

    surfaces_[label] = Surface{window, image, geometry};
    ok = true;
  });
  return ok;
}

bool GtkWindowSystem::set_physical_geometry(const std::string &label,
                                            const OverlayGeometry &geometry) {
  bool ok = false;
  dispatcher_.invoke([&] {
    Surface *surface = find(label);
    if (!surface) {
      return;
    }
    surface->geometry = geometry;

    GdkWindow *gdk_window = gtk_widget_get_window(surface->window);
    if (!gdk_window || !GDK_IS_X11_WINDOW(gdk_window)) {
      return;
    }

    // gtk_window_move/resize работают в логических пикселях,
    // физические координаты задаются напрямую через Xlib
    Display *display =
        GDK_DISPLAY_XDISPLAY(gdk_window_get_display(gdk_window));
    XMoveResizeWindow(display, GDK_WINDOW_XID(gdk_window),
                      geometry.physical_x, geometry.physical_y,
                      geometry.physical_width, geometry.physical_height);
    XFlush(display);
    ok = true;
  });
  return ok;
}

bool GtkWindowSystem::show(const std::string &label) {
  bool ok = false;
  dispatcher_.invoke([&] {
    Surface *surface = find(label);
    if (!surface) {
      return;
    }
    gtk_widget_show(surface->window);
    ok = true;
  });
  return ok;
}

bool GtkWindowSystem::focus(const std::string &label) {
  bool ok = false;
  dispatcher_.invoke([&] {
    Surface *surface = find(label);
    if (!surface) {
      return;
    }
    gtk_window_present(GTK_WINDOW(surface->window));
    gtk_widget_grab_focus(surface->window);
    ok = true;
  });
  return ok;
}

bool GtkWindowSystem::apply_window_level(const std::string &label,
                                         WindowLevelCapability &capability) {
  bool ok = false;
  dispatcher_.invoke([&] {
    Surface *surface = find(label);
    if (!surface) {
      return;
    }

    NativeWindow native;
    GdkWindow *gdk_window = gtk_widget_get_window(surface->window);
    if (gdk_window && GDK_IS_X11_WINDOW(gdk_window)) {
      native.display =
          GDK_DISPLAY_XDISPLAY(gdk_window_get_display(gdk_window));
      native.window = GDK_WINDOW_XID(gdk_window);
    }
    ok = capability.elevate(native);
  });
  return ok;
}

void GtkWindowSystem::deliver(const std::string &label,
                              const std::vector<CaptureResult> &results) {
  dispatcher_.invoke([&] {
    Surface *surface = find(label);
    if (!surface) {
      return;
    }

    // Окно выбирает снимок своего дисплея
    const auto display_id = parse_overlay_label(label);
    auto it = std::find_if(results.begin(), results.end(),
                           [&](const CaptureResult &r) {
                             return display_id && r.id == *display_id;
                           });
    if (it == results.end()) {
      return;
    }

    GError *error = nullptr;
    GdkPixbuf *pixbuf = gdk_pixbuf_new_from_file_at_scale(
        it->path.c_str(), static_cast<int>(surface->geometry.logical_width),
        static_cast<int>(surface->geometry.logical_height), FALSE, &error);
    if (!pixbuf) {
      std::cerr << "[clipdeck-overlay] Cannot load " << it->path << ": "
                << (error ? error->message : "unknown error") << "\n";
      if (error) {
        g_error_free(error);
      }
      return;
    }

    gtk_image_set_from_pixbuf(GTK_IMAGE(surface->image), pixbuf);
    g_object_unref(pixbuf);
  });
}

bool GtkWindowSystem::close(const std::string &label) {
  bool ok = false;
  dispatcher_.invoke([&] {
    auto it = surfaces_.find(label);
    if (it == surfaces_.end()) {
      return;
    }
    gtk_widget_destroy(it->second.window);
    surfaces_.erase(it);
    ok = true;
  });
  return ok;
}

std::vector<std::string> GtkWindowSystem::labels() {
  std::vector<std::string> out;
  dispatcher_.invoke([&] {
    out.reserve(surfaces_.size());
    for (const auto &[label, surface] : surfaces_) {
      out.push_back(label);
    }
  });
  return out;
}

gboolean GtkWindowSystem::on_key_press(GtkWidget *widget, GdkEventKey *event,
                                       gpointer user_data) {
  (void)widget;
  auto *self = static_cast<GtkWindowSystem *>(user_data);
  if (event->keyval != GDK_KEY_Escape) {
    return FALSE;
  }
  if (self->dismiss_handler_) {
    self->dismiss_handler_();
  }
  return TRUE;
}

} // namespace clipdeck
