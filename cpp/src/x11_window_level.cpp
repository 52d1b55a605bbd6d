/**
 * @file x11_window_level.cpp
 * @brief Реализация EWMH-уровня окна
 */

#include "clipdeck/x11_window_level.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>

#include <iostream>

namespace clipdeck {

namespace {

/// _NET_WM_STATE_ADD
constexpr long kNetWmStateAdd = 1;

/// Источник запроса: обычное приложение
constexpr long kSourceApplication = 1;

/// _NET_WM_DESKTOP для всех рабочих столов
constexpr long kAllDesktops = 0xFFFFFFFFL;

bool send_root_message(Display *display, Window window, Atom type, long l0,
                       long l1, long l2, long l3) {
  XEvent ev{};
  ev.xclient.type = ClientMessage;
  ev.xclient.serial = 0;
  ev.xclient.send_event = True;
  ev.xclient.display = display;
  ev.xclient.window = window;
  ev.xclient.message_type = type;
  ev.xclient.format = 32;
  ev.xclient.data.l[0] = l0;
  ev.xclient.data.l[1] = l1;
  ev.xclient.data.l[2] = l2;
  ev.xclient.data.l[3] = l3;
  ev.xclient.data.l[4] = 0;

  return XSendEvent(display, DefaultRootWindow(display), False,
                    SubstructureRedirectMask | SubstructureNotifyMask,
                    &ev) != 0;
}

} // namespace

bool X11WindowLevel::elevate(const NativeWindow &native) {
  auto *display = static_cast<Display *>(native.display);
  if (!display || native.window == 0) {
    std::cerr << "[clipdeck-overlay] No native X11 window to elevate\n";
    return false;
  }

  const Window window = native.window;
  const Atom net_wm_state = XInternAtom(display, "_NET_WM_STATE", False);
  const Atom above = XInternAtom(display, "_NET_WM_STATE_ABOVE", False);
  const Atom sticky = XInternAtom(display, "_NET_WM_STATE_STICKY", False);
  const Atom fullscreen =
      XInternAtom(display, "_NET_WM_STATE_FULLSCREEN", False);
  const Atom net_wm_desktop = XInternAtom(display, "_NET_WM_DESKTOP", False);

  bool ok = send_root_message(display, window, net_wm_state, kNetWmStateAdd,
                              static_cast<long>(above),
                              static_cast<long>(sticky), kSourceApplication);
  ok = send_root_message(display, window, net_wm_state, kNetWmStateAdd,
                         static_cast<long>(fullscreen), 0,
                         kSourceApplication) &&
       ok;
  ok = send_root_message(display, window, net_wm_desktop, kAllDesktops,
                         kSourceApplication, 0, 0) &&
       ok;

  XFlush(display);

  if (!ok) {
    std::cerr << "[clipdeck-overlay] XSendEvent failed for window 0x"
              << std::hex << window << std::dec << "\n";
  }
  return ok;
}

} // namespace clipdeck
