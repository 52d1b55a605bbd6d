/**
 * @file hotkey_binder.cpp
 * @brief Реализация глобальной горячей клавиши
 */

#include "clipdeck/hotkey_binder.hpp"

#include <poll.h>

#include <X11/Xutil.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace clipdeck {

namespace {

/// Таймаут poll() для проверки stop_token
constexpr int kPollTimeoutMs = 200;

/// NumLock (Mod2) и CapsLock не должны мешать сочетанию
constexpr std::array<unsigned int, 4> kLockVariants = {
    0U, LockMask, Mod2Mask, LockMask | Mod2Mask};

std::atomic<bool> g_grab_failed{false};

int on_grab_error(Display *display, XErrorEvent *event) {
  (void)display;
  if (event->error_code == BadAccess) {
    g_grab_failed.store(true);
  }
  return 0;
}

unsigned int to_x11_modifiers(std::uint8_t bits) {
  unsigned int mask = 0;
  if (bits & kModCtrl) {
    mask |= ControlMask;
  }
  if (bits & kModShift) {
    mask |= ShiftMask;
  }
  if (bits & kModAlt) {
    mask |= Mod1Mask;
  }
  if (bits & kModSuper) {
    mask |= Mod4Mask;
  }
  return mask;
}

} // namespace

HotkeyBinder::HotkeyBinder(EventBus &bus) : bus_{bus} {}

HotkeyBinder::~HotkeyBinder() { stop(); }

bool HotkeyBinder::start(const std::string &shortcut) {
  {
    std::lock_guard lock{mutex_};
    if (display_) {
      return true;
    }

    display_ = XOpenDisplay(nullptr);
    if (!display_) {
      std::cerr << "[clipdeck-hotkey] Cannot open X display\n";
      return false;
    }
    root_ = DefaultRootWindow(display_);
  }

  if (!rebind(shortcut)) {
    std::cerr << "[clipdeck-hotkey] Shortcut '" << shortcut
              << "' is not active\n";
  }

  thread_ = std::jthread([this](std::stop_token st) { run(st); });
  return true;
}

void HotkeyBinder::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }

  std::lock_guard lock{mutex_};
  if (display_) {
    ungrab_locked();
    XCloseDisplay(display_);
    display_ = nullptr;
    root_ = None;
  }
}

bool HotkeyBinder::is_running() const noexcept {
  return thread_.joinable();
}

std::string HotkeyBinder::shortcut() const {
  std::lock_guard lock{mutex_};
  return combo_ ? format_key_combo(*combo_) : std::string{};
}

bool HotkeyBinder::rebind(const std::string &shortcut) {
  const auto combo = parse_key_combo(shortcut);
  if (!combo) {
    std::cerr << "[clipdeck-hotkey] Cannot parse shortcut '" << shortcut
              << "'\n";
    return false;
  }

  std::lock_guard lock{mutex_};
  if (!display_) {
    std::cerr << "[clipdeck-hotkey] Not connected, shortcut not bound\n";
    return false;
  }

  ungrab_locked();
  if (!grab_locked(*combo)) {
    return false;
  }

  std::cerr << "[clipdeck-hotkey] Bound " << format_key_combo(*combo) << "\n";
  return true;
}

bool HotkeyBinder::grab_locked(const KeyCombo &combo) {
  const KeySym keysym = XStringToKeysym(combo.key.c_str());
  if (keysym == NoSymbol) {
    std::cerr << "[clipdeck-hotkey] Unknown key '" << combo.key << "'\n";
    return false;
  }

  const KeyCode keycode = XKeysymToKeycode(display_, keysym);
  if (keycode == 0) {
    std::cerr << "[clipdeck-hotkey] Key '" << combo.key
              << "' is not on the keyboard\n";
    return false;
  }

  const unsigned int modifiers = to_x11_modifiers(combo.modifiers);

  // BadAccess приходит асинхронно: ловим его до XSync
  g_grab_failed.store(false);
  XErrorHandler previous = XSetErrorHandler(&on_grab_error);
  for (unsigned int extra : kLockVariants) {
    XGrabKey(display_, keycode, modifiers | extra, root_, True, GrabModeAsync,
             GrabModeAsync);
  }
  XSync(display_, False);
  XSetErrorHandler(previous);

  if (g_grab_failed.load()) {
    std::cerr << "[clipdeck-hotkey] " << format_key_combo(combo)
              << " is grabbed by another client\n";
    for (unsigned int extra : kLockVariants) {
      XUngrabKey(display_, keycode, modifiers | extra, root_);
    }
    XSync(display_, False);
    return false;
  }

  keycode_ = keycode;
  modifiers_ = modifiers;
  combo_ = combo;
  return true;
}

void HotkeyBinder::ungrab_locked() {
  if (!combo_) {
    return;
  }
  for (unsigned int extra : kLockVariants) {
    XUngrabKey(display_, keycode_, modifiers_ | extra, root_);
  }
  XSync(display_, False);
  keycode_ = 0;
  modifiers_ = 0;
  combo_.reset();
}

void HotkeyBinder::run(std::stop_token st) {
  int fd = -1;
  {
    std::lock_guard lock{mutex_};
    fd = ConnectionNumber(display_);
  }

  while (!st.stop_requested()) {
    pollfd pfd = {fd, POLLIN, 0};
    const int ret = poll(&pfd, 1, kPollTimeoutMs);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[clipdeck-hotkey] Poll error: " << std::strerror(errno)
                << "\n";
      break;
    }

    bool triggered = false;
    {
      std::lock_guard lock{mutex_};
      while (XPending(display_) > 0) {
        XEvent ev;
        XNextEvent(display_, &ev);
        if (ev.type != KeyPress || !combo_) {
          continue;
        }
        const unsigned int state =
            ev.xkey.state & ~(LockMask | Mod2Mask) &
            (ShiftMask | ControlMask | Mod1Mask | Mod4Mask);
        if (ev.xkey.keycode == keycode_ && state == modifiers_) {
          triggered = true;
        }
      }
    }

    // Подписчики вызываются без блокировки
    if (triggered) {
      bus_.emit(EventKind::ShortcutTriggered);
    }
  }
}

} // namespace clipdeck
