/**
 * @file x11_clipboard.cpp
 * @brief Реализация буфера обмена X11
 */

#include "clipdeck/x11_clipboard.hpp"
#include "clipdeck/image_codec.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <cstdio>
#include <iostream>
#include <thread>

namespace clipdeck {

namespace {

/// Размер порции XGetWindowProperty в 32-битных словах
constexpr long kPropertyChunk = 65536;

/// Пишет данные в stdin внешней утилиты
ClipboardResult pipe_to(const char *cmd, const void *data, std::size_t size) {
  FILE *pipe = popen(cmd, "w");
  if (!pipe) {
    return ClipboardResult::ConversionFailed;
  }

  const std::size_t written = fwrite(data, 1, size, pipe);
  int ret = pclose(pipe);

  if (written != size || ret != 0) {
    std::cerr << "[clipdeck] '" << cmd << "' failed (exit " << ret << ")\n";
    return ClipboardResult::ConversionFailed;
  }
  return ClipboardResult::Ok;
}

} // namespace

X11Clipboard::X11Clipboard(std::chrono::milliseconds timeout)
    : timeout_{timeout} {}

X11Clipboard::~X11Clipboard() { close(); }

bool X11Clipboard::open() {
  if (display_)
    return true;

  display_ = XOpenDisplay(nullptr);
  if (!display_) {
    std::cerr << "[clipdeck] Cannot open X display for clipboard\n";
    return false;
  }

  // Скрытое окно для работы с selections
  int screen = DefaultScreen(display_);
  window_ = XCreateSimpleWindow(display_, RootWindow(display_, screen), 0, 0, 1,
                                1, 0, BlackPixel(display_, screen),
                                WhitePixel(display_, screen));
  // PropertyNotify нужен для INCR
  XSelectInput(display_, window_, PropertyChangeMask);

  // Кэшируем атомы
  atom_clipboard_ = XInternAtom(display_, "CLIPBOARD", False);
  atom_utf8_string_ = XInternAtom(display_, "UTF8_STRING", False);
  atom_targets_ = XInternAtom(display_, "TARGETS", False);
  atom_png_ = XInternAtom(display_, "image/png", False);
  atom_incr_ = XInternAtom(display_, "INCR", False);
  atom_property_ = XInternAtom(display_, "CLIPDECK_SEL", False);

  return true;
}

void X11Clipboard::close() {
  if (display_) {
    if (window_ != None) {
      XDestroyWindow(display_, window_);
      window_ = None;
    }
    XCloseDisplay(display_);
    display_ = nullptr;
  }
}

bool X11Clipboard::is_open() const noexcept { return display_ != nullptr; }

bool X11Clipboard::wait_for_selection_notify() {
  auto start = std::chrono::steady_clock::now();
  XEvent event;

  while (std::chrono::steady_clock::now() - start < timeout_) {
    if (XCheckTypedWindowEvent(display_, window_, SelectionNotify, &event)) {
      return event.xselection.property != None;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }

  return false;
}

bool X11Clipboard::wait_for_property_new_value(Atom property) {
  auto start = std::chrono::steady_clock::now();
  XEvent event;

  while (std::chrono::steady_clock::now() - start < timeout_) {
    if (XCheckTypedWindowEvent(display_, window_, PropertyNotify, &event)) {
      if (event.xproperty.atom == property &&
          event.xproperty.state == PropertyNewValue) {
        return true;
      }
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }

  return false;
}

bool X11Clipboard::read_property(Atom property, std::vector<std::uint8_t> &out,
                                 Atom &type) {
  long offset = 0;

  while (true) {
    Atom actual_type;
    int actual_format;
    unsigned long nitems, bytes_after;
    unsigned char *data = nullptr;

    int result = XGetWindowProperty(display_, window_, property, offset,
                                    kPropertyChunk, False, AnyPropertyType,
                                    &actual_type, &actual_format, &nitems,
                                    &bytes_after, &data);
    if (result != Success) {
      if (data)
        XFree(data);
      return false;
    }

    type = actual_type;

    // Для format 32 Xlib отдаёт массив long
    std::size_t unit = 1;
    if (actual_format == 16) {
      unit = sizeof(short);
    } else if (actual_format == 32) {
      unit = sizeof(long);
    }

    if (data) {
      out.insert(out.end(), data, data + nitems * unit);
      XFree(data);
    }

    if (bytes_after == 0) {
      break;
    }
    // offset задаётся в 32-битных словах
    offset += static_cast<long>((nitems * static_cast<unsigned long>(
                                              actual_format == 8 ? 1 : 4)) /
                                4);
  }

  XDeleteProperty(display_, window_, property);
  XFlush(display_);
  return true;
}

std::optional<std::vector<std::uint8_t>>
X11Clipboard::convert_selection(Atom target) {
  XConvertSelection(display_, atom_clipboard_, target, atom_property_, window_,
                    CurrentTime);
  XFlush(display_);

  if (!wait_for_selection_notify()) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> bytes;
  Atom type = None;
  if (!read_property(atom_property_, bytes, type)) {
    return std::nullopt;
  }

  if (type != atom_incr_) {
    return bytes;
  }

  // INCR: владелец присылает данные порциями, пустая порция означает конец
  bytes.clear();
  while (true) {
    if (!wait_for_property_new_value(atom_property_)) {
      std::cerr << "[clipdeck] INCR transfer timed out\n";
      return std::nullopt;
    }
    std::vector<std::uint8_t> chunk;
    if (!read_property(atom_property_, chunk, type)) {
      return std::nullopt;
    }
    if (chunk.empty()) {
      break;
    }
    bytes.insert(bytes.end(), chunk.begin(), chunk.end());
  }
  return bytes;
}

bool X11Clipboard::has_target(Atom target) {
  auto raw = convert_selection(atom_targets_);
  if (!raw) {
    return false;
  }

  const std::size_t count = raw->size() / sizeof(long);
  const auto *atoms = reinterpret_cast<const long *>(raw->data());
  for (std::size_t i = 0; i < count; ++i) {
    if (static_cast<Atom>(atoms[i]) == target) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> X11Clipboard::read_text() {
  std::lock_guard lock{mutex_};
  if (!display_) {
    if (!open())
      return std::nullopt;
  }

  auto bytes = convert_selection(atom_utf8_string_);
  if (!bytes) {
    return std::nullopt;
  }
  return std::string(bytes->begin(), bytes->end());
}

std::optional<RawImage> X11Clipboard::read_image() {
  std::lock_guard lock{mutex_};
  if (!display_) {
    if (!open())
      return std::nullopt;
  }

  // Сначала TARGETS: не ждём таймаута у владельцев без image/png
  if (!has_target(atom_png_)) {
    return std::nullopt;
  }

  auto bytes = convert_selection(atom_png_);
  if (!bytes || bytes->empty()) {
    return std::nullopt;
  }

  DecodeOutcome decoded = decode_image(*bytes);
  if (!decoded.ok()) {
    std::cerr << "[clipdeck] Clipboard image decode failed: " << decoded.error
              << "\n";
    return std::nullopt;
  }
  return std::move(decoded.image);
}

ClipboardResult X11Clipboard::write_text(
    std::string_view text, const std::optional<std::string> & /*html*/) {
  // Владение selection требует обработки SelectionRequest в собственном
  // event loop. xsel форкается и обслуживает запросы сам.
  // text/html вариант в системный буфер не пишется.
  return pipe_to("xsel --clipboard --input", text.data(), text.size());
}

ClipboardResult X11Clipboard::write_png(std::span<const std::uint8_t> png) {
  if (png.empty()) {
    return ClipboardResult::ConversionFailed;
  }
  return pipe_to("xclip -selection clipboard -t image/png -i", png.data(),
                 png.size());
}

std::optional<std::string> X11Clipboard::active_window_class() {
  std::lock_guard lock{mutex_};
  if (!display_) {
    if (!open())
      return std::nullopt;
  }

  // Получаем активное окно
  Atom net_active_window = XInternAtom(display_, "_NET_ACTIVE_WINDOW", True);
  if (net_active_window == None)
    return std::nullopt;

  Atom actual_type;
  int actual_format;
  unsigned long nitems, bytes_after;
  unsigned char *data = nullptr;

  int root_screen = DefaultScreen(display_);
  Window root = RootWindow(display_, root_screen);

  int result = XGetWindowProperty(display_, root, net_active_window, 0, 1,
                                  False, XA_WINDOW, &actual_type,
                                  &actual_format, &nitems, &bytes_after, &data);

  if (result != Success || data == nullptr || nitems == 0) {
    if (data)
      XFree(data);
    return std::nullopt;
  }

  Window active_window = *reinterpret_cast<Window *>(data);
  XFree(data);

  if (active_window == None)
    return std::nullopt;

  // Получаем WM_CLASS
  XClassHint class_hint;
  if (XGetClassHint(display_, active_window, &class_hint) == 0) {
    return std::nullopt;
  }

  std::string wm_class;
  if (class_hint.res_class) {
    wm_class = class_hint.res_class;
    XFree(class_hint.res_class);
  }
  if (class_hint.res_name) {
    XFree(class_hint.res_name);
  }

  if (wm_class.empty()) {
    return std::nullopt;
  }
  return wm_class;
}

} // namespace clipdeck
