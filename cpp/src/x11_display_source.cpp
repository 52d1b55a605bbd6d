/**
 * @file x11_display_source.cpp
 * @brief Реализация источника дисплеев X11
 */

#include "clipdeck/x11_display_source.hpp"

#include <X11/Xlib.h>
#include <X11/Xresource.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

#include <cstdlib>
#include <string>

namespace clipdeck {

namespace {

/// Базовое значение DPI, соответствующее масштабу 1.0
constexpr double kBaseDpi = 96.0;

/// Масштаб из ресурса Xft.dpi (глобальный для X11)
double read_scale_factor(Display *display) {
  const char *resources = XResourceManagerString(display);
  if (!resources) {
    return 1.0;
  }

  XrmInitialize();
  XrmDatabase db = XrmGetStringDatabase(resources);
  if (!db) {
    return 1.0;
  }

  double scale = 1.0;
  char *type = nullptr;
  XrmValue value;
  if (XrmGetResource(db, "Xft.dpi", "Xft.Dpi", &type, &value) && value.addr) {
    const double dpi = std::strtod(value.addr, nullptr);
    if (dpi > kBaseDpi) {
      scale = dpi / kBaseDpi;
    }
  }
  XrmDestroyDatabase(db);
  return scale;
}

/// Позиция младшего установленного бита маски
int mask_shift(unsigned long mask) {
  int shift = 0;
  while (mask != 0 && (mask & 1UL) == 0) {
    mask >>= 1;
    ++shift;
  }
  return shift;
}

/// Значение канала, приведённое к 8 битам
std::uint8_t channel(unsigned long pixel, unsigned long mask, int shift) {
  const unsigned long max = mask >> shift;
  const unsigned long v = (pixel & mask) >> shift;
  if (max == 0) {
    return 0;
  }
  return static_cast<std::uint8_t>((v * 255UL) / max);
}

/// XImage (ZPixmap) -> плотный RGBA
RawImage ximage_to_rgba(XImage *image) {
  RawImage out;
  out.width = static_cast<std::uint32_t>(image->width);
  out.height = static_cast<std::uint32_t>(image->height);
  out.rgba.resize(static_cast<std::size_t>(out.width) * out.height * 4U);

  const bool fast_bgrx = image->bits_per_pixel == 32 &&
                         image->byte_order == LSBFirst &&
                         image->red_mask == 0xFF0000UL &&
                         image->green_mask == 0x00FF00UL &&
                         image->blue_mask == 0x0000FFUL;

  const int rs = mask_shift(image->red_mask);
  const int gs = mask_shift(image->green_mask);
  const int bs = mask_shift(image->blue_mask);

  for (int y = 0; y < image->height; ++y) {
    const auto *row = reinterpret_cast<const std::uint8_t *>(image->data) +
                      static_cast<std::size_t>(y) *
                          static_cast<std::size_t>(image->bytes_per_line);
    std::uint8_t *dst =
        out.rgba.data() + static_cast<std::size_t>(y) * out.width * 4U;

    for (int x = 0; x < image->width; ++x) {
      if (fast_bgrx) {
        const std::uint8_t *px = row + static_cast<std::size_t>(x) * 4U;
        dst[0] = px[2];
        dst[1] = px[1];
        dst[2] = px[0];
      } else {
        const unsigned long pixel = XGetPixel(image, x, y);
        dst[0] = channel(pixel, image->red_mask, rs);
        dst[1] = channel(pixel, image->green_mask, gs);
        dst[2] = channel(pixel, image->blue_mask, bs);
      }
      dst[3] = 0xFF;
      dst += 4;
    }
  }
  return out;
}

} // namespace

EnumerateOutcome X11DisplaySource::enumerate() {
  EnumerateOutcome out;

  Display *display = XOpenDisplay(nullptr);
  if (!display) {
    out.error = "Cannot open X display";
    return out;
  }

  int event_base = 0;
  int error_base = 0;
  Window root = DefaultRootWindow(display);
  const double scale = read_scale_factor(display);

  if (!XRRQueryExtension(display, &event_base, &error_base)) {
    // Без XRandR весь экран считается одним дисплеем
    const int screen = DefaultScreen(display);
    DisplayInfo info;
    info.id = 0;
    info.name = "default";
    info.width = static_cast<std::uint32_t>(DisplayWidth(display, screen));
    info.height = static_cast<std::uint32_t>(DisplayHeight(display, screen));
    info.scale_factor = scale;
    out.displays.push_back(std::move(info));
    XCloseDisplay(display);
    return out;
  }

  int count = 0;
  XRRMonitorInfo *monitors = XRRGetMonitors(display, root, True, &count);
  if (!monitors) {
    out.error = "XRRGetMonitors failed";
    XCloseDisplay(display);
    return out;
  }

  for (int i = 0; i < count; ++i) {
    const XRRMonitorInfo &m = monitors[i];

    DisplayInfo info;
    // Идентификатор выхода (RROutput) стабилен между захватами
    info.id = m.noutput > 0 ? static_cast<std::uint32_t>(m.outputs[0])
                            : static_cast<std::uint32_t>(i);
    if (m.name != None) {
      char *name = XGetAtomName(display, m.name);
      if (name) {
        info.name = name;
        XFree(name);
      }
    }
    info.x = m.x;
    info.y = m.y;
    info.width = static_cast<std::uint32_t>(m.width);
    info.height = static_cast<std::uint32_t>(m.height);
    info.scale_factor = scale;
    out.displays.push_back(std::move(info));
  }

  XRRFreeMonitors(monitors);
  XCloseDisplay(display);
  return out;
}

FrameOutcome X11DisplaySource::capture(const DisplayInfo &info) {
  FrameOutcome out;

  Display *display = XOpenDisplay(nullptr);
  if (!display) {
    out.error = "Cannot open X display";
    return out;
  }

  XImage *image =
      XGetImage(display, DefaultRootWindow(display), info.x, info.y,
                info.width, info.height, AllPlanes, ZPixmap);
  if (!image) {
    out.error = "XGetImage failed for display " + std::to_string(info.id);
    XCloseDisplay(display);
    return out;
  }

  out.image = ximage_to_rgba(image);
  XDestroyImage(image);
  XCloseDisplay(display);
  return out;
}

} // namespace clipdeck
