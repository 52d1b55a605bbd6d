/**
 * @file image_codec.cpp
 * @brief Реализация PNG-кодека на gdk-pixbuf
 */

#include "clipdeck/image_codec.hpp"
#include "clipdeck/hasher.hpp"

#include <gdk-pixbuf/gdk-pixbuf.h>
#include <glib.h>

#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>

namespace clipdeck {

namespace {

std::string take_error(GError *err, std::string_view fallback) {
  if (!err) {
    return std::string{fallback};
  }
  std::string msg = err->message ? err->message : std::string{fallback};
  g_error_free(err);
  return msg;
}

/// Копирует пиксели GdkPixbuf в плотный RGBA-буфер
RawImage pixbuf_to_rgba(GdkPixbuf *pixbuf) {
  GdkPixbuf *rgba = pixbuf;
  const bool converted = !gdk_pixbuf_get_has_alpha(pixbuf);
  if (converted) {
    rgba = gdk_pixbuf_add_alpha(pixbuf, FALSE, 0, 0, 0);
  }

  RawImage image;
  if (!rgba) {
    return image;
  }

  const int width = gdk_pixbuf_get_width(rgba);
  const int height = gdk_pixbuf_get_height(rgba);
  const int stride = gdk_pixbuf_get_rowstride(rgba);
  const guchar *pixels = gdk_pixbuf_read_pixels(rgba);

  image.width = static_cast<std::uint32_t>(width);
  image.height = static_cast<std::uint32_t>(height);

  const std::size_t row_bytes = static_cast<std::size_t>(width) * 4U;
  image.rgba.resize(row_bytes * static_cast<std::size_t>(height));
  for (int y = 0; y < height; ++y) {
    std::memcpy(image.rgba.data() + static_cast<std::size_t>(y) * row_bytes,
                pixels + static_cast<std::size_t>(y) *
                             static_cast<std::size_t>(stride),
                row_bytes);
  }

  if (converted) {
    g_object_unref(rgba);
  }
  return image;
}

} // namespace

EncodeOutcome encode_png(const RawImage &image) {
  EncodeOutcome out;

  if (image.empty() ||
      image.rgba.size() <
          static_cast<std::size_t>(image.width) * image.height * 4U) {
    out.error = "Invalid image buffer";
    return out;
  }

  // gdk-pixbuf не меняет данные при сохранении, const_cast безопасен
  GdkPixbuf *pixbuf = gdk_pixbuf_new_from_data(
      const_cast<guchar *>(image.rgba.data()), GDK_COLORSPACE_RGB, TRUE, 8,
      static_cast<int>(image.width), static_cast<int>(image.height),
      static_cast<int>(image.width * 4U), nullptr, nullptr);
  if (!pixbuf) {
    out.error = "gdk_pixbuf_new_from_data failed";
    return out;
  }

  gchar *buf = nullptr;
  gsize len = 0;
  GError *err = nullptr;
  const gboolean saved =
      gdk_pixbuf_save_to_buffer(pixbuf, &buf, &len, "png", &err, nullptr);
  g_object_unref(pixbuf);

  if (!saved) {
    out.error = take_error(err, "PNG encode failed");
    g_free(buf);
    return out;
  }

  out.bytes.assign(reinterpret_cast<const std::uint8_t *>(buf),
                   reinterpret_cast<const std::uint8_t *>(buf) + len);
  g_free(buf);
  return out;
}

DecodeOutcome decode_image(std::span<const std::uint8_t> data) {
  DecodeOutcome out;

  if (data.empty()) {
    out.error = "Empty image data";
    return out;
  }

  GdkPixbufLoader *loader = gdk_pixbuf_loader_new();
  GError *err = nullptr;

  if (!gdk_pixbuf_loader_write(loader, data.data(), data.size(), &err)) {
    out.error = take_error(err, "Image decode failed");
    // close обязателен даже после ошибки write
    GError *close_err = nullptr;
    gdk_pixbuf_loader_close(loader, &close_err);
    if (close_err) {
      g_error_free(close_err);
    }
    g_object_unref(loader);
    return out;
  }

  if (!gdk_pixbuf_loader_close(loader, &err)) {
    out.error = take_error(err, "Image decode failed");
    g_object_unref(loader);
    return out;
  }

  // pixbuf принадлежит loader'у
  GdkPixbuf *pixbuf = gdk_pixbuf_loader_get_pixbuf(loader);
  if (!pixbuf) {
    out.error = "Image decode produced no pixels";
    g_object_unref(loader);
    return out;
  }

  out.image = pixbuf_to_rgba(pixbuf);
  g_object_unref(loader);

  if (out.image.empty()) {
    out.error = "Image decode produced no pixels";
  }
  return out;
}

std::string write_bytes_file(std::span<const std::uint8_t> bytes,
                             const std::filesystem::path &path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return "Cannot create " + path.parent_path().string() + ": " +
             ec.message();
    }
  }

  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream file{tmp_path, std::ios::binary | std::ios::trunc};
    if (!file.is_open()) {
      return "Cannot write " + tmp_path.string();
    }
    file.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file.good()) {
      return "Write failed: " + tmp_path.string();
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return "Cannot replace " + path.string() + ": " + ec.message();
  }
  return {};
}

std::string write_png_file(const RawImage &image,
                           const std::filesystem::path &path) {
  EncodeOutcome png = encode_png(image);
  if (!png.ok()) {
    return png.error;
  }
  return write_bytes_file(png.bytes, path);
}

DecodeOutcome load_image_file(const std::filesystem::path &path) {
  DecodeOutcome out;

  std::ifstream file{path, std::ios::binary};
  if (!file.is_open()) {
    out.error = "Cannot open " + path.string();
    return out;
  }

  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
  return decode_image(bytes);
}

namespace {

bool is_base64_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

/// g_base64_decode не проверяет вход: алфавит и '=' проверяем сами
bool is_valid_base64(std::string_view encoded) {
  std::size_t symbols = 0;
  std::size_t padding = 0;
  for (char c : encoded) {
    if (c == '\n' || c == '\r' || c == ' ' || c == '\t') {
      continue;
    }
    if (c == '=') {
      ++padding;
      continue;
    }
    // После '=' данных быть не может
    if (padding > 0 || !is_base64_char(c)) {
      return false;
    }
    ++symbols;
  }
  return symbols > 0 && padding <= 2 && (symbols + padding) % 4 == 0;
}

} // namespace

std::vector<std::uint8_t> decode_base64_payload(std::string_view payload) {
  // data:image/png;base64,<данные>
  if (payload.starts_with("data:")) {
    auto comma = payload.find(',');
    if (comma == std::string_view::npos) {
      return {};
    }
    payload.remove_prefix(comma + 1);
  }

  std::string encoded{payload};
  if (!is_valid_base64(encoded)) {
    return {};
  }

  gsize len = 0;
  guchar *raw = g_base64_decode(encoded.c_str(), &len);
  if (!raw) {
    return {};
  }
  std::vector<std::uint8_t> out(raw, raw + len);
  g_free(raw);
  return out;
}

std::uint64_t pixel_hash(const RawImage &image) {
  std::uint64_t hash = Hasher::hash_bytes(image.rgba);
  hash ^= image.width;
  hash *= Hasher::kFnvPrime;
  hash ^= image.height;
  hash *= Hasher::kFnvPrime;
  return hash;
}

std::string image_file_name(const RawImage &image) {
  return Hasher::to_hex(pixel_hash(image)) + ".png";
}

} // namespace clipdeck
