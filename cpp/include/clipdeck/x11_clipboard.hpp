/**
 * @file x11_clipboard.hpp
 * @brief Нативный доступ к буферу обмена X11
 *
 * Чтение идёт напрямую через X11 selections (UTF8_STRING и image/png,
 * включая INCR-передачу больших изображений). Запись идёт через xclip,
 * который остаётся владельцем selection после нашего выхода.
 */

#pragma once

#include <X11/Xlib.h>

#include <chrono>
#include <mutex>
#include <vector>

#include "clipdeck/clipboard_backend.hpp"

namespace clipdeck {

/**
 * @brief Буфер обмена X11
 *
 * Собственное соединение с X сервером и скрытое окно для получения
 * SelectionNotify. Методы сериализуются внутренним мьютексом.
 */
class X11Clipboard final : public ClipboardBackend {
public:
  explicit X11Clipboard(
      std::chrono::milliseconds timeout = std::chrono::milliseconds{500});

  ~X11Clipboard() override;

  // Запрет копирования (X11 ресурсы)
  X11Clipboard(const X11Clipboard &) = delete;
  X11Clipboard &operator=(const X11Clipboard &) = delete;

  /**
   * @brief Открывает соединение с X сервером
   * @return true если соединение установлено
   */
  bool open();

  void close();

  [[nodiscard]] bool is_open() const noexcept;

  [[nodiscard]] std::optional<std::string> read_text() override;
  [[nodiscard]] std::optional<RawImage> read_image() override;

  ClipboardResult write_text(std::string_view text,
                             const std::optional<std::string> &html) override;
  ClipboardResult write_png(std::span<const std::uint8_t> png) override;

  [[nodiscard]] std::optional<std::string> active_window_class() override;

private:
  /// Запрашивает конвертацию CLIPBOARD в target и читает результат
  [[nodiscard]] std::optional<std::vector<std::uint8_t>>
  convert_selection(Atom target);

  /// Ожидание SelectionNotify; false при таймауте или отказе владельца
  bool wait_for_selection_notify();

  /// Ожидание PropertyNotify(NewValue) для INCR
  bool wait_for_property_new_value(Atom property);

  /// Читает свойство целиком (с учётом bytes_after) и удаляет его
  bool read_property(Atom property, std::vector<std::uint8_t> &out,
                     Atom &type);

  [[nodiscard]] bool has_target(Atom target);

  std::chrono::milliseconds timeout_;
  std::mutex mutex_;

  Display *display_ = nullptr;
  Window window_ = None;

  // X11 атомы (кэшируются после открытия)
  Atom atom_clipboard_ = None;
  Atom atom_utf8_string_ = None;
  Atom atom_targets_ = None;
  Atom atom_png_ = None;
  Atom atom_incr_ = None;
  Atom atom_property_ = None;
};

} // namespace clipdeck
