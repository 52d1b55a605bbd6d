/**
 * @file x11_display_source.hpp
 * @brief Дисплеи X11: перечисление через XRandR, кадр через XGetImage
 *
 * Каждый вызов открывает собственное соединение с X сервером, поэтому
 * capture() безопасно вызывать параллельно.
 */

#pragma once

#include "clipdeck/display_capture.hpp"

namespace clipdeck {

class X11DisplaySource final : public DisplaySource {
public:
  X11DisplaySource() = default;

  [[nodiscard]] EnumerateOutcome enumerate() override;
  [[nodiscard]] FrameOutcome capture(const DisplayInfo &display) override;
};

} // namespace clipdeck
