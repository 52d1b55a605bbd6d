/**
 * @file display_capture.hpp
 * @brief Параллельный захват всех подключённых дисплеев
 *
 * DisplaySource перечисляет дисплеи и снимает кадр одного из них;
 * DisplayCaptureService запускает по потоку на дисплей, кодирует кадры
 * в PNG и собирает успешные результаты.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "clipdeck/types.hpp"

namespace clipdeck {

/// Описание подключённого дисплея (геометрия в физических пикселях)
struct DisplayInfo {
  std::uint32_t id = 0;
  std::string name;
  std::int32_t x = 0;
  std::int32_t y = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  double scale_factor = 1.0;
};

struct EnumerateOutcome {
  std::vector<DisplayInfo> displays;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

struct FrameOutcome {
  RawImage image;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/**
 * @brief Источник дисплеев
 *
 * capture() вызывается одновременно из нескольких потоков,
 * реализация обязана это допускать.
 */
class DisplaySource {
public:
  virtual ~DisplaySource() = default;

  [[nodiscard]] virtual EnumerateOutcome enumerate() = 0;
  [[nodiscard]] virtual FrameOutcome capture(const DisplayInfo &display) = 0;
};

/// Итог захвата: успешные результаты или ошибка
struct CaptureOutcome {
  std::vector<CaptureResult> results;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

class DisplayCaptureService {
public:
  explicit DisplayCaptureService(DisplaySource &source);

  /**
   * @brief Снимает все дисплеи
   *
   * Один std::jthread на дисплей; файлы "screenshot_<id>_<epoch ms>.png"
   * пишутся в output_dir. Ошибка отдельного дисплея логируется и
   * пропускается. Ошибка возвращается, если дисплеев нет или не удался
   * ни один снимок.
   */
  [[nodiscard]] CaptureOutcome
  capture_all(const std::filesystem::path &output_dir);

private:
  DisplaySource &source_;
};

/// Имя файла снимка: "screenshot_<id>_<epoch ms>.png"
[[nodiscard]] std::string screenshot_file_name(std::uint32_t display_id,
                                               std::int64_t epoch_ms);

} // namespace clipdeck
