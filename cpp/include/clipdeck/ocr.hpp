/**
 * @file ocr.hpp
 * @brief Распознавание текста на изображении (внешний движок)
 */

#pragma once

#include <filesystem>
#include <string>

namespace clipdeck {

/// Распознанный текст или описание ошибки
struct OcrOutcome {
  std::string text;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

class OcrEngine {
public:
  virtual ~OcrEngine() = default;

  [[nodiscard]] virtual OcrOutcome
  recognize(const std::filesystem::path &image) = 0;
};

/**
 * @brief Движок на утилите tesseract
 *
 * Запускает "tesseract <file> stdout [-l lang]" и возвращает его вывод
 * без завершающих пробелов.
 */
class TesseractOcr final : public OcrEngine {
public:
  /// @param languages Языки tesseract ("eng+rus"); пусто = по умолчанию
  explicit TesseractOcr(std::string languages = {});

  [[nodiscard]] OcrOutcome
  recognize(const std::filesystem::path &image) override;

private:
  std::string languages_;
};

/// Экранирование аргумента для /bin/sh в одинарных кавычках
[[nodiscard]] std::string shell_quote(const std::string &arg);

} // namespace clipdeck
