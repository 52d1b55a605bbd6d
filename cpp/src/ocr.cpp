/**
 * @file ocr.cpp
 * @brief Реализация OCR через tesseract
 */

#include "clipdeck/ocr.hpp"

#include <sys/wait.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <iostream>

namespace clipdeck {

namespace {

/// Код возврата /bin/sh, когда команда не найдена
constexpr int kCommandNotFound = 127;

void trim_right(std::string &s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.pop_back();
  }
}

} // namespace

std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

TesseractOcr::TesseractOcr(std::string languages)
    : languages_{std::move(languages)} {}

OcrOutcome TesseractOcr::recognize(const std::filesystem::path &image) {
  OcrOutcome out;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(image, ec)) {
    out.error = "Image not found: " + image.string();
    return out;
  }

  std::string cmd = "tesseract " + shell_quote(image.string()) + " stdout";
  if (!languages_.empty()) {
    cmd += " -l " + shell_quote(languages_);
  }
  cmd += " 2>/dev/null";

  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    out.error = "Cannot start tesseract";
    return out;
  }

  std::array<char, 4096> buffer{};
  std::size_t n = 0;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    out.text.append(buffer.data(), n);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    out.error = "tesseract did not finish";
    out.text.clear();
    return out;
  }

  const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (code == kCommandNotFound) {
    out.error = "tesseract is not installed";
    out.text.clear();
    return out;
  }
  if (code != 0) {
    out.error = "tesseract failed (exit " + std::to_string(code) + ")";
    out.text.clear();
    std::cerr << "[clipdeck] OCR: " << out.error << "\n";
    return out;
  }

  trim_right(out.text);
  if (out.text.empty()) {
    out.error = "No text recognized";
  }
  return out;
}

} // namespace clipdeck
