/**
 * @file content_classifier.cpp
 * @brief Реализация классификатора содержимого
 */

#include "clipdeck/content_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>

namespace clipdeck {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

bool starts_with_ci(std::string_view sv, std::string_view prefix) {
  if (sv.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(sv[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

bool has_whitespace(std::string_view sv) {
  return std::any_of(sv.begin(), sv.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

bool is_hex(std::string_view sv) {
  return std::all_of(sv.begin(), sv.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  });
}

constexpr std::array kUrlSchemes = {"http://", "https://", "ftp://",
                                    "file://"};

constexpr std::array kCodeKeywords = {
    "#include", "#define", "import ",  "from ",   "def ",    "class ",
    "fn ",      "func ",   "function ", "const ", "let ",    "var ",
    "public ",  "private ", "return ",  "struct ", "package ", "using ",
    "template", "SELECT ", "INSERT ",  "UPDATE ", "if (",    "for ("};

} // namespace

bool is_color(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty()) {
    return false;
  }

  if (sv.front() == '#') {
    std::string_view hex = sv.substr(1);
    const std::size_t n = hex.size();
    return (n == 3 || n == 4 || n == 6 || n == 8) && is_hex(hex);
  }

  if (sv.back() != ')' || has_whitespace(sv.substr(0, 4))) {
    return false;
  }
  return starts_with_ci(sv, "rgb(") || starts_with_ci(sv, "rgba(") ||
         starts_with_ci(sv, "hsl(") || starts_with_ci(sv, "hsla(");
}

bool is_url(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty() || has_whitespace(sv)) {
    return false;
  }

  for (std::string_view scheme : kUrlSchemes) {
    if (starts_with_ci(sv, scheme)) {
      return sv.size() > scheme.size();
    }
  }

  if (starts_with_ci(sv, "www.")) {
    std::string_view rest = sv.substr(4);
    auto dot = rest.find('.');
    return dot != std::string_view::npos && dot > 0 && dot + 1 < rest.size();
  }

  return false;
}

bool is_email(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty() || has_whitespace(sv)) {
    return false;
  }

  auto at = sv.find('@');
  if (at == std::string_view::npos || at == 0 ||
      sv.find('@', at + 1) != std::string_view::npos) {
    return false;
  }

  std::string_view domain = sv.substr(at + 1);
  auto dot = domain.rfind('.');
  return dot != std::string_view::npos && dot > 0 && dot + 1 < domain.size();
}

bool looks_like_code(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty()) {
    return false;
  }

  int signals = 0;
  std::size_t lines = 0;
  bool keyword_seen = false;
  bool semicolon_eol = false;
  bool indented = false;

  std::size_t start = 0;
  while (start <= sv.size()) {
    std::size_t end = sv.find('\n', start);
    if (end == std::string_view::npos) {
      end = sv.size();
    }
    std::string_view line = sv.substr(start, end - start);
    ++lines;

    if (!line.empty() && (line.front() == '\t' || starts_with_ci(line, "  "))) {
      indented = true;
    }

    std::string_view t = trim(line);
    if (!t.empty() && (t.back() == ';' || t.back() == '{')) {
      semicolon_eol = true;
    }
    for (std::string_view kw : kCodeKeywords) {
      if (t.substr(0, kw.size()) == kw) {
        keyword_seen = true;
        break;
      }
    }

    start = end + 1;
  }

  if (sv.find('{') != std::string_view::npos &&
      sv.find('}') != std::string_view::npos) {
    ++signals;
  }
  if (semicolon_eol) {
    ++signals;
  }
  if (keyword_seen) {
    ++signals;
  }
  if (lines > 1 && indented) {
    ++signals;
  }
  if (sv.find("=>") != std::string_view::npos ||
      sv.find("->") != std::string_view::npos ||
      sv.find("::") != std::string_view::npos ||
      sv.find("==") != std::string_view::npos) {
    ++signals;
  }

  return signals >= 2;
}

std::string_view classify_content(std::string_view content) {
  if (trim(content).empty()) {
    return kDataTypeText;
  }
  if (is_color(content)) {
    return kDataTypeColor;
  }
  if (is_url(content)) {
    return kDataTypeUrl;
  }
  if (is_email(content)) {
    return kDataTypeEmail;
  }
  if (looks_like_code(content)) {
    return kDataTypeCode;
  }
  return kDataTypeText;
}

} // namespace clipdeck
