#include "clipdeck/content_classifier.hpp"

#include <cstdlib>
#include <iostream>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using clipdeck::classify_content;

void test_colors() {
  CHECK(clipdeck::is_color("#fff"));
  CHECK(clipdeck::is_color("#FFAA00"));
  CHECK(clipdeck::is_color("#ffaa0080"));
  CHECK(clipdeck::is_color("  rgb(255, 0, 0) "));
  CHECK(clipdeck::is_color("hsla(120, 100%, 50%, 0.3)"));

  CHECK(!clipdeck::is_color("#ffff0"));
  CHECK(!clipdeck::is_color("#ggg"));
  CHECK(!clipdeck::is_color("rgb(1,2,3"));
  CHECK(!clipdeck::is_color("#"));

  CHECK(classify_content("#1e1e1e") == clipdeck::kDataTypeColor);
}

void test_urls() {
  CHECK(clipdeck::is_url("https://example.com/path?q=1"));
  CHECK(clipdeck::is_url("HTTP://EXAMPLE.COM"));
  CHECK(clipdeck::is_url("ftp://files.example.org"));
  CHECK(clipdeck::is_url("www.example.com"));

  CHECK(!clipdeck::is_url("https://"));
  CHECK(!clipdeck::is_url("see https://example.com"));
  CHECK(!clipdeck::is_url("www.example"));

  CHECK(classify_content("https://example.com") == clipdeck::kDataTypeUrl);
}

void test_emails() {
  CHECK(clipdeck::is_email("user@example.com"));
  CHECK(clipdeck::is_email(" first.last+tag@mail.example.org "));

  CHECK(!clipdeck::is_email("@example.com"));
  CHECK(!clipdeck::is_email("user@example"));
  CHECK(!clipdeck::is_email("a@b@c.com"));
  CHECK(!clipdeck::is_email("user @example.com"));

  CHECK(classify_content("user@example.com") == clipdeck::kDataTypeEmail);
}

void test_code() {
  CHECK(clipdeck::looks_like_code("int main() {\n  return 0;\n}"));
  CHECK(clipdeck::looks_like_code("#include <vector>\nstd::vector<int> v;"));
  CHECK(clipdeck::looks_like_code("const add = (a, b) => a + b;"));
  CHECK(clipdeck::looks_like_code("def f(x):\n    return x == 1"));

  CHECK(!clipdeck::looks_like_code("Just a normal sentence."));
  CHECK(!clipdeck::looks_like_code("Meeting at 10; bring notes"));

  CHECK(classify_content("for (int i = 0; i < n; ++i) {\n  sum += i;\n}") ==
        clipdeck::kDataTypeCode);
}

void test_plain_text() {
  CHECK(classify_content("Hello, world") == clipdeck::kDataTypeText);
  CHECK(classify_content("") == clipdeck::kDataTypeText);
  CHECK(classify_content("   ") == clipdeck::kDataTypeText);
  CHECK(classify_content("Привет, мир") == clipdeck::kDataTypeText);
}

} // namespace

#undef CHECK

int main() {
  test_colors();
  test_urls();
  test_emails();
  test_code();
  test_plain_text();

  std::cout << "OK\n";
  return 0;
}
