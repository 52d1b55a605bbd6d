#include "clipdeck/key_combo.hpp"

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

using clipdeck::KeyCombo;
using clipdeck::parse_key_combo;

void test_default_shortcut() {
  auto combo = parse_key_combo("Ctrl+Shift+V");
  CHECK(combo.has_value());
  CHECK(combo->modifiers == (clipdeck::kModCtrl | clipdeck::kModShift));
  CHECK(combo->key == "V");
  CHECK(clipdeck::format_key_combo(*combo) == "Ctrl+Shift+V");
}

void test_modifier_aliases() {
  auto a = parse_key_combo("control+shift+v");
  auto b = parse_key_combo("CommandOrControl+Shift+V");
  auto c = parse_key_combo("CmdOrCtrl + Shift + v");
  CHECK(a && b && c);
  CHECK(*a == *b);
  CHECK(*b == *c);

  auto super = parse_key_combo("Super+Space");
  CHECK(super.has_value());
  CHECK(super->modifiers == clipdeck::kModSuper);
  CHECK(super->key == "space");
  CHECK(parse_key_combo("Meta+Space") == super);
  CHECK(parse_key_combo("Cmd+Space") == super);

  auto alt = parse_key_combo("Alt+Option+Tab");
  CHECK(alt.has_value());
  CHECK(alt->modifiers == clipdeck::kModAlt);
  CHECK(alt->key == "Tab");
}

void test_named_keys() {
  CHECK(parse_key_combo("Ctrl+Enter")->key == "Return");
  CHECK(parse_key_combo("Ctrl+Esc")->key == "Escape");
  CHECK(parse_key_combo("Shift+PageUp")->key == "Prior");
  CHECK(parse_key_combo("Print")->key == "Print");
  CHECK(parse_key_combo("Ctrl+`")->key == "grave");
  CHECK(parse_key_combo("Alt+F12")->key == "F12");
  CHECK(parse_key_combo("Ctrl+1")->key == "1");
  CHECK(parse_key_combo("F5")->modifiers == clipdeck::kModNone);
}

void test_invalid_combos() {
  CHECK(!parse_key_combo(""));
  CHECK(!parse_key_combo("   "));
  CHECK(!parse_key_combo("Ctrl+Shift"));
  CHECK(!parse_key_combo("Ctrl++V"));
  CHECK(!parse_key_combo("Ctrl+V+X"));
  CHECK(!parse_key_combo("Hyper+V"));
  CHECK(!parse_key_combo("Ctrl+F25"));
  CHECK(!parse_key_combo("Ctrl+F0"));
}

void test_format_order() {
  KeyCombo combo;
  combo.modifiers = clipdeck::kModSuper | clipdeck::kModAlt | clipdeck::kModCtrl;
  combo.key = "H";
  CHECK(clipdeck::format_key_combo(combo) == "Ctrl+Alt+Super+H");
}

} // namespace

#undef CHECK

int main() {
  test_default_shortcut();
  test_modifier_aliases();
  test_named_keys();
  test_invalid_combos();
  test_format_order();

  std::cout << "OK\n";
  return 0;
}
