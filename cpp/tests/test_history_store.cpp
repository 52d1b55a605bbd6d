#include "clipdeck/history_store.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

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

using clipdeck::ClipboardItem;
using clipdeck::HistoryQuery;
using clipdeck::HistoryStore;
using clipdeck::ItemKind;
using clipdeck::StoreResult;

std::unique_ptr<HistoryStore> open_memory() {
  auto opened = HistoryStore::open(":memory:");
  CHECK(opened.ok());
  CHECK(opened.value != nullptr);
  return std::move(opened.value);
}

ClipboardItem text_item(const std::string &content) {
  ClipboardItem item;
  item.content = content;
  item.kind = ItemKind::Text;
  return item;
}

std::int64_t insert_text(HistoryStore &store, const std::string &content,
                         std::uint32_t cap = 100) {
  auto inserted = store.insert(text_item(content), cap);
  CHECK(inserted.ok());
  return inserted.value.id;
}

std::vector<std::string> contents(HistoryStore &store,
                                  HistoryQuery query = {}) {
  query.page_size = 1000;
  auto page = store.get(query);
  CHECK(page.ok());
  std::vector<std::string> out;
  for (const auto &item : page.value) {
    out.push_back(item.content);
  }
  return out;
}

void test_newest_first() {
  auto store = open_memory();
  insert_text(*store, "one");
  insert_text(*store, "two");
  insert_text(*store, "three");

  auto all = contents(*store);
  CHECK(all.size() == 3);
  CHECK(all[0] == "three");
  CHECK(all[1] == "two");
  CHECK(all[2] == "one");

  auto count = store->count();
  CHECK(count.ok());
  CHECK(count.value == 3);
}

void test_duplicate_moves_to_front() {
  auto store = open_memory();
  std::int64_t first = insert_text(*store, "alpha");
  insert_text(*store, "beta");

  auto again = store->insert(text_item("alpha"), 100);
  CHECK(again.ok());
  CHECK(again.value.deduplicated);
  CHECK(again.value.id == first);

  auto all = contents(*store);
  CHECK(all.size() == 2);
  CHECK(all[0] == "alpha");
  CHECK(all[1] == "beta");

  // Тот же текст другого вида даёт отдельную запись
  ClipboardItem image = text_item("alpha");
  image.kind = ItemKind::Image;
  image.data_type = "image";
  auto other = store->insert(image, 100);
  CHECK(other.ok());
  CHECK(!other.value.deduplicated);
  CHECK(store->count().value == 3);
}

void test_duplicate_takes_new_source() {
  auto store = open_memory();

  ClipboardItem browser = text_item("hunter2");
  browser.source_app = "Firefox";
  auto first = store->insert(browser, 100);
  CHECK(first.ok());
  CHECK(store->toggle_pin(first.value.id).value);

  ClipboardItem vault = text_item("hunter2");
  vault.source_app = "KeePassXC";
  vault.is_sensitive = true;
  vault.data_type = "code";
  auto again = store->insert(vault, 100);
  CHECK(again.ok());
  CHECK(again.value.deduplicated);

  auto item = store->get_item(first.value.id);
  CHECK(item.ok());
  CHECK(item.value.is_sensitive);
  CHECK(item.value.source_app.value_or("") == "KeePassXC");
  CHECK(item.value.data_type == "code");
  CHECK(item.value.is_pinned);

  // Чувствительность не снимается повторным копированием
  ClipboardItem plain = text_item("hunter2");
  plain.source_app = "Firefox";
  CHECK(store->insert(plain, 100).ok());
  CHECK(store->get_item(first.value.id).value.is_sensitive);
}

void test_cap_evicts_oldest() {
  auto store = open_memory();
  constexpr std::uint32_t kCap = 3;

  std::vector<ClipboardItem> evicted;
  for (int i = 0; i < 5; ++i) {
    auto inserted = store->insert(text_item("item" + std::to_string(i)), kCap);
    CHECK(inserted.ok());
    for (auto &e : inserted.value.evicted) {
      evicted.push_back(e);
    }
  }

  CHECK(evicted.size() == 2);
  CHECK(evicted[0].content == "item0");
  CHECK(evicted[1].content == "item1");

  auto all = contents(*store);
  CHECK(all.size() == kCap);
  CHECK(all[0] == "item4");
  CHECK(all[2] == "item2");
}

void test_exempt_items_survive_cap() {
  auto store = open_memory();

  auto collection = store->create_collection("work");
  CHECK(collection.ok());

  // Исключённых больше, чем лимит
  std::vector<std::int64_t> exempt;
  for (int i = 0; i < 3; ++i) {
    std::int64_t id = insert_text(*store, "pinned" + std::to_string(i));
    CHECK(store->toggle_pin(id).value);
    exempt.push_back(id);
  }
  std::int64_t collected = insert_text(*store, "collected");
  CHECK(store->set_item_collection(collected, collection.value.id).ok());
  exempt.push_back(collected);

  for (int i = 0; i < 6; ++i) {
    auto inserted = store->insert(text_item("plain" + std::to_string(i)), 2);
    CHECK(inserted.ok());
    for (const auto &e : inserted.value.evicted) {
      CHECK(!e.is_exempt());
    }
  }

  for (std::int64_t id : exempt) {
    CHECK(store->get_item(id).ok());
  }

  // 4 исключённых + 2 обычных
  CHECK(store->count().value == 6);
  auto all = contents(*store);
  CHECK(all[0] == "plain5");
  CHECK(all[1] == "plain4");
}

void test_pages_do_not_overlap() {
  auto store = open_memory();
  for (int i = 0; i < 7; ++i) {
    insert_text(*store, "entry" + std::to_string(i));
  }

  HistoryQuery first;
  first.page = 1;
  first.page_size = 3;
  HistoryQuery second = first;
  second.page = 2;

  auto p1 = store->get(first);
  auto p2 = store->get(second);
  CHECK(p1.ok());
  CHECK(p2.ok());
  CHECK(p1.value.size() == 3);
  CHECK(p2.value.size() == 3);

  std::set<std::int64_t> ids;
  for (const auto &item : p1.value) {
    ids.insert(*item.id);
  }
  for (const auto &item : p2.value) {
    CHECK(ids.count(*item.id) == 0);
  }

  // page 0 трактуется как первая страница
  HistoryQuery zero = first;
  zero.page = 0;
  auto p0 = store->get(zero);
  CHECK(p0.ok());
  CHECK(p0.value.size() == 3);
  CHECK(p0.value[0].id == p1.value[0].id);
}

void test_text_search() {
  auto store = open_memory();
  insert_text(*store, "Hello World");
  insert_text(*store, "goodbye");
  insert_text(*store, "hello again");

  HistoryQuery query;
  query.query = "hello";
  auto found = contents(*store, query);
  CHECK(found.size() == 2);
  CHECK(found[0] == "hello again");
  CHECK(found[1] == "Hello World");

  query.case_sensitive = true;
  found = contents(*store, query);
  CHECK(found.size() == 1);
  CHECK(found[0] == "hello again");
}

void test_text_search_folds_cyrillic() {
  auto store = open_memory();
  insert_text(*store, "Привет, мир");
  insert_text(*store, "пока");
  insert_text(*store, "ПРИВЕТ снова");

  HistoryQuery query;
  query.query = "привет";
  auto found = contents(*store, query);
  CHECK(found.size() == 2);
  CHECK(found[0] == "ПРИВЕТ снова");
  CHECK(found[1] == "Привет, мир");

  // Страницы считаются после фильтра
  query.page = 2;
  query.page_size = 1;
  auto page = store->get(query);
  CHECK(page.ok());
  CHECK(page.value.size() == 1);
  CHECK(page.value[0].content == "Привет, мир");

  query = HistoryQuery{};
  query.query = "привет";
  query.case_sensitive = true;
  CHECK(contents(*store, query).empty());
}

void test_regex_search() {
  auto store = open_memory();
  insert_text(*store, "order 1234");
  insert_text(*store, "no digits here");
  insert_text(*store, "ORDER 99");

  HistoryQuery query;
  query.query = "order \\d+";
  query.use_regex = true;
  auto found = contents(*store, query);
  CHECK(found.size() == 2);
  CHECK(found[0] == "ORDER 99");

  query.case_sensitive = true;
  found = contents(*store, query);
  CHECK(found.size() == 1);
  CHECK(found[0] == "order 1234");
}

void test_invalid_regex_is_error() {
  auto store = open_memory();
  insert_text(*store, "something");

  HistoryQuery query;
  query.query = "([unclosed";
  query.use_regex = true;
  auto result = store->get(query);
  CHECK(!result.ok());
  CHECK(result.result == StoreResult::InvalidPattern);
  CHECK(!result.error.empty());
}

void test_toggle_pin_involution() {
  auto store = open_memory();
  std::int64_t id = insert_text(*store, "pin me");

  auto before = store->get_item(id);
  CHECK(before.ok());
  CHECK(!before.value.is_pinned);

  auto once = store->toggle_pin(id);
  CHECK(once.ok());
  CHECK(once.value);

  auto twice = store->toggle_pin(id);
  CHECK(twice.ok());
  CHECK(twice.value == before.value.is_pinned);

  auto sensitive = store->toggle_sensitive(id);
  CHECK(sensitive.ok());
  CHECK(sensitive.value);

  auto missing = store->toggle_pin(id + 100);
  CHECK(missing.result == StoreResult::NotFound);
}

void test_update_content_keeps_order() {
  auto store = open_memory();
  std::int64_t old_id = insert_text(*store, "first");
  insert_text(*store, "second");

  auto status =
      store->update_content(old_id, "first edited", "text", "a note");
  CHECK(status.ok());

  auto item = store->get_item(old_id);
  CHECK(item.ok());
  CHECK(item.value.content == "first edited");
  CHECK(item.value.note.has_value());
  CHECK(*item.value.note == "a note");

  auto all = contents(*store);
  CHECK(all[0] == "second");
  CHECK(all[1] == "first edited");

  CHECK(store->update_content(old_id + 100, "x", "text").result ==
        StoreResult::NotFound);
  CHECK(store->update_content(old_id, "", "text").result ==
        StoreResult::InvalidArgument);
}

void test_update_timestamp_moves_to_front() {
  auto store = open_memory();
  std::int64_t old_id = insert_text(*store, "old");
  insert_text(*store, "new");

  CHECK(store->update_timestamp(old_id).ok());
  CHECK(contents(*store)[0] == "old");
  CHECK(store->update_timestamp(old_id + 100).result == StoreResult::NotFound);
}

void test_clear_policy() {
  auto store = open_memory();
  auto collection = store->create_collection("keep");
  CHECK(collection.ok());

  std::int64_t pinned = insert_text(*store, "pinned");
  CHECK(store->toggle_pin(pinned).ok());
  std::int64_t collected = insert_text(*store, "collected");
  CHECK(store->set_item_collection(collected, collection.value.id).ok());
  insert_text(*store, "plain");

  // Сохраняем только закреплённые
  auto removed = store->clear(true, false);
  CHECK(removed.ok());
  CHECK(removed.value.size() == 2);
  CHECK(store->count().value == 1);
  CHECK(store->get_item(pinned).ok());

  // Всё удаляется, когда ничего не сохраняем
  insert_text(*store, "another");
  removed = store->clear(false, false);
  CHECK(removed.ok());
  CHECK(removed.value.size() == 2);
  CHECK(store->count().value == 0);
}

void test_clear_keeps_collected() {
  auto store = open_memory();
  auto collection = store->create_collection("keep");
  std::int64_t collected = insert_text(*store, "collected");
  CHECK(store->set_item_collection(collected, collection.value.id).ok());
  insert_text(*store, "plain");

  auto removed = store->clear(false, true);
  CHECK(removed.ok());
  CHECK(removed.value.size() == 1);
  CHECK(removed.value[0].content == "plain");
  CHECK(store->get_item(collected).ok());
}

void test_collections() {
  auto store = open_memory();

  auto a = store->create_collection("a");
  auto b = store->create_collection("b");
  CHECK(a.ok());
  CHECK(b.ok());
  CHECK(a.value.id != b.value.id);
  CHECK(store->create_collection("").result == StoreResult::InvalidArgument);

  auto listed = store->list_collections();
  CHECK(listed.ok());
  CHECK(listed.value.size() == 2);
  CHECK(listed.value[0].name == "a");

  std::int64_t in_a = insert_text(*store, "in a");
  insert_text(*store, "loose");
  CHECK(store->set_item_collection(in_a, a.value.id).ok());
  CHECK(store->set_item_collection(in_a, 9999).result ==
        StoreResult::NotFound);

  HistoryQuery query;
  query.collection_id = a.value.id;
  auto filtered = contents(*store, query);
  CHECK(filtered.size() == 1);
  CHECK(filtered[0] == "in a");

  // Удаление коллекции отвязывает элементы, но не удаляет их
  CHECK(store->delete_collection(a.value.id).ok());
  auto item = store->get_item(in_a);
  CHECK(item.ok());
  CHECK(!item.value.collection_id.has_value());
  CHECK(store->list_collections().value.size() == 1);
  CHECK(store->delete_collection(a.value.id).result == StoreResult::NotFound);

  // nullopt снимает привязку
  CHECK(store->set_item_collection(in_a, b.value.id).ok());
  CHECK(store->set_item_collection(in_a, std::nullopt).ok());
  CHECK(!store->get_item(in_a).value.collection_id.has_value());
}

void test_remove_image_deletes_file() {
  auto store = open_memory();

  const auto dir = std::filesystem::temp_directory_path() /
                   ("clipdeck-store-test-" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  const auto png = dir / "picture.png";
  {
    std::ofstream out{png, std::ios::binary};
    out << "not really a png";
  }

  ClipboardItem image;
  image.content = png.string();
  image.kind = ItemKind::Image;
  image.data_type = "image";
  auto inserted = store->insert(image, 100);
  CHECK(inserted.ok());
  std::int64_t text_id = insert_text(*store, png.string() + ".txt");

  auto removed = store->remove(inserted.value.id);
  CHECK(removed.ok());
  CHECK(removed.value.has_value());
  clipdeck::remove_backing_files({*removed.value});
  CHECK(!std::filesystem::exists(png));
  CHECK(!store->get_item(inserted.value.id).ok());

  // Текстовый элемент: файлов не трогаем
  const auto sibling = dir / "picture.png.txt";
  {
    std::ofstream out{sibling};
    out << "keep";
  }
  auto removed_text = store->remove(text_id);
  CHECK(removed_text.ok());
  clipdeck::remove_backing_files({*removed_text.value});
  CHECK(std::filesystem::exists(sibling));

  // Отсутствующий элемент: не ошибка, просто пусто
  auto missing = store->remove(text_id);
  CHECK(missing.ok());
  CHECK(!missing.value.has_value());

  std::filesystem::remove_all(dir);
}

void test_persistence() {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("clipdeck-db-test-" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  const auto db = dir / "nested" / "history.db";

  {
    auto opened = HistoryStore::open(db);
    CHECK(opened.ok());
    ClipboardItem item = text_item("persisted");
    item.source_app = "editor";
    item.html_content = "<b>persisted</b>";
    CHECK(opened.value->insert(item, 10).ok());
  }

  auto reopened = HistoryStore::open(db);
  CHECK(reopened.ok());
  auto all = reopened.value->get(HistoryQuery{});
  CHECK(all.ok());
  CHECK(all.value.size() == 1);
  CHECK(all.value[0].content == "persisted");
  CHECK(all.value[0].source_app.value_or("") == "editor");
  CHECK(all.value[0].html_content.value_or("") == "<b>persisted</b>");

  std::filesystem::remove_all(dir);
}

void test_invalid_arguments() {
  auto store = open_memory();
  CHECK(store->insert(text_item(""), 10).result ==
        StoreResult::InvalidArgument);
  CHECK(store->insert(text_item("x"), 0).result ==
        StoreResult::InvalidArgument);
  CHECK(store->get_item(42).result == StoreResult::NotFound);
  CHECK(store->get_item_content(42).result == StoreResult::NotFound);
}

} // namespace

#undef CHECK

int main() {
  test_newest_first();
  test_duplicate_moves_to_front();
  test_duplicate_takes_new_source();
  test_cap_evicts_oldest();
  test_exempt_items_survive_cap();
  test_pages_do_not_overlap();
  test_text_search();
  test_text_search_folds_cyrillic();
  test_regex_search();
  test_invalid_regex_is_error();
  test_toggle_pin_involution();
  test_update_content_keeps_order();
  test_update_timestamp_moves_to_front();
  test_clear_policy();
  test_clear_keeps_collected();
  test_collections();
  test_remove_image_deletes_file();
  test_persistence();
  test_invalid_arguments();

  std::cout << "OK\n";
  return 0;
}
