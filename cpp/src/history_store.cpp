/**
 * @file history_store.cpp
 * @brief Реализация хранилища истории на SQLite
 */

#include "clipdeck/history_store.hpp"

#include <glib.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

namespace clipdeck {

namespace {

/// Приведение регистра для поиска; SQLite lower() знает только ASCII
std::string casefold(std::string_view text) {
  if (!g_utf8_validate(text.data(), static_cast<gssize>(text.size()),
                       nullptr)) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return out;
  }
  gchar *folded =
      g_utf8_casefold(text.data(), static_cast<gssize>(text.size()));
  std::string out{folded};
  g_free(folded);
  return out;
}

constexpr const char *kSchemaSql = R"(
  CREATE TABLE IF NOT EXISTS collections (
    id   INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL
  );

  CREATE TABLE IF NOT EXISTS items (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    content       TEXT NOT NULL,
    kind          TEXT NOT NULL,
    data_type     TEXT NOT NULL,
    timestamp     INTEGER NOT NULL,
    position      INTEGER NOT NULL,
    is_pinned     INTEGER NOT NULL DEFAULT 0,
    is_sensitive  INTEGER NOT NULL DEFAULT 0,
    source_app    TEXT,
    collection_id INTEGER,
    note          TEXT,
    html_content  TEXT
  );

  CREATE INDEX IF NOT EXISTS idx_items_position ON items(position DESC);
  CREATE INDEX IF NOT EXISTS idx_items_content ON items(kind, content);
  CREATE INDEX IF NOT EXISTS idx_items_collection ON items(collection_id);
)";

// Порядок колонок совпадает с row_to_item()
constexpr std::string_view kItemColumns =
    "id, content, kind, data_type, timestamp, is_pinned, is_sensitive, "
    "source_app, collection_id, note, html_content";

std::string select_items(std::string_view tail) {
  std::string sql = "SELECT ";
  sql += kItemColumns;
  sql += " FROM items ";
  sql += tail;
  return sql;
}

std::int64_t to_millis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

std::chrono::system_clock::time_point from_millis(std::int64_t ms) {
  return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

std::int64_t now_millis() { return to_millis(std::chrono::system_clock::now()); }

ClipboardItem row_to_item(const Statement &st) {
  ClipboardItem item;
  item.id = st.column_int64(0);
  item.content = st.column_text(1);
  item.kind = parse_item_kind(st.column_text(2)).value_or(ItemKind::Text);
  item.data_type = st.column_text(3);
  item.timestamp = from_millis(st.column_int64(4));
  item.is_pinned = st.column_int64(5) != 0;
  item.is_sensitive = st.column_int64(6) != 0;
  item.source_app = st.column_opt_text(7);
  item.collection_id = st.column_opt_int64(8);
  item.note = st.column_opt_text(9);
  item.html_content = st.column_opt_text(10);
  return item;
}

/// Собирает все строки выборки; false при ошибке step()
bool collect_items(Statement &st, std::vector<ClipboardItem> &out) {
  int rc = SQLITE_ROW;
  while ((rc = st.step()) == SQLITE_ROW) {
    out.push_back(row_to_item(st));
  }
  return rc == SQLITE_DONE;
}

} // namespace

// ===========================================================================
// Открытие
// ===========================================================================

StoreOutcome<std::unique_ptr<HistoryStore>>
HistoryStore::open(const std::filesystem::path &db_path) {
  StoreOutcome<std::unique_ptr<HistoryStore>> out;

  if (db_path != ":memory:" && db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      out.result = StoreResult::Io;
      out.error = "Cannot create " + db_path.parent_path().string() + ": " +
                  ec.message();
      std::cerr << "[clipdeck-store] " << out.error << "\n";
      return out;
    }
  }

  auto store = std::make_unique<HistoryStore>(OpenKey{});
  if (store->db_.open(db_path.string()) != SQLITE_OK) {
    out.result = StoreResult::Io;
    out.error = "Cannot open " + db_path.string() + ": " +
                store->db_.last_error();
    std::cerr << "[clipdeck-store] " << out.error << "\n";
    return out;
  }

  StoreStatus schema = store->create_schema();
  if (!schema.ok()) {
    out.result = schema.result;
    out.error = std::move(schema.error);
    return out;
  }

  out.value = std::move(store);
  return out;
}

StoreStatus HistoryStore::create_schema() {
  StoreStatus status;
  if (db_.exec(kSchemaSql) != SQLITE_OK) {
    status.result = fail("create schema", status.error);
  }
  return status;
}

StoreResult HistoryStore::fail(std::string_view what,
                               std::string &error) const {
  error = std::string{what} + ": " + db_.last_error();
  std::cerr << "[clipdeck-store] " << error << "\n";
  return StoreResult::Io;
}

// ===========================================================================
// Внутренние помощники (вызываются под mutex_)
// ===========================================================================

std::optional<ClipboardItem>
HistoryStore::load_item_unlocked(std::int64_t id, StoreStatus &status) const {
  Statement st = db_.prepare(select_items("WHERE id = ?"));
  if (!st.valid()) {
    status.result = fail("prepare select item", status.error);
    return std::nullopt;
  }
  st.bind(1, id);

  int rc = st.step();
  if (rc == SQLITE_ROW) {
    return row_to_item(st);
  }
  if (rc != SQLITE_DONE) {
    status.result = fail("select item", status.error);
  }
  return std::nullopt;
}

std::int64_t HistoryStore::next_position_unlocked(StoreStatus &status) const {
  Statement st = db_.prepare("SELECT COALESCE(MAX(position), 0) + 1 FROM items");
  if (!st.valid() || st.step() != SQLITE_ROW) {
    status.result = fail("next position", status.error);
    return 0;
  }
  return st.column_int64(0);
}

// ===========================================================================
// Вставка и лимит
// ===========================================================================

StoreOutcome<InsertReport> HistoryStore::insert(const ClipboardItem &item,
                                                std::uint32_t cap) {
  StoreOutcome<InsertReport> out;

  if (item.content.empty()) {
    out.result = StoreResult::InvalidArgument;
    out.error = "Empty content";
    return out;
  }
  if (cap == 0) {
    out.result = StoreResult::InvalidArgument;
    out.error = "History cap must be positive";
    return out;
  }

  std::lock_guard lock{mutex_};

  Transaction tx{db_};
  if (!tx.begun()) {
    out.result = fail("begin insert", out.error);
    return out;
  }

  StoreStatus status;
  const std::int64_t position = next_position_unlocked(status);
  if (!status.ok()) {
    out.result = status.result;
    out.error = std::move(status.error);
    return out;
  }

  const std::int64_t ts =
      item.timestamp == std::chrono::system_clock::time_point{}
          ? now_millis()
          : to_millis(item.timestamp);
  const std::string kind{to_string(item.kind)};

  // Дедупликация по (content, kind)
  std::optional<std::int64_t> existing;
  {
    Statement st = db_.prepare("SELECT id FROM items WHERE kind = ? AND "
                               "content = ? ORDER BY position DESC LIMIT 1");
    if (!st.valid()) {
      out.result = fail("prepare dedup lookup", out.error);
      return out;
    }
    st.bind(1, std::string_view{kind});
    st.bind(2, std::string_view{item.content});
    int rc = st.step();
    if (rc == SQLITE_ROW) {
      existing = st.column_int64(0);
    } else if (rc != SQLITE_DONE) {
      out.result = fail("dedup lookup", out.error);
      return out;
    }
  }

  if (existing) {
    // Новое наблюдение заменяет источник и тип; чувствительность
    // только добавляется, закрепление и коллекция сохраняются
    Statement st = db_.prepare(
        "UPDATE items SET timestamp = ?, position = ?, data_type = ?, "
        "source_app = ?, is_sensitive = MAX(is_sensitive, ?), "
        "html_content = COALESCE(?, html_content) WHERE id = ?");
    if (!st.valid()) {
      out.result = fail("prepare refresh", out.error);
      return out;
    }
    st.bind(1, ts);
    st.bind(2, position);
    st.bind(3, std::string_view{item.data_type});
    st.bind(4, item.source_app);
    st.bind(5, std::int64_t{item.is_sensitive ? 1 : 0});
    st.bind(6, item.html_content);
    st.bind(7, *existing);
    if (st.step() != SQLITE_DONE) {
      out.result = fail("refresh", out.error);
      return out;
    }
    out.value.id = *existing;
    out.value.deduplicated = true;
  } else {
    Statement st = db_.prepare(
        "INSERT INTO items (content, kind, data_type, timestamp, position, "
        "is_pinned, is_sensitive, source_app, collection_id, note, "
        "html_content) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!st.valid()) {
      out.result = fail("prepare insert", out.error);
      return out;
    }
    st.bind(1, std::string_view{item.content});
    st.bind(2, std::string_view{kind});
    st.bind(3, std::string_view{item.data_type});
    st.bind(4, ts);
    st.bind(5, position);
    st.bind(6, std::int64_t{item.is_pinned ? 1 : 0});
    st.bind(7, std::int64_t{item.is_sensitive ? 1 : 0});
    st.bind(8, item.source_app);
    st.bind(9, item.collection_id);
    st.bind(10, item.note);
    st.bind(11, item.html_content);
    if (st.step() != SQLITE_DONE) {
      out.result = fail("insert", out.error);
      return out;
    }
    out.value.id = db_.last_insert_rowid();
  }

  // Вытеснение самых старых не-исключённых элементов сверх лимита
  {
    Statement st = db_.prepare(
        select_items("WHERE is_pinned = 0 AND collection_id IS NULL "
                     "ORDER BY position DESC LIMIT -1 OFFSET ?"));
    if (!st.valid()) {
      out.result = fail("prepare prune", out.error);
      return out;
    }
    st.bind(1, static_cast<std::int64_t>(cap));
    if (!collect_items(st, out.value.evicted)) {
      out.result = fail("prune select", out.error);
      return out;
    }
  }

  if (!out.value.evicted.empty()) {
    Statement st = db_.prepare("DELETE FROM items WHERE id = ?");
    if (!st.valid()) {
      out.result = fail("prepare prune delete", out.error);
      return out;
    }
    for (const auto &victim : out.value.evicted) {
      st.bind(1, *victim.id);
      if (st.step() != SQLITE_DONE) {
        out.result = fail("prune delete", out.error);
        out.value.evicted.clear();
        return out;
      }
      st.reset();
    }
  }

  if (tx.commit() != SQLITE_OK) {
    out.result = fail("commit insert", out.error);
    out.value.evicted.clear();
    return out;
  }

  return out;
}

// ===========================================================================
// Выборка
// ===========================================================================

StoreOutcome<std::vector<ClipboardItem>>
HistoryStore::get(const HistoryQuery &query) const {
  StoreOutcome<std::vector<ClipboardItem>> out;

  const std::int64_t page = query.page == 0 ? 1 : query.page;
  const std::int64_t page_size = query.page_size;
  const std::int64_t offset = (page - 1) * page_size;

  const bool has_text = query.query && !query.query->empty();

  // Регулярка компилируется до обращения к базе: ошибка шаблона
  // не должна выглядеть как пустой результат.
  std::optional<std::regex> re;
  if (has_text && query.use_regex) {
    try {
      auto flags = std::regex::ECMAScript;
      if (!query.case_sensitive) {
        flags |= std::regex::icase;
      }
      re.emplace(*query.query, flags);
    } catch (const std::regex_error &e) {
      out.result = StoreResult::InvalidPattern;
      out.error = "Invalid pattern: " + std::string{e.what()};
      return out;
    }
  }

  if (page_size == 0) {
    return out;
  }

  // Регулярка и поиск без учёта регистра фильтруются в приложении
  const bool sql_text = has_text && !re && query.case_sensitive;
  const bool app_filter = has_text && !sql_text;
  const std::string needle =
      has_text && !re && !query.case_sensitive ? casefold(*query.query) : "";

  std::string where = "WHERE 1 = 1";
  if (query.collection_id) {
    where += " AND collection_id = ?";
  }
  if (sql_text) {
    where += " AND kind = 'text' AND instr(content, ?) > 0";
  }
  if (app_filter) {
    where += " AND kind = 'text'";
  }
  where += " ORDER BY position DESC";
  if (!app_filter) {
    where += " LIMIT ? OFFSET ?";
  }

  std::lock_guard lock{mutex_};

  Statement st = db_.prepare(select_items(where));
  if (!st.valid()) {
    out.result = fail("prepare history query", out.error);
    return out;
  }

  int idx = 1;
  if (query.collection_id) {
    st.bind(idx++, *query.collection_id);
  }
  if (sql_text) {
    st.bind(idx++, std::string_view{*query.query});
  }
  if (!app_filter) {
    st.bind(idx++, page_size);
    st.bind(idx++, offset);
  }

  if (!app_filter) {
    if (!collect_items(st, out.value)) {
      out.result = fail("history query", out.error);
      out.value.clear();
    }
    return out;
  }

  // Фильтр на стороне приложения, затем страница
  std::int64_t matched = 0;
  int rc = SQLITE_ROW;
  while ((rc = st.step()) == SQLITE_ROW) {
    ClipboardItem item = row_to_item(st);
    const bool hit = re ? std::regex_search(item.content, *re)
                        : casefold(item.content).find(needle) !=
                              std::string::npos;
    if (!hit) {
      continue;
    }
    if (matched++ < offset) {
      continue;
    }
    out.value.push_back(std::move(item));
    if (static_cast<std::int64_t>(out.value.size()) >= page_size) {
      break;
    }
  }
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    out.result = fail("history query", out.error);
    out.value.clear();
  }
  return out;
}

StoreOutcome<ClipboardItem> HistoryStore::get_item(std::int64_t id) const {
  StoreOutcome<ClipboardItem> out;
  std::lock_guard lock{mutex_};

  StoreStatus status;
  auto item = load_item_unlocked(id, status);
  if (!status.ok()) {
    out.result = status.result;
    out.error = std::move(status.error);
    return out;
  }
  if (!item) {
    out.result = StoreResult::NotFound;
    out.error = "Item " + std::to_string(id) + " not found";
    return out;
  }
  out.value = std::move(*item);
  return out;
}

StoreOutcome<std::string>
HistoryStore::get_item_content(std::int64_t id) const {
  StoreOutcome<std::string> out;
  auto item = get_item(id);
  out.result = item.result;
  out.error = std::move(item.error);
  if (item.ok()) {
    out.value = std::move(item.value.content);
  }
  return out;
}

StoreOutcome<std::int64_t> HistoryStore::count() const {
  StoreOutcome<std::int64_t> out;
  std::lock_guard lock{mutex_};

  Statement st = db_.prepare("SELECT COUNT(*) FROM items");
  if (!st.valid() || st.step() != SQLITE_ROW) {
    out.result = fail("count", out.error);
    return out;
  }
  out.value = st.column_int64(0);
  return out;
}

// ===========================================================================
// Изменение элементов
// ===========================================================================

StoreStatus HistoryStore::update_timestamp(std::int64_t id) {
  StoreStatus status;
  std::lock_guard lock{mutex_};

  const std::int64_t position = next_position_unlocked(status);
  if (!status.ok()) {
    return status;
  }

  Statement st =
      db_.prepare("UPDATE items SET timestamp = ?, position = ? WHERE id = ?");
  if (!st.valid()) {
    status.result = fail("prepare touch", status.error);
    return status;
  }
  st.bind(1, now_millis());
  st.bind(2, position);
  st.bind(3, id);
  if (st.step() != SQLITE_DONE) {
    status.result = fail("touch", status.error);
    return status;
  }
  if (db_.changes() == 0) {
    status.result = StoreResult::NotFound;
    status.error = "Item " + std::to_string(id) + " not found";
  }
  return status;
}

StoreOutcome<std::optional<ClipboardItem>>
HistoryStore::remove(std::int64_t id) {
  StoreOutcome<std::optional<ClipboardItem>> out;
  std::lock_guard lock{mutex_};

  StoreStatus status;
  auto item = load_item_unlocked(id, status);
  if (!status.ok()) {
    out.result = status.result;
    out.error = std::move(status.error);
    return out;
  }
  if (!item) {
    return out;
  }

  Statement st = db_.prepare("DELETE FROM items WHERE id = ?");
  if (!st.valid()) {
    out.result = fail("prepare delete", out.error);
    return out;
  }
  st.bind(1, id);
  if (st.step() != SQLITE_DONE) {
    out.result = fail("delete", out.error);
    return out;
  }
  out.value = std::move(item);
  return out;
}

StoreOutcome<bool> HistoryStore::toggle_flag(std::int64_t id,
                                             std::string_view column) {
  StoreOutcome<bool> out;
  std::lock_guard lock{mutex_};

  std::string sql = "UPDATE items SET ";
  sql += column;
  sql += " = 1 - ";
  sql += column;
  sql += " WHERE id = ? RETURNING ";
  sql += column;

  Statement st = db_.prepare(sql);
  if (!st.valid()) {
    out.result = fail("prepare toggle", out.error);
    return out;
  }
  st.bind(1, id);

  int rc = st.step();
  if (rc == SQLITE_DONE) {
    out.result = StoreResult::NotFound;
    out.error = "Item " + std::to_string(id) + " not found";
    return out;
  }
  if (rc != SQLITE_ROW) {
    out.result = fail("toggle", out.error);
    return out;
  }
  out.value = st.column_int64(0) != 0;
  // RETURNING: оператор завершается только после полного прохода
  if (st.step() != SQLITE_DONE) {
    out.result = fail("toggle", out.error);
  }
  return out;
}

StoreOutcome<bool> HistoryStore::toggle_sensitive(std::int64_t id) {
  return toggle_flag(id, "is_sensitive");
}

StoreOutcome<bool> HistoryStore::toggle_pin(std::int64_t id) {
  return toggle_flag(id, "is_pinned");
}

StoreStatus HistoryStore::update_content(std::int64_t id,
                                         const std::string &content,
                                         const std::string &data_type,
                                         const std::optional<std::string> &note,
                                         const std::optional<std::string> &html) {
  StoreStatus status;
  if (content.empty()) {
    status.result = StoreResult::InvalidArgument;
    status.error = "Empty content";
    return status;
  }

  std::lock_guard lock{mutex_};

  Statement st = db_.prepare("UPDATE items SET content = ?, data_type = ?, "
                             "note = ?, html_content = ? WHERE id = ?");
  if (!st.valid()) {
    status.result = fail("prepare update content", status.error);
    return status;
  }
  st.bind(1, std::string_view{content});
  st.bind(2, std::string_view{data_type});
  st.bind(3, note);
  st.bind(4, html);
  st.bind(5, id);
  if (st.step() != SQLITE_DONE) {
    status.result = fail("update content", status.error);
    return status;
  }
  if (db_.changes() == 0) {
    status.result = StoreResult::NotFound;
    status.error = "Item " + std::to_string(id) + " not found";
  }
  return status;
}

StoreOutcome<std::vector<ClipboardItem>>
HistoryStore::clear(bool keep_pinned, bool keep_collected) {
  StoreOutcome<std::vector<ClipboardItem>> out;
  std::lock_guard lock{mutex_};

  Transaction tx{db_};
  if (!tx.begun()) {
    out.result = fail("begin clear", out.error);
    return out;
  }

  constexpr std::string_view kVictims =
      "WHERE NOT ((?1 AND is_pinned = 1) OR "
      "(?2 AND collection_id IS NOT NULL))";

  {
    std::string sql{kVictims};
    sql += " ORDER BY position DESC";
    Statement st = db_.prepare(select_items(sql));
    if (!st.valid()) {
      out.result = fail("prepare clear", out.error);
      return out;
    }
    st.bind(1, std::int64_t{keep_pinned ? 1 : 0});
    st.bind(2, std::int64_t{keep_collected ? 1 : 0});
    if (!collect_items(st, out.value)) {
      out.result = fail("clear select", out.error);
      out.value.clear();
      return out;
    }
  }

  {
    std::string sql = "DELETE FROM items ";
    sql += kVictims;
    Statement st = db_.prepare(sql);
    if (!st.valid()) {
      out.result = fail("prepare clear delete", out.error);
      out.value.clear();
      return out;
    }
    st.bind(1, std::int64_t{keep_pinned ? 1 : 0});
    st.bind(2, std::int64_t{keep_collected ? 1 : 0});
    if (st.step() != SQLITE_DONE) {
      out.result = fail("clear delete", out.error);
      out.value.clear();
      return out;
    }
  }

  if (tx.commit() != SQLITE_OK) {
    out.result = fail("commit clear", out.error);
    out.value.clear();
  }
  return out;
}

// ===========================================================================
// Коллекции
// ===========================================================================

StoreOutcome<Collection>
HistoryStore::create_collection(const std::string &name) {
  StoreOutcome<Collection> out;
  if (name.empty()) {
    out.result = StoreResult::InvalidArgument;
    out.error = "Empty collection name";
    return out;
  }

  std::lock_guard lock{mutex_};

  Statement st = db_.prepare("INSERT INTO collections (name) VALUES (?)");
  if (!st.valid()) {
    out.result = fail("prepare create collection", out.error);
    return out;
  }
  st.bind(1, std::string_view{name});
  if (st.step() != SQLITE_DONE) {
    out.result = fail("create collection", out.error);
    return out;
  }
  out.value.id = db_.last_insert_rowid();
  out.value.name = name;
  return out;
}

StoreOutcome<std::vector<Collection>> HistoryStore::list_collections() const {
  StoreOutcome<std::vector<Collection>> out;
  std::lock_guard lock{mutex_};

  Statement st = db_.prepare("SELECT id, name FROM collections ORDER BY id");
  if (!st.valid()) {
    out.result = fail("prepare list collections", out.error);
    return out;
  }

  int rc = SQLITE_ROW;
  while ((rc = st.step()) == SQLITE_ROW) {
    out.value.push_back(Collection{st.column_int64(0), st.column_text(1)});
  }
  if (rc != SQLITE_DONE) {
    out.result = fail("list collections", out.error);
    out.value.clear();
  }
  return out;
}

StoreStatus HistoryStore::delete_collection(std::int64_t id) {
  StoreStatus status;
  std::lock_guard lock{mutex_};

  Transaction tx{db_};
  if (!tx.begun()) {
    status.result = fail("begin delete collection", status.error);
    return status;
  }

  {
    Statement st = db_.prepare("DELETE FROM collections WHERE id = ?");
    if (!st.valid()) {
      status.result = fail("prepare delete collection", status.error);
      return status;
    }
    st.bind(1, id);
    if (st.step() != SQLITE_DONE) {
      status.result = fail("delete collection", status.error);
      return status;
    }
    if (db_.changes() == 0) {
      status.result = StoreResult::NotFound;
      status.error = "Collection " + std::to_string(id) + " not found";
      return status;
    }
  }

  {
    Statement st = db_.prepare(
        "UPDATE items SET collection_id = NULL WHERE collection_id = ?");
    if (!st.valid()) {
      status.result = fail("prepare unlink collection", status.error);
      return status;
    }
    st.bind(1, id);
    if (st.step() != SQLITE_DONE) {
      status.result = fail("unlink collection", status.error);
      return status;
    }
  }

  if (tx.commit() != SQLITE_OK) {
    status.result = fail("commit delete collection", status.error);
  }
  return status;
}

StoreStatus
HistoryStore::set_item_collection(std::int64_t item_id,
                                  std::optional<std::int64_t> collection_id) {
  StoreStatus status;
  std::lock_guard lock{mutex_};

  if (collection_id) {
    Statement st = db_.prepare("SELECT 1 FROM collections WHERE id = ?");
    if (!st.valid()) {
      status.result = fail("prepare collection lookup", status.error);
      return status;
    }
    st.bind(1, *collection_id);
    int rc = st.step();
    if (rc == SQLITE_DONE) {
      status.result = StoreResult::NotFound;
      status.error =
          "Collection " + std::to_string(*collection_id) + " not found";
      return status;
    }
    if (rc != SQLITE_ROW) {
      status.result = fail("collection lookup", status.error);
      return status;
    }
  }

  Statement st = db_.prepare("UPDATE items SET collection_id = ? WHERE id = ?");
  if (!st.valid()) {
    status.result = fail("prepare set collection", status.error);
    return status;
  }
  st.bind(1, collection_id);
  st.bind(2, item_id);
  if (st.step() != SQLITE_DONE) {
    status.result = fail("set collection", status.error);
    return status;
  }
  if (db_.changes() == 0) {
    status.result = StoreResult::NotFound;
    status.error = "Item " + std::to_string(item_id) + " not found";
  }
  return status;
}

void remove_backing_files(const std::vector<ClipboardItem> &items) {
  for (const auto &item : items) {
    if (item.kind != ItemKind::Image || item.content.empty()) {
      continue;
    }
    std::error_code ec;
    std::filesystem::remove(item.content, ec);
    if (ec) {
      std::cerr << "[clipdeck-store] Cannot remove " << item.content << ": "
                << ec.message() << "\n";
    }
  }
}

} // namespace clipdeck
