/**
 * @file sqlite_db.cpp
 * @brief Реализация обёртки SQLite
 */

#include "clipdeck/sqlite_db.hpp"

#include <iostream>
#include <utility>

namespace clipdeck {

// ===========================================================================
// Statement
// ===========================================================================

Statement::~Statement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement &&other) noexcept
    : stmt_{std::exchange(other.stmt_, nullptr)} {}

Statement &Statement::operator=(Statement &&other) noexcept {
  if (this != &other) {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

void Statement::bind(int idx, std::int64_t value) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
}

void Statement::bind(int idx, std::string_view value) {
  sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void Statement::bind(int idx, const std::optional<std::string> &value) {
  if (value) {
    bind(idx, std::string_view{*value});
  } else {
    bind_null(idx);
  }
}

void Statement::bind(int idx, const std::optional<std::int64_t> &value) {
  if (value) {
    bind(idx, *value);
  } else {
    bind_null(idx);
  }
}

void Statement::bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

int Statement::step() { return sqlite3_step(stmt_); }

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::column_int64(int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

std::string Statement::column_text(int col) const {
  const unsigned char *t = sqlite3_column_text(stmt_, col);
  if (!t) {
    return {};
  }
  return std::string{reinterpret_cast<const char *>(t),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col))};
}

std::optional<std::string> Statement::column_opt_text(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(col);
}

std::optional<std::int64_t> Statement::column_opt_int64(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_int64(col);
}

// ===========================================================================
// SqliteDb
// ===========================================================================

SqliteDb::~SqliteDb() { close(); }

int SqliteDb::open(const std::string &path) {
  close();

  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    exec_error_ = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return rc;
  }

  // WAL для файловой базы; для :memory: SQLite молча оставит "memory"
  rc = exec("PRAGMA journal_mode=WAL;");
  if (rc != SQLITE_OK) {
    std::cerr << "[clipdeck-store] WAL not enabled: " << last_error() << "\n";
  }
  rc = exec("PRAGMA synchronous=NORMAL;");
  if (rc != SQLITE_OK) {
    return rc;
  }
  return sqlite3_busy_timeout(db_, 5000);
}

void SqliteDb::close() noexcept {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

int SqliteDb::exec(const char *sql) {
  char *err = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    exec_error_ = err ? err : "sqlite exec failed";
  } else {
    exec_error_.clear();
  }
  sqlite3_free(err);
  return rc;
}

Statement SqliteDb::prepare(std::string_view sql) {
  sqlite3_stmt *stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                              &stmt, nullptr);
  if (rc != SQLITE_OK) {
    exec_error_ = sqlite3_errmsg(db_);
    if (stmt) {
      sqlite3_finalize(stmt);
    }
    return Statement{};
  }
  exec_error_.clear();
  return Statement{stmt};
}

std::string SqliteDb::last_error() const {
  if (!exec_error_.empty()) {
    return exec_error_;
  }
  return db_ ? sqlite3_errmsg(db_) : "database is not open";
}

std::int64_t SqliteDb::last_insert_rowid() const noexcept {
  return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

int SqliteDb::changes() const noexcept { return sqlite3_changes(db_); }

// ===========================================================================
// Transaction
// ===========================================================================

Transaction::Transaction(SqliteDb &db) : db_{db} {
  begun_ = db_.exec("BEGIN IMMEDIATE;") == SQLITE_OK;
}

Transaction::~Transaction() {
  if (begun_ && !finished_) {
    if (db_.exec("ROLLBACK;") != SQLITE_OK) {
      std::cerr << "[clipdeck-store] Rollback failed: " << db_.last_error()
                << "\n";
    }
  }
}

int Transaction::commit() {
  int rc = db_.exec("COMMIT;");
  if (rc == SQLITE_OK) {
    finished_ = true;
  }
  return rc;
}

} // namespace clipdeck
