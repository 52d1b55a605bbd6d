/**
 * @file sqlite_db.hpp
 * @brief Тонкая RAII-обёртка над sqlite3* и sqlite3_stmt*
 *
 * Исключения не используются: ошибки возвращаются кодом SQLite,
 * текст ошибки доступен через SqliteDb::last_error().
 */

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clipdeck {

/// Подготовленный запрос; finalize в деструкторе
class Statement {
public:
  Statement() = default;
  explicit Statement(sqlite3_stmt *stmt) noexcept : stmt_{stmt} {}
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;
  Statement(Statement &&other) noexcept;
  Statement &operator=(Statement &&other) noexcept;

  [[nodiscard]] bool valid() const noexcept { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt *handle() const noexcept { return stmt_; }

  // Индексы параметров начинаются с 1
  void bind(int idx, std::int64_t value);
  void bind(int idx, std::string_view value);
  void bind(int idx, const std::optional<std::string> &value);
  void bind(int idx, const std::optional<std::int64_t> &value);
  void bind_null(int idx);

  /// SQLITE_ROW / SQLITE_DONE / код ошибки
  [[nodiscard]] int step();

  void reset();

  [[nodiscard]] std::int64_t column_int64(int col) const;
  [[nodiscard]] std::string column_text(int col) const;
  [[nodiscard]] std::optional<std::string> column_opt_text(int col) const;
  [[nodiscard]] std::optional<std::int64_t> column_opt_int64(int col) const;

private:
  sqlite3_stmt *stmt_ = nullptr;
};

/// Соединение с базой
class SqliteDb {
public:
  SqliteDb() = default;
  ~SqliteDb();

  SqliteDb(const SqliteDb &) = delete;
  SqliteDb &operator=(const SqliteDb &) = delete;

  /**
   * @brief Открывает (создаёт) базу и настраивает PRAGMA
   * @param path Путь к файлу или ":memory:"
   * @return SQLITE_OK или код ошибки
   */
  [[nodiscard]] int open(const std::string &path);

  void close() noexcept;

  [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
  [[nodiscard]] sqlite3 *handle() const noexcept { return db_; }

  /// Выполняет SQL без результатов (миграции, BEGIN/COMMIT)
  [[nodiscard]] int exec(const char *sql);

  /// Подготавливает запрос; при ошибке Statement::valid() == false
  [[nodiscard]] Statement prepare(std::string_view sql);

  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] std::int64_t last_insert_rowid() const noexcept;
  [[nodiscard]] int changes() const noexcept;

private:
  sqlite3 *db_ = nullptr;
  std::string exec_error_;
};

/**
 * @brief Транзакция BEGIN IMMEDIATE
 *
 * Без commit() деструктор делает ROLLBACK.
 */
class Transaction {
public:
  explicit Transaction(SqliteDb &db);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  [[nodiscard]] bool begun() const noexcept { return begun_; }
  [[nodiscard]] int commit();

private:
  SqliteDb &db_;
  bool begun_ = false;
  bool finished_ = false;
};

} // namespace clipdeck
