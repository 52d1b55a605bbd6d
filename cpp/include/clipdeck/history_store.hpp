/**
 * @file history_store.hpp
 * @brief Персистентная история буфера обмена на SQLite
 *
 * Порядок: новые сверху (монотонный счётчик position). Повторная вставка
 * того же (content, kind) поднимает существующую запись наверх.
 * Лимит истории считает только не-исключённые элементы: закреплённые и
 * входящие в коллекции никогда не вытесняются.
 *
 * Потокобезопасность: все операции сериализуются внутренним мьютексом.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "clipdeck/sqlite_db.hpp"
#include "clipdeck/types.hpp"

namespace clipdeck {

/// Код результата + сообщение для операций без значения
struct StoreStatus {
  StoreResult result = StoreResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == StoreResult::Ok; }
};

/// Значение + код результата + сообщение
template <typename T> struct StoreOutcome {
  T value{};
  StoreResult result = StoreResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == StoreResult::Ok; }
};

/// Параметры выборки истории
struct HistoryQuery {
  std::uint32_t page = 1; // с единицы; 0 трактуется как 1
  std::uint32_t page_size = 50;
  std::optional<std::string> query; // фильтр по тексту (только text-элементы)
  bool use_regex = false;
  bool case_sensitive = false;
  std::optional<std::int64_t> collection_id;
};

/// Итог вставки
struct InsertReport {
  std::int64_t id = 0;
  bool deduplicated = false; // запись уже была и поднята наверх
  std::vector<ClipboardItem> evicted;
};

class HistoryStore {
  /// Конструктор доступен только через open()
  struct OpenKey {
    explicit OpenKey() = default;
  };

public:
  /**
   * @brief Открывает базу и создаёт схему
   * @param db_path Путь к файлу или ":memory:"
   */
  [[nodiscard]] static StoreOutcome<std::unique_ptr<HistoryStore>>
  open(const std::filesystem::path &db_path);

  explicit HistoryStore(OpenKey) {}
  ~HistoryStore() = default;

  HistoryStore(const HistoryStore &) = delete;
  HistoryStore &operator=(const HistoryStore &) = delete;

  /**
   * @brief Вставляет элемент в начало истории и применяет лимит
   *
   * @param item Элемент (id игнорируется)
   * @param cap Максимум не-исключённых элементов, >= 1
   * @return id записи и вытесненные элементы (файлы изображений удаляет
   *         вызывающий)
   */
  [[nodiscard]] StoreOutcome<InsertReport> insert(const ClipboardItem &item,
                                                  std::uint32_t cap);

  /// Страница отфильтрованной истории (новые сверху)
  [[nodiscard]] StoreOutcome<std::vector<ClipboardItem>>
  get(const HistoryQuery &query) const;

  [[nodiscard]] StoreOutcome<ClipboardItem> get_item(std::int64_t id) const;
  [[nodiscard]] StoreOutcome<std::string>
  get_item_content(std::int64_t id) const;

  /// Поднимает элемент наверх и обновляет его время
  [[nodiscard]] StoreStatus update_timestamp(std::int64_t id);

  /// Удаляет элемент; nullopt если его не было
  [[nodiscard]] StoreOutcome<std::optional<ClipboardItem>>
  remove(std::int64_t id);

  /// Переключают флаг и возвращают новое значение
  [[nodiscard]] StoreOutcome<bool> toggle_sensitive(std::int64_t id);
  [[nodiscard]] StoreOutcome<bool> toggle_pin(std::int64_t id);

  /// Правка на месте; порядок не меняется
  [[nodiscard]] StoreStatus
  update_content(std::int64_t id, const std::string &content,
                 const std::string &data_type,
                 const std::optional<std::string> &note = std::nullopt,
                 const std::optional<std::string> &html = std::nullopt);

  /**
   * @brief Очищает историю
   *
   * Элемент остаётся, если (keep_pinned && закреплён) или
   * (keep_collected && входит в коллекцию).
   * @return Удалённые элементы
   */
  [[nodiscard]] StoreOutcome<std::vector<ClipboardItem>>
  clear(bool keep_pinned, bool keep_collected);

  [[nodiscard]] StoreOutcome<Collection>
  create_collection(const std::string &name);
  [[nodiscard]] StoreOutcome<std::vector<Collection>> list_collections() const;

  /// Удаляет коллекцию; её элементы остаются без коллекции
  [[nodiscard]] StoreStatus delete_collection(std::int64_t id);

  /// nullopt снимает привязку
  [[nodiscard]] StoreStatus
  set_item_collection(std::int64_t item_id,
                      std::optional<std::int64_t> collection_id);

  [[nodiscard]] StoreOutcome<std::int64_t> count() const;

private:
  [[nodiscard]] StoreStatus create_schema();
  [[nodiscard]] StoreResult fail(std::string_view what,
                                 std::string &error) const;
  [[nodiscard]] std::optional<ClipboardItem>
  load_item_unlocked(std::int64_t id, StoreStatus &status) const;
  [[nodiscard]] StoreOutcome<bool> toggle_flag(std::int64_t id,
                                               std::string_view column);
  [[nodiscard]] std::int64_t next_position_unlocked(StoreStatus &status) const;

  // SqliteDb не const-корректен (prepare меняет текст ошибки)
  mutable SqliteDb db_;
  mutable std::mutex mutex_;
};

/**
 * @brief Удаляет файлы изображений у удалённых/вытесненных элементов
 *
 * Текстовые элементы пропускаются. Ошибки логируются.
 */
void remove_backing_files(const std::vector<ClipboardItem> &items);

} // namespace clipdeck
