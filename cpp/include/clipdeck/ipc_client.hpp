/**
 * @file ipc_client.hpp
 * @brief IPC клиент для связи с демоном clipdeck
 *
 * Используется clipdeckctl для отправки команд и получения ответа.
 */

#pragma once

#include <optional>
#include <string>

namespace clipdeck {

/// Ответ демона: "OK [message]" или "ERROR message"
struct IpcReply {
  bool success = false;
  std::string message;
};

/**
 * @brief IPC клиент для связи с демоном через Unix Domain Socket
 */
class IpcClient {
public:
  /**
   * @brief Timeout ответа для быстрых команд (в миллисекундах)
   */
  static constexpr int kTimeoutMs = 1000;

  /**
   * @brief Timeout для CAPTURE и OCR (захват и распознавание долгие)
   */
  static constexpr int kLongTimeoutMs = 30000;

  /// @param socket_path Путь сокета; пусто = default_socket_path()
  explicit IpcClient(std::string socket_path = {});

  /**
   * @brief Отправляет команду и разбирает ответ
   * @return Ответ или nullopt, если демон недоступен или молчит
   */
  [[nodiscard]] std::optional<IpcReply> send(const std::string &command) const;

  [[nodiscard]] bool is_service_available() const;

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

private:
  /// Сырой ответ без завершающего перевода строки
  [[nodiscard]] std::optional<std::string>
  send_raw(const std::string &command, int timeout_ms) const;

  std::string socket_path_;
};

/// Разбор строки ответа "OK ..."/"ERROR ..."
[[nodiscard]] std::optional<IpcReply> parse_ipc_reply(const std::string &line);

} // namespace clipdeck
