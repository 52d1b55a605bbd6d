/**
 * @file ipc_client.cpp
 * @brief Реализация IPC клиента для связи с демоном clipdeck
 */

#include "clipdeck/ipc_client.hpp"
#include "clipdeck/config.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string_view>

namespace clipdeck {

namespace {

/// Создаёт подключение к серверу
int connect_to_server(const char *socket_path) {
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path, sizeof(addr.sun_path) - 1);

  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }

  return fd;
}

bool is_long_command(const std::string &command) {
  return command.starts_with("CAPTURE") || command.starts_with("OCR");
}

} // namespace

std::optional<IpcReply> parse_ipc_reply(const std::string &line) {
  IpcReply reply;
  std::string_view rest;

  if (line.starts_with("OK")) {
    reply.success = true;
    rest = std::string_view{line}.substr(2);
  } else if (line.starts_with("ERROR")) {
    reply.success = false;
    rest = std::string_view{line}.substr(5);
  } else {
    return std::nullopt;
  }

  if (!rest.empty() && rest.front() != ' ') {
    return std::nullopt;
  }
  if (!rest.empty()) {
    rest.remove_prefix(1);
  }
  reply.message.assign(rest.begin(), rest.end());
  return reply;
}

IpcClient::IpcClient(std::string socket_path)
    : socket_path_{socket_path.empty() ? default_socket_path()
                                       : std::move(socket_path)} {}

std::optional<std::string> IpcClient::send_raw(const std::string &command,
                                               int timeout_ms) const {
  int fd = connect_to_server(socket_path_.c_str());
  if (fd < 0) {
    return std::nullopt;
  }

  // Отправляем команду
  std::string cmd_with_newline = command + "\n";
  ssize_t written =
      write(fd, cmd_with_newline.c_str(), cmd_with_newline.size());
  if (written != static_cast<ssize_t>(cmd_with_newline.size())) {
    close(fd);
    return std::nullopt;
  }

  // Читаем до закрытия соединения сервером (ответ OCR бывает длинным)
  std::string response;
  char buffer[4096];
  while (true) {
    pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      close(fd);
      return std::nullopt;
    }

    ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(bytes_read));
  }
  close(fd);

  if (response.empty()) {
    return std::nullopt;
  }

  // Удаляем trailing newline
  while (!response.empty() &&
         (response.back() == '\n' || response.back() == '\r')) {
    response.pop_back();
  }
  return response;
}

std::optional<IpcReply> IpcClient::send(const std::string &command) const {
  const int timeout = is_long_command(command) ? kLongTimeoutMs : kTimeoutMs;
  auto raw = send_raw(command, timeout);
  if (!raw) {
    return std::nullopt;
  }
  return parse_ipc_reply(*raw);
}

bool IpcClient::is_service_available() const {
  int fd = connect_to_server(socket_path_.c_str());
  if (fd < 0) {
    return false;
  }
  close(fd);
  return true;
}

} // namespace clipdeck
