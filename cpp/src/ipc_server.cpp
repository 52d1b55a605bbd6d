/**
 * @file ipc_server.cpp
 * @brief Реализация IPC сервера на Unix Domain Socket
 */

#include "clipdeck/ipc_server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

namespace clipdeck {

namespace {

/// Максимальная длина команды (OCR и RELOAD несут путь)
constexpr std::size_t kMaxCommandSize = 4096;

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

/// Аргумент после имени команды ("" если его нет)
std::string_view argument(std::string_view cmd) {
  auto space_pos = cmd.find(' ');
  if (space_pos == std::string_view::npos) {
    return {};
  }
  return trim(cmd.substr(space_pos + 1));
}

/// Имя команды до первого пробела
std::string_view verb(std::string_view cmd) {
  return cmd.substr(0, cmd.find(' '));
}

/// Пишет ответ целиком
void write_all(int fd, const std::string &data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    ssize_t n = write(fd, data.data() + offset, data.size() - offset);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      std::cerr << "[clipdeck-ipc] Write failed: " << std::strerror(errno)
                << "\n";
      return;
    }
    offset += static_cast<std::size_t>(n);
  }
}

} // namespace

IpcCommand parse_ipc_command(std::string_view line) {
  const std::string_view name = verb(trim(line));

  if (name == "GET_PAUSED") {
    return IpcCommand::GetPaused;
  }
  if (name == "SET_PAUSED") {
    return IpcCommand::SetPaused;
  }
  if (name == "CAPTURE") {
    return IpcCommand::Capture;
  }
  if (name == "CLOSE_CAPTURE") {
    return IpcCommand::CloseCapture;
  }
  if (name == "COUNT") {
    return IpcCommand::Count;
  }
  if (name == "CLEAR") {
    return IpcCommand::Clear;
  }
  if (name == "RELOAD") {
    return IpcCommand::Reload;
  }
  if (name == "OCR") {
    return IpcCommand::Ocr;
  }

  return IpcCommand::Unknown;
}

IpcServer::IpcServer(Commands &commands, std::string socket_path)
    : commands_{commands}, socket_path_{socket_path.empty()
                                            ? default_socket_path()
                                            : std::move(socket_path)} {}

IpcServer::~IpcServer() { stop(); }

bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  server_fd_ = create_socket();
  if (server_fd_ < 0) {
    return false;
  }

  running_.store(true);
  server_thread_ =
      std::jthread([this](std::stop_token st) { server_loop(st); });

  std::cerr << "[clipdeck-ipc] Server started on " << socket_path_ << "\n";
  return true;
}

void IpcServer::stop() {
  if (!running_.load()) {
    return;
  }

  running_.store(false);

  // Ждём завершения потока (poll просыпается не реже раза в 500 мс)
  if (server_thread_.joinable()) {
    server_thread_.request_stop();
    server_thread_.join();
  }

  if (server_fd_ >= 0) {
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  // Удаляем файл сокета
  unlink(socket_path_.c_str());

  std::cerr << "[clipdeck-ipc] Server stopped\n";
}

bool IpcServer::is_running() const noexcept { return running_.load(); }

int IpcServer::create_socket() {
  auto is_socket_active = [](const std::string &socket_path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
      // Не можем проверить: считаем сокет "живым" и не трогаем
      return true;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    bool active = false;
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
      active = true;
    } else {
      // ECONNREFUSED/ENOENT: стейл-файл без слушателя
      active = !(errno == ECONNREFUSED || errno == ENOENT);
    }

    close(fd);
    return active;
  };

  auto create_bound_socket = [&](int *out_errno) -> int {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
      *out_errno = errno;
      std::cerr << "[clipdeck-ipc] Failed to create socket: "
                << std::strerror(errno) << "\n";
      return -1;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(),
                 sizeof(addr.sun_path) - 1);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      *out_errno = errno;
      close(fd);
      return -1;
    }

    // Сокет пользовательский: доступ только владельцу
    if (chmod(socket_path_.c_str(), 0600) < 0) {
      std::cerr << "[clipdeck-ipc] Warning: failed to chmod socket ("
                << socket_path_ << "): " << std::strerror(errno) << "\n";
    }

    if (listen(fd, 5) < 0) {
      *out_errno = errno;
      std::cerr << "[clipdeck-ipc] Failed to listen (" << socket_path_
                << "): " << std::strerror(errno) << "\n";
      close(fd);
      (void)unlink(socket_path_.c_str());
      return -1;
    }

    *out_errno = 0;
    return fd;
  };

  int bind_errno = 0;
  int fd = create_bound_socket(&bind_errno);
  if (fd >= 0) {
    return fd;
  }

  if (bind_errno == EADDRINUSE) {
    if (is_socket_active(socket_path_)) {
      std::cerr << "[clipdeck-ipc] Another instance is listening on "
                << socket_path_ << "\n";
      return -1;
    }

    std::cerr << "[clipdeck-ipc] Stale socket detected, replacing: "
              << socket_path_ << "\n";
    (void)unlink(socket_path_.c_str());
    fd = create_bound_socket(&bind_errno);
    if (fd >= 0) {
      return fd;
    }
  }

  std::cerr << "[clipdeck-ipc] Failed to bind socket (" << socket_path_
            << "): " << std::strerror(bind_errno) << "\n";
  return -1;
}

void IpcServer::server_loop(std::stop_token st) {
  std::cerr << "[clipdeck-ipc] Server thread started\n";

  while (!st.stop_requested()) {
    pollfd pfd = {server_fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, 500); // Timeout 500ms для проверки stop_token

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[clipdeck-ipc] Poll error: " << std::strerror(errno)
                << "\n";
      break;
    }

    if (ret == 0) {
      continue;
    }

    if (pfd.revents & POLLIN) {
      sockaddr_un client_addr{};
      socklen_t client_len = sizeof(client_addr);

      int client_fd = accept(
          server_fd_, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
      if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
          std::cerr << "[clipdeck-ipc] Accept error: " << std::strerror(errno)
                    << "\n";
        }
        continue;
      }

      handle_client(client_fd);
      close(client_fd);
    }
  }

  std::cerr << "[clipdeck-ipc] Server thread exiting\n";
}

void IpcServer::handle_client(int client_fd) {
  char buffer[kMaxCommandSize] = {};
  ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer) - 1);

  if (bytes_read <= 0) {
    return;
  }

  std::string_view cmd{buffer, static_cast<std::size_t>(bytes_read)};
  cmd = trim(cmd);

  std::cerr << "[clipdeck-ipc] Received command: " << verb(cmd) << "\n";

  IpcResult result = execute_command(cmd);

  std::string response = result.success ? "OK" : "ERROR";
  if (!result.message.empty()) {
    response += " ";
    response += result.message;
  }
  response += "\n";

  write_all(client_fd, response);
}

IpcResult IpcServer::execute_command(std::string_view cmd) {
  cmd = trim(cmd);
  const std::string_view arg = argument(cmd);

  switch (parse_ipc_command(cmd)) {
  case IpcCommand::GetPaused:
    return {true, commands_.get_paused() ? "PAUSED" : "RUNNING"};

  case IpcCommand::SetPaused: {
    if (arg.empty()) {
      return {false, "Missing argument"};
    }
    if (arg == "1" || arg == "true" || arg == "on") {
      commands_.set_paused(true);
      return {true, "PAUSED"};
    }
    if (arg == "0" || arg == "false" || arg == "off") {
      commands_.set_paused(false);
      return {true, "RUNNING"};
    }
    return {false, "Invalid argument"};
  }

  case IpcCommand::Capture: {
    auto captured = commands_.start_capture();
    if (!captured.ok()) {
      return {false, captured.error};
    }
    return {true, std::to_string(captured.value.size()) + " displays"};
  }

  case IpcCommand::CloseCapture: {
    CommandStatus closed = commands_.close_capture();
    return {closed.ok(), closed.error};
  }

  case IpcCommand::Count: {
    auto count = commands_.get_history_count();
    if (!count.ok()) {
      return {false, count.error};
    }
    return {true, std::to_string(count.value)};
  }

  case IpcCommand::Clear: {
    CommandStatus cleared = commands_.clear_history();
    return {cleared.ok(), cleared.error};
  }

  case IpcCommand::Reload: {
    CommandStatus reloaded =
        commands_.reload_config(std::filesystem::path{std::string{arg}});
    if (reloaded.ok()) {
      std::cerr << "[clipdeck-ipc] Config reloaded successfully\n";
      return {true, "Config reloaded"};
    }
    std::cerr << "[clipdeck-ipc] Config reload failed: " << reloaded.error
              << "\n";
    return {false, reloaded.error};
  }

  case IpcCommand::Ocr: {
    if (arg.empty()) {
      return {false, "Missing argument"};
    }
    auto recognized =
        commands_.ocr_image(std::filesystem::path{std::string{arg}});
    if (!recognized.ok()) {
      return {false, recognized.error};
    }
    return {true, recognized.value};
  }

  case IpcCommand::Unknown:
    break;
  }
  return {false, "Unknown command"};
}

} // namespace clipdeck
