#pragma once

#include "listen_along/core/models.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#ifdef _WIN32
#include <windows.h>
#endif

namespace listen_along::services {

// DISPATCH events read while a command waits for its reply. They are held
// for the next read_message() instead of being lost; the oldest is dropped
// once MAX_PENDING are queued.
class DispatchBacklog {
 public:
  static constexpr std::size_t MAX_PENDING = 32;

  // Keeps message if it is a DISPATCH frame. Returns whether it was kept.
  bool keep(const nlohmann::json& message);
  std::optional<nlohmann::json> pop();

  std::size_t size() const { return m_pending.size(); }
  bool empty() const { return m_pending.empty(); }
  void clear() { m_pending.clear(); }

 private:
  std::deque<nlohmann::json> m_pending;
};

// One Discord RPC connection over the local IPC pipe/socket.
class DiscordIpc {
 public:
  explicit DiscordIpc(std::string client_id);
  ~DiscordIpc();

  DiscordIpc(const DiscordIpc&) = delete;
  DiscordIpc& operator=(const DiscordIpc&) = delete;

  std::expected<void, core::SessionError> connect();
  void disconnect();
  [[nodiscard]] bool is_connected() const;

  // SET_ACTIVITY. A null activity clears. pid defaults to this process.
  std::expected<void, core::SessionError> set_activity(const nlohmann::json& activity,
                                                       std::optional<std::uint32_t> pid = std::nullopt);

  // Sends a command frame and waits for the reply carrying the same nonce.
  // Events that arrive in between go to the backlog for read_message().
  std::expected<nlohmann::json, core::SessionError> send_command(const std::string& cmd,
                                                                 const nlohmann::json& args,
                                                                 const std::string& evt = {});

  // PING/PONG round trip. NotConnected once the pipe is gone, Timeout if
  // Discord holds the pipe open but never answers.
  std::expected<void, core::SessionError> ping();

  // Next DISPATCH message, or nullopt if nothing arrived before the timeout.
  std::expected<std::optional<nlohmann::json>, core::SessionError> read_message(
      std::chrono::milliseconds timeout);

  static std::uint32_t current_process_id();

 private:
  std::string m_client_id;
  std::atomic<bool> m_connected{false};
  std::mutex m_io_mutex;
  DispatchBacklog m_backlog;

#ifdef _WIN32
  HANDLE m_pipe = INVALID_HANDLE_VALUE;
  bool connect_windows();
#else
  int m_socket = -1;
  bool connect_unix();
  bool try_socket(const std::string& path);
#endif
  void close_handle();
  bool write_data(const void* data, std::size_t size);
  bool read_data(void* data, std::size_t size);
  bool wait_readable(std::chrono::milliseconds timeout);

  bool write_frame(std::uint32_t opcode, const std::string& payload);
  bool read_frame(std::uint32_t& opcode, std::string& data);
  bool perform_handshake();

  // Handles PING/CLOSE housekeeping. Returns the JSON body of a FRAME.
  std::expected<std::optional<nlohmann::json>, core::SessionError> next_frame();
};

} // namespace listen_along::services
