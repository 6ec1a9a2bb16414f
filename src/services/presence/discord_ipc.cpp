#include "listen_along/services/presence/discord_ipc.hpp"
#include "listen_along/utils/json_helper.hpp"
#include "listen_along/utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#endif

#if defined(_WIN32) && !defined(htole32)
#define htole32(x) (x)
#define le32toh(x) (x)
#elif defined(__APPLE__)
#include <libkern/OSByteOrder.h>
#define htole32(x) OSSwapHostToLittleInt32(x)
#define le32toh(x) OSSwapLittleToHostInt32(x)
#elif defined(__linux__) || defined(__unix__)
#include <endian.h>
#endif

#if !defined(MSG_NOSIGNAL)
#define MSG_NOSIGNAL 0
#endif

namespace listen_along::services {

using Json = nlohmann::json;

namespace {

constexpr std::uint32_t DISCORD_VERSION = 1;
constexpr std::uint32_t MAX_FRAME_SIZE = 64 * 1024;
constexpr auto REPLY_TIMEOUT = std::chrono::seconds(5);

enum class OpCode : std::uint32_t {
  HANDSHAKE = 0,
  FRAME = 1,
  CLOSE = 2,
  PING = 3,
  PONG = 4
};

std::string make_nonce() {
  static std::atomic<std::uint32_t> counter{0};
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch()).count();
  return std::to_string(ms) + "-" + std::to_string(counter++);
}

std::string event_name(const Json& message) {
  return utils::JsonHelper::get_optional<std::string>(message, "evt", "");
}

} // namespace

bool DispatchBacklog::keep(const Json& message) {
  if (utils::JsonHelper::get_optional<std::string>(message, "cmd", "") != "DISPATCH") {
    return false;
  }
  if (m_pending.size() >= MAX_PENDING) {
    LOG_WARNING("DiscordIpc", "Dispatch backlog full, dropping " + event_name(m_pending.front()));
    m_pending.pop_front();
  }
  m_pending.push_back(message);
  return true;
}

std::optional<Json> DispatchBacklog::pop() {
  if (m_pending.empty()) {
    return std::nullopt;
  }
  Json message = std::move(m_pending.front());
  m_pending.pop_front();
  return message;
}

DiscordIpc::DiscordIpc(std::string client_id)
    : m_client_id(std::move(client_id)) {}

DiscordIpc::~DiscordIpc() {
  disconnect();
}

std::expected<void, core::SessionError> DiscordIpc::connect() {
  std::lock_guard lock(m_io_mutex);
  if (m_connected) {
    return {};
  }

  LOG_DEBUG("DiscordIpc", "Attempting to connect to Discord");

#ifdef _WIN32
  const bool ok = connect_windows();
#else
  const bool ok = connect_unix();
#endif
  if (!ok) {
    return std::unexpected(core::SessionError::ConnectFailed);
  }
  return {};
}

void DiscordIpc::disconnect() {
  std::lock_guard lock(m_io_mutex);
  if (!m_connected) {
    close_handle();
    return;
  }

  LOG_INFO("DiscordIpc", "Disconnecting from Discord");
  write_frame(static_cast<std::uint32_t>(OpCode::CLOSE), "{}");
  close_handle();
}

bool DiscordIpc::is_connected() const {
  return m_connected;
}

std::uint32_t DiscordIpc::current_process_id() {
#ifdef _WIN32
  return GetCurrentProcessId();
#else
  return static_cast<std::uint32_t>(getpid());
#endif
}

void DiscordIpc::close_handle() {
#ifdef _WIN32
  if (m_pipe != INVALID_HANDLE_VALUE) {
    CloseHandle(m_pipe);
    m_pipe = INVALID_HANDLE_VALUE;
  }
#else
  if (m_socket >= 0) {
    close(m_socket);
    m_socket = -1;
  }
#endif
  m_connected = false;
  m_backlog.clear();
}

std::expected<void, core::SessionError> DiscordIpc::set_activity(const Json& activity,
                                                                 std::optional<std::uint32_t> pid) {
  const Json args = {{"pid", pid.value_or(current_process_id())}, {"activity", activity}};
  auto reply = send_command("SET_ACTIVITY", args);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return {};
}

std::expected<Json, core::SessionError> DiscordIpc::send_command(const std::string& cmd,
                                                                 const Json& args,
                                                                 const std::string& evt) {
  std::lock_guard lock(m_io_mutex);
  if (!m_connected) {
    return std::unexpected(core::SessionError::NotConnected);
  }

  const auto nonce = make_nonce();
  Json payload = {{"cmd", cmd}, {"nonce", nonce}, {"args", args}};
  if (!evt.empty()) {
    payload["evt"] = evt;
  }

  const std::string payload_str = payload.dump();
  LOG_DEBUG("DiscordIpc", "Sending " + cmd + ": " + payload_str);

  if (!write_frame(static_cast<std::uint32_t>(OpCode::FRAME), payload_str)) {
    close_handle();
    return std::unexpected(core::SessionError::NotConnected);
  }

  const auto deadline = std::chrono::steady_clock::now() + REPLY_TIMEOUT;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (!wait_readable(remaining)) {
      break;
    }

    auto frame = next_frame();
    if (!frame) {
      return std::unexpected(frame.error());
    }
    if (!*frame || !(*frame)->is_object()) {
      continue;
    }

    const Json& reply = **frame;
    if (reply.value("nonce", Json()) != nonce) {
      if (m_backlog.keep(reply)) {
        LOG_DEBUG("DiscordIpc", "Holding " + event_name(reply) + " until " + cmd + " is answered");
      } else {
        LOG_DEBUG("DiscordIpc", "Skipping unrelated reply to " +
                  utils::JsonHelper::get_optional<std::string>(reply, "cmd", "?"));
      }
      continue;
    }

    if (event_name(reply) == "ERROR") {
      LOG_ERROR("DiscordIpc", "Discord returned error for " + cmd + ": " + reply.dump());
      return std::unexpected(core::SessionError::InvalidPayload);
    }
    return reply;
  }

  LOG_WARNING("DiscordIpc", "No reply to " + cmd + " within timeout");
  return std::unexpected(core::SessionError::Timeout);
}

std::expected<std::optional<Json>, core::SessionError> DiscordIpc::read_message(
    std::chrono::milliseconds timeout) {
  std::lock_guard lock(m_io_mutex);
  if (!m_connected) {
    return std::unexpected(core::SessionError::NotConnected);
  }
  if (auto held = m_backlog.pop()) {
    return std::optional<Json>{std::move(*held)};
  }
  if (!wait_readable(timeout)) {
    return std::optional<Json>{};
  }
  return next_frame();
}

std::expected<void, core::SessionError> DiscordIpc::ping() {
  std::lock_guard lock(m_io_mutex);
  if (!m_connected) {
    return std::unexpected(core::SessionError::NotConnected);
  }

  if (!write_frame(static_cast<std::uint32_t>(OpCode::PING), "{}")) {
    close_handle();
    return std::unexpected(core::SessionError::NotConnected);
  }

  const auto deadline = std::chrono::steady_clock::now() + REPLY_TIMEOUT;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (!wait_readable(remaining)) {
      break;
    }

    std::uint32_t opcode = 0;
    std::string data;
    if (!read_frame(opcode, data)) {
      close_handle();
      return std::unexpected(core::SessionError::NotConnected);
    }

    switch (static_cast<OpCode>(opcode)) {
      case OpCode::PONG:
        return {};
      case OpCode::PING:
        write_frame(static_cast<std::uint32_t>(OpCode::PONG), data);
        break;
      case OpCode::CLOSE:
        LOG_WARNING("DiscordIpc", "Discord closed the connection: " + data);
        close_handle();
        return std::unexpected(core::SessionError::NotConnected);
      case OpCode::FRAME:
        if (auto message = utils::JsonHelper::safe_parse(data)) {
          m_backlog.keep(*message);
        }
        break;
      default:
        break;
    }
  }

  LOG_WARNING("DiscordIpc", "No PONG within timeout");
  return std::unexpected(core::SessionError::Timeout);
}

std::expected<std::optional<Json>, core::SessionError> DiscordIpc::next_frame() {
  std::uint32_t opcode = 0;
  std::string data;
  if (!read_frame(opcode, data)) {
    close_handle();
    return std::unexpected(core::SessionError::NotConnected);
  }

  switch (static_cast<OpCode>(opcode)) {
    case OpCode::PING:
      write_frame(static_cast<std::uint32_t>(OpCode::PONG), data);
      return std::optional<Json>{};
    case OpCode::PONG:
      return std::optional<Json>{};
    case OpCode::CLOSE:
      LOG_WARNING("DiscordIpc", "Discord closed the connection: " + data);
      close_handle();
      return std::unexpected(core::SessionError::NotConnected);
    case OpCode::FRAME:
      break;
    default:
      LOG_WARNING("DiscordIpc", "Unexpected opcode " + std::to_string(opcode));
      return std::optional<Json>{};
  }

  try {
    return std::optional<Json>{Json::parse(data)};
  } catch (const Json::parse_error& e) {
    LOG_WARNING("DiscordIpc", "Failed to parse frame: " + std::string(e.what()));
    return std::unexpected(core::SessionError::InvalidPayload);
  }
}

#ifdef _WIN32
bool DiscordIpc::connect_windows() {
  for (int i = 0; i < 10; ++i) {
    const std::string pipe_name = "\\\\.\\pipe\\discord-ipc-" + std::to_string(i);

    m_pipe = CreateFileA(pipe_name.c_str(), GENERIC_READ | GENERIC_WRITE, 0,
                         nullptr, OPEN_EXISTING, 0, nullptr);
    if (m_pipe == INVALID_HANDLE_VALUE) {
      LOG_DEBUG("DiscordIpc", "Failed to open " + pipe_name + ": error code " + std::to_string(GetLastError()));
      continue;
    }

    DWORD mode = PIPE_READMODE_MESSAGE;
    if (!SetNamedPipeHandleState(m_pipe, &mode, nullptr, nullptr)) {
      LOG_DEBUG("DiscordIpc", "Failed to set pipe mode, using default. Error: " + std::to_string(GetLastError()));
    }

    m_connected = true;
    if (perform_handshake()) {
      LOG_INFO("DiscordIpc", "Connected to pipe: " + pipe_name);
      return true;
    }

    close_handle();
    LOG_DEBUG("DiscordIpc", "Handshake failed on " + pipe_name + ", trying next pipe");
  }

  LOG_WARNING("DiscordIpc", "Failed to connect to any Discord pipe. Is Discord running?");
  return false;
}

bool DiscordIpc::write_data(const void* data, std::size_t size) {
  DWORD bytes_written = 0;
  if (!WriteFile(m_pipe, data, static_cast<DWORD>(size), &bytes_written, nullptr) ||
      bytes_written != size) {
    LOG_ERROR("DiscordIpc", "Failed to write to pipe. Error code: " + std::to_string(GetLastError()));
    return false;
  }
  return true;
}

bool DiscordIpc::read_data(void* data, std::size_t size) {
  std::size_t total_read = 0;
  while (total_read < size) {
    DWORD bytes_read = 0;
    const BOOL ok = ReadFile(m_pipe, static_cast<char*>(data) + total_read,
                             static_cast<DWORD>(size - total_read), &bytes_read, nullptr);
    if (!ok && GetLastError() != ERROR_MORE_DATA) {
      LOG_ERROR("DiscordIpc", "Failed to read from pipe. Error code: " + std::to_string(GetLastError()));
      return false;
    }
    if (bytes_read == 0) {
      return false;
    }
    total_read += bytes_read;
  }
  return true;
}

bool DiscordIpc::wait_readable(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  do {
    DWORD available = 0;
    if (!PeekNamedPipe(m_pipe, nullptr, 0, nullptr, &available, nullptr)) {
      // Broken pipe: let the following read report it
      return true;
    }
    if (available > 0) {
      return true;
    }
    Sleep(20);
  } while (std::chrono::steady_clock::now() < deadline);
  return false;
}

#else
bool DiscordIpc::try_socket(const std::string& path) {
  m_socket = socket(AF_UNIX, SOCK_STREAM, 0);
  if (m_socket < 0) {
    LOG_DEBUG("DiscordIpc", "Failed to create socket: " + std::string(strerror(errno)));
    return false;
  }

  struct sockaddr_un addr {};
  addr.sun_family = AF_UNIX;
  if (path.length() >= sizeof(addr.sun_path)) {
    LOG_WARNING("DiscordIpc", "Socket path too long: " + path);
    close_handle();
    return false;
  }
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

  if (::connect(m_socket, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
    close_handle();
    return false;
  }

  m_connected = true;
  if (!perform_handshake()) {
    LOG_DEBUG("DiscordIpc", "Handshake failed on " + path);
    close_handle();
    return false;
  }

  LOG_INFO("DiscordIpc", "Connected to socket: " + path);
  return true;
}

bool DiscordIpc::connect_unix() {
  std::vector<std::string> directories;
  for (const char* var : {"XDG_RUNTIME_DIR", "TMPDIR", "TMP", "TEMP"}) {
    if (const char* value = std::getenv(var); value && *value) {
      directories.emplace_back(value);
    }
  }
  directories.emplace_back("/tmp");

  const std::string run_user = "/run/user/" + std::to_string(getuid());
  directories.push_back(run_user + "/snap.discord");
  directories.push_back(run_user + "/app/com.discordapp.Discord");

  for (const auto& dir : directories) {
    for (int i = 0; i < 10; ++i) {
      if (try_socket(dir + "/discord-ipc-" + std::to_string(i))) {
        return true;
      }
    }
  }

  LOG_WARNING("DiscordIpc", "Failed to connect to any Discord socket. Is Discord running?");
  return false;
}

bool DiscordIpc::write_data(const void* data, std::size_t size) {
  std::size_t total_sent = 0;
  while (total_sent < size) {
    const ssize_t sent = send(m_socket, static_cast<const char*>(data) + total_sent,
                              size - total_sent, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_ERROR("DiscordIpc", "Failed to write to socket: " + std::string(strerror(errno)));
      return false;
    }
    total_sent += static_cast<std::size_t>(sent);
  }
  return true;
}

bool DiscordIpc::read_data(void* data, std::size_t size) {
  std::size_t total_read = 0;
  while (total_read < size) {
    const ssize_t received = recv(m_socket, static_cast<char*>(data) + total_read, size - total_read, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      if (received < 0) {
        LOG_ERROR("DiscordIpc", "Error reading from socket: " + std::string(strerror(errno)));
      } else {
        LOG_WARNING("DiscordIpc", "Socket closed by Discord");
      }
      return false;
    }
    total_read += static_cast<std::size_t>(received);
  }
  return true;
}

bool DiscordIpc::wait_readable(std::chrono::milliseconds timeout) {
  struct pollfd pfd {};
  pfd.fd = m_socket;
  pfd.events = POLLIN;
  const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  return rc > 0;
}
#endif

bool DiscordIpc::write_frame(std::uint32_t opcode, const std::string& payload) {
  if (!m_connected) {
    return false;
  }

  const auto len = static_cast<std::uint32_t>(payload.size());
  std::vector<char> buf(8 + len);
  const std::uint32_t header[2] = {htole32(opcode), htole32(len)};
  std::memcpy(buf.data(), header, sizeof(header));
  std::memcpy(buf.data() + 8, payload.data(), len);

  return write_data(buf.data(), buf.size());
}

bool DiscordIpc::read_frame(std::uint32_t& opcode, std::string& data) {
  if (!m_connected) {
    return false;
  }

  char header[8];
  if (!read_data(header, sizeof(header))) {
    return false;
  }

  std::uint32_t raw_opcode = 0;
  std::uint32_t raw_length = 0;
  std::memcpy(&raw_opcode, header, 4);
  std::memcpy(&raw_length, header + 4, 4);
  opcode = le32toh(raw_opcode);
  const std::uint32_t length = le32toh(raw_length);

  if (length > MAX_FRAME_SIZE) {
    LOG_ERROR("DiscordIpc", "Frame too large: " + std::to_string(length));
    return false;
  }

  data.resize(length);
  return length == 0 || read_data(data.data(), length);
}

bool DiscordIpc::perform_handshake() {
  const Json handshake = {{"v", DISCORD_VERSION}, {"client_id", m_client_id}};

  LOG_DEBUG("DiscordIpc", "Sending handshake with client ID: " + m_client_id);
  if (!write_frame(static_cast<std::uint32_t>(OpCode::HANDSHAKE), handshake.dump())) {
    return false;
  }

  std::uint32_t response_opcode = 0;
  std::string response_data;
  if (!read_frame(response_opcode, response_data)) {
    LOG_ERROR("DiscordIpc", "Failed to read handshake response");
    return false;
  }

  if (response_opcode != static_cast<std::uint32_t>(OpCode::FRAME)) {
    LOG_ERROR("DiscordIpc", "Handshake rejected: " + response_data);
    return false;
  }

  try {
    const auto response_json = Json::parse(response_data);
    if (event_name(response_json) == "READY") {
      return true;
    }
    LOG_ERROR("DiscordIpc", "Handshake failed - not ready: " + response_data);
  } catch (const Json::parse_error& e) {
    LOG_ERROR("DiscordIpc", "Failed to parse handshake response: " + std::string(e.what()));
  }
  return false;
}

}  // namespace listen_along::services
