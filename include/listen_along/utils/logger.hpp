#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace listen_along::utils {

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  None = 4
};

struct SourceLocation {
  [[nodiscard]] const char* file_name() const { return m_filename; }
  [[nodiscard]] int line() const { return m_line_number; }

  const char* m_filename = "unknown";
  int m_line_number = 0;
};

struct LogMessage {
  LogLevel m_level;
  std::chrono::system_clock::time_point m_timestamp;
  std::string m_component;
  std::string m_message;
  SourceLocation m_location;
};

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogMessage& message) = 0;
  virtual void flush() = 0;
};

class Logger {
 public:
  using SinkPtr = std::unique_ptr<LogSink>;

  explicit Logger(LogLevel min_level = LogLevel::Info);
  ~Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel get_level() const;
  void add_sink(SinkPtr sink);
  void clear_sinks();

  void debug(std::string_view component, std::string_view message,
             SourceLocation location = {});
  void info(std::string_view component, std::string_view message,
            SourceLocation location = {});
  void warning(std::string_view component, std::string_view message,
               SourceLocation location = {});
  void error(std::string_view component, std::string_view message,
             SourceLocation location = {});

  void flush();

 private:
  void log(LogLevel level, std::string_view component, std::string_view message,
           SourceLocation location);

  LogLevel m_min_level;
  std::vector<SinkPtr> m_sinks;
  mutable std::mutex m_mutex;
};

class ConsoleSink : public LogSink {
 public:
  explicit ConsoleSink(bool use_colors = true);
  void write(const LogMessage& message) override;
  void flush() override;

 private:
  bool m_use_colors;
  [[nodiscard]] std::string colorize(std::string_view text,
                                     LogLevel level) const;
  [[nodiscard]] std::string format_message(const LogMessage& message) const;
};

// Appends to a single log file and rotates it once it grows past
// max_bytes: file -> file.1 -> ... -> file.<max_backups>.
class FileSink : public LogSink {
 public:
  static constexpr std::uintmax_t DEFAULT_MAX_BYTES = 2 * 1024 * 1024;
  static constexpr int DEFAULT_MAX_BACKUPS = 3;

  explicit FileSink(std::filesystem::path path,
                    std::uintmax_t max_bytes = DEFAULT_MAX_BYTES,
                    int max_backups = DEFAULT_MAX_BACKUPS);
  ~FileSink() override;

  void write(const LogMessage& message) override;
  void flush() override;
  [[nodiscard]] bool is_open() const;

 private:
  void open_stream();
  void rotate();
  [[nodiscard]] std::string format_message(const LogMessage& message) const;

  std::filesystem::path m_path;
  std::uintmax_t m_max_bytes;
  int m_max_backups;
  std::uintmax_t m_written = 0;
  std::ofstream m_file;
};

class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);
  static std::unique_ptr<Logger> create_default_logger();

 private:
  static std::unique_ptr<Logger> s_logger;
  static std::mutex s_init_mutex;
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
        default: return "info";
    }
}

inline LogLevel log_level_from_string(const std::string& str) {
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "error") return LogLevel::Error;
    if (str == "none") return LogLevel::None;
    return LogLevel::Info;
}

#define LOG_DEBUG(component, message)                                   \
  listen_along::utils::LoggerManager::get_instance().debug(component,   \
                                                           message)

#define LOG_INFO(component, message)                                    \
  listen_along::utils::LoggerManager::get_instance().info(component,    \
                                                          message)

#define LOG_WARNING(component, message)                                 \
  listen_along::utils::LoggerManager::get_instance().warning(component, \
                                                             message)

#define LOG_ERROR(component, message)                                   \
  listen_along::utils::LoggerManager::get_instance().error(component,   \
                                                           message)

}  // namespace listen_along::utils
