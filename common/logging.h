#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "common/macros.h"

namespace Common {

/// Asynchronous file logger.
///
/// Messages are formatted on the calling thread into a fixed stack buffer and
/// handed to a single writer thread through a bounded MPMC queue. A full queue
/// drops the record and counts it; callers never block on file I/O.
class Logger {
public:
  enum Level : uint16_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
  };

  /// Longest message body kept per record; longer messages are truncated
  static constexpr size_t MAX_MSG_SIZE = 240;

  struct Stats {
    uint64_t messages_written = 0;
    uint64_t messages_dropped = 0;
    uint64_t bytes_written = 0;
  };

  explicit Logger(Level min_level = DEBUG) noexcept : min_level_(min_level) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  template<typename... Args>
  void log(Level level, const char* format, Args... args) noexcept {
    if (level < min_level_.load(std::memory_order_relaxed)) return;

    char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
    int len;
    if constexpr (sizeof...(Args) == 0) {
      len = snprintf(buffer, sizeof(buffer), "%s", format);
    } else {
      len = snprintf(buffer, sizeof(buffer), format, args...);
    }
#pragma GCC diagnostic pop
    if (UNLIKELY(len <= 0)) return;
    size_t n = static_cast<size_t>(len);
    if (n >= sizeof(buffer)) n = sizeof(buffer) - 1;
    write(level, buffer, n);
  }

  template<typename... Args>
  void debug(const char* format, Args... args) noexcept { log(DEBUG, format, args...); }

  template<typename... Args>
  void info(const char* format, Args... args) noexcept { log(INFO, format, args...); }

  template<typename... Args>
  void warn(const char* format, Args... args) noexcept { log(WARN, format, args...); }

  template<typename... Args>
  void error(const char* format, Args... args) noexcept { log(ERROR, format, args...); }

  template<typename... Args>
  void fatal(const char* format, Args... args) noexcept { log(FATAL, format, args...); }

  void setMinLevel(Level level) noexcept { min_level_.store(level, std::memory_order_relaxed); }
  [[nodiscard]] auto minLevel() const noexcept -> Level { return min_level_.load(std::memory_order_relaxed); }

  [[nodiscard]] auto getStats() const noexcept -> Stats;

  /// Blocks until every record enqueued so far has reached the file
  void flush() noexcept;

  [[nodiscard]] static auto levelToString(Level level) noexcept -> const char*;

  /// Parses "debug", "info", "warn", "error" or "fatal" (any case)
  [[nodiscard]] static auto parseLevel(const char* name, Level& out) noexcept -> bool;

private:
  void write(Level level, const char* msg, size_t len) noexcept;

  std::atomic<Level> min_level_;
};

/// Global logger; nullptr until initLogging() runs
extern Logger* g_logger;

/// Opens log_file (creating parent directories) and starts the writer thread.
/// Re-initializing replaces the previous instance.
auto initLogging(const char* log_file, Logger::Level min_level = Logger::DEBUG) noexcept -> bool;

/// Drains the queue, joins the writer and closes the file
void shutdownLogging() noexcept;

/// Enqueues a preformatted message on the global logger
void logMessageToGlobal(Logger::Level level, const char* msg, size_t len) noexcept;

} // namespace Common

#define LOG_DEBUG(...) do { if (::Common::g_logger) ::Common::g_logger->debug(__VA_ARGS__); } while (0)
#define LOG_INFO(...)  do { if (::Common::g_logger) ::Common::g_logger->info(__VA_ARGS__); } while (0)
#define LOG_WARN(...)  do { if (::Common::g_logger) ::Common::g_logger->warn(__VA_ARGS__); } while (0)
#define LOG_ERROR(...) do { if (::Common::g_logger) ::Common::g_logger->error(__VA_ARGS__); } while (0)
#define LOG_FATAL(...) do { if (::Common::g_logger) ::Common::g_logger->fatal(__VA_ARGS__); } while (0)
