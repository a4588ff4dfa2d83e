#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ledger {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * Structured logger with JSON output and configurable log levels.
 * Thread-safe and supports correlation IDs for request tracing.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::clog)
  void setOutputStream(std::ostream& stream);

  // Logging methods
  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted when the builder is destroyed
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, long value);
    LogBuilder& field(const std::string& key, long long value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    std::vector<std::pair<std::string, std::string>> fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const std::vector<std::pair<std::string, std::string>>& fields = {});

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  std::atomic<LogLevel> min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

/**
 * Escapes a value for inclusion inside a JSON string literal.
 */
std::string escapeJson(const std::string& value);

// Convenience macros for logging
#define LOG_DEBUG(msg, component) ledger::observability::Logger::getInstance().debug(msg, component)
#define LOG_INFO(msg, component) ledger::observability::Logger::getInstance().info(msg, component)
#define LOG_WARN(msg, component) ledger::observability::Logger::getInstance().warn(msg, component)
#define LOG_ERROR(msg, component) ledger::observability::Logger::getInstance().error(msg, component)
#define LOG_FATAL(msg, component) ledger::observability::Logger::getInstance().fatal(msg, component)

// Structured logging helper
#define LOG_BUILDER(level, msg, component) \
  ledger::observability::Logger::LogBuilder(level, msg, component)

}  // namespace observability
}  // namespace ledger

#endif  // LOGGER_HPP_
