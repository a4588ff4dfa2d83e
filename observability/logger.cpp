#include "observability/logger.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ledger {
namespace observability {

std::optional<LogLevel> parseLogLevel(const std::string& text) {
  if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
  if (text == "info" || text == "INFO") return LogLevel::INFO;
  if (text == "warn" || text == "WARN") return LogLevel::WARN;
  if (text == "error" || text == "ERROR") return LogLevel::ERROR;
  if (text == "fatal" || text == "FATAL") return LogLevel::FATAL;
  return std::nullopt;
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::clog) {}

void Logger::setLogLevel(LogLevel level) {
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::DEBUG, message, component, correlation_id);
}

void Logger::info(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::INFO, message, component, correlation_id);
}

void Logger::warn(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::WARN, message, component, correlation_id);
}

void Logger::error(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::ERROR, message, component, correlation_id);
}

void Logger::fatal(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::FATAL, message, component, correlation_id);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component,
                               const std::string& correlation_id)
    : level_(level), message_(message), component_(component),
      correlation_id_(correlation_id) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().log(level_, message_, component_, correlation_id_, fields_);
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_.emplace_back(key, "\"" + escapeJson(value) + "\"");
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  return field(key, std::string(value ? value : ""));
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_.emplace_back(key, std::to_string(value));
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, long value) {
  fields_.emplace_back(key, std::to_string(value));
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, long long value) {
  fields_.emplace_back(key, std::to_string(value));
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(6) << value;
  fields_.emplace_back(key, ss.str());
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_.emplace_back(key, value ? "true" : "false");
  return *this;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component, const std::string& correlation_id,
                 const std::vector<std::pair<std::string, std::string>>& fields) {
  if (level < min_level_) return;

  // Build JSON log entry
  std::stringstream ss;
  ss << "{";
  ss << "\"timestamp\":\"" << getCurrentTimestamp() << "\",";
  ss << "\"level\":\"" << levelToString(level) << "\",";
  ss << "\"thread\":\"" << getThreadId() << "\",";
  ss << "\"message\":\"" << escapeJson(message) << "\"";

  if (!component.empty()) {
    ss << ",\"component\":\"" << escapeJson(component) << "\"";
  }

  if (!correlation_id.empty()) {
    ss << ",\"correlation_id\":\"" << escapeJson(correlation_id) << "\"";
  }

  for (const auto& [key, value] : fields) {
    ss << ",\"" << escapeJson(key) << "\":" << value;
  }

  ss << "}\n";

  std::lock_guard<std::mutex> lock(mutex_);
  *output_stream_ << ss.str();
  output_stream_->flush();
}

std::string Logger::levelToString(LogLevel level) const {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

std::string escapeJson(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::stringstream ss;
          ss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
          out += ss.str();
        } else {
          out += c;
        }
    }
  }
  return out;
}

}  // namespace observability
}  // namespace ledger
