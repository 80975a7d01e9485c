#ifndef LEDGER_OBSERVABILITY_LOGGER_HPP_
#define LEDGER_OBSERVABILITY_LOGGER_HPP_

#include "money.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

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
 * Structured logger writing one JSON object per line.
 * Thread-safe; the output stream defaults to std::clog so that command
 * output on std::cout stays machine-readable.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);

  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted when the builder dies.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, int64_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);
    LogBuilder& field(const std::string& key, const Money& value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::map<std::string, std::string> fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::map<std::string, std::string>& fields = {});

  bool enabled(LogLevel level) const;
  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

std::string escapeJson(const std::string& value);

// Convenience macros for logging
#define LEDGER_LOG_DEBUG(msg) ledger::observability::Logger::getInstance().debug(msg, __func__)
#define LEDGER_LOG_INFO(msg) ledger::observability::Logger::getInstance().info(msg, __func__)
#define LEDGER_LOG_WARN(msg) ledger::observability::Logger::getInstance().warn(msg, __func__)
#define LEDGER_LOG_ERROR(msg) ledger::observability::Logger::getInstance().error(msg, __func__)

// Structured logging helper
#define LEDGER_LOG_BUILDER(level, msg) \
  ledger::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_OBSERVABILITY_LOGGER_HPP_
