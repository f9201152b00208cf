// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sysattr {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& value, LogLevel& level);

/**
 * A single structured log record.
 *
 * Built through the SLOG_* macros and extended with typed key/value fields:
 *
 *   logger().log(SLOG_WARN("Reading sysfs attribute failed")
 *                    .field("parameter", path)
 *                    .field("error", err.to_string()));
 */
class LogEvent {
  public:
    LogEvent(LogLevel level, std::string message) : level_(level), message_(std::move(message)) {}

    LogEvent& field(const std::string& key, const std::string& value);
    LogEvent& field(const std::string& key, const char* value);
    LogEvent& field(const std::string& key, int64_t value);
    LogEvent& field(const std::string& key, bool value);
    LogEvent& field(const std::string& key, double value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    [[nodiscard]] std::string to_text() const;
    [[nodiscard]] std::string to_json() const;

  private:
    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };

    LogLevel level_;
    std::string message_;
    std::vector<Field> fields_;
};

class Logger {
  public:
    Logger();

    void log(const LogEvent& event);

    void set_output(std::ostream* out);
    void set_json_format(bool enabled);
    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] bool json_format() const { return json_; }

  private:
    std::mutex mu_;
    std::ostream* out_;
    bool json_ = false;
    LogLevel level_ = LogLevel::Info;
};

Logger& logger();

} // namespace sysattr

#define SLOG_DEBUG(msg) ::sysattr::LogEvent(::sysattr::LogLevel::Debug, (msg))
#define SLOG_INFO(msg) ::sysattr::LogEvent(::sysattr::LogLevel::Info, (msg))
#define SLOG_WARN(msg) ::sysattr::LogEvent(::sysattr::LogLevel::Warn, (msg))
#define SLOG_ERROR(msg) ::sysattr::LogEvent(::sysattr::LogLevel::Error, (msg))
