// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#include <ctime>
#include <iostream>
#include <sstream>

#include "utils.hpp"

namespace sysattr {

namespace {

std::string utc_timestamp()
{
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32] = {};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

bool needs_quoting(const std::string& value)
{
    if (value.empty()) {
        return true;
    }
    for (char c : value) {
        if (c == ' ' || c == '"' || c == '=' || static_cast<unsigned char>(c) < 0x20) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& value, LogLevel& level)
{
    const std::string v = to_lower(trim(value));
    if (v == "debug") {
        level = LogLevel::Debug;
    } else if (v == "info") {
        level = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        level = LogLevel::Warn;
    } else if (v == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

LogEvent& LogEvent::field(const std::string& key, const std::string& value)
{
    fields_.push_back(Field{key, value, true});
    return *this;
}

LogEvent& LogEvent::field(const std::string& key, const char* value)
{
    return field(key, std::string(value ? value : ""));
}

LogEvent& LogEvent::field(const std::string& key, int64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEvent& LogEvent::field(const std::string& key, bool value)
{
    fields_.push_back(Field{key, value ? "true" : "false", false});
    return *this;
}

LogEvent& LogEvent::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << value;
    fields_.push_back(Field{key, oss.str(), false});
    return *this;
}

std::string LogEvent::to_text() const
{
    std::ostringstream oss;
    oss << utc_timestamp() << " " << log_level_name(level_) << " " << message_;
    for (const auto& f : fields_) {
        oss << " " << f.key << "=";
        if (f.quoted && needs_quoting(f.value)) {
            oss << "\"" << json_escape(f.value) << "\"";
        } else {
            oss << f.value;
        }
    }
    return oss.str();
}

std::string LogEvent::to_json() const
{
    std::ostringstream oss;
    oss << "{\"ts\":\"" << utc_timestamp() << "\",\"level\":\"" << log_level_name(level_) << "\",\"message\":\""
        << json_escape(message_) << "\"";
    for (const auto& f : fields_) {
        oss << ",\"" << json_escape(f.key) << "\":";
        if (f.quoted) {
            oss << "\"" << json_escape(f.value) << "\"";
        } else {
            oss << f.value;
        }
    }
    oss << "}";
    return oss.str();
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::log(const LogEvent& event)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (event.level() < level_ || out_ == nullptr) {
        return;
    }
    *out_ << (json_ ? event.to_json() : event.to_text()) << '\n';
    out_->flush();
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

void Logger::set_json_format(bool enabled)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = enabled;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

} // namespace sysattr
