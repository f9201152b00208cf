// cppcheck-suppress-file missingIncludeSystem
#include "config.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "logging.hpp"
#include "utils.hpp"

namespace sysattr {

namespace {

bool starts_with_sysfs_prefix(const std::string& entry)
{
    const std::string prefix = kDefaultSysfsRoot;
    if (entry.rfind(prefix, 0) != 0) {
        return false;
    }
    return entry.size() == prefix.size() || entry[prefix.size()] == '/';
}

// Drop a trailing "# ..." comment that follows whitespace.
std::string strip_inline_comment(const std::string& line)
{
    for (size_t i = 1; i < line.size(); ++i) {
        if (line[i] == '#' && (line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

Result<SysfsConfig> parse_config_stream(std::istream& in, ConfigIssues& issues)
{
    SysfsConfig config;
    std::vector<std::string> whitelist;
    std::unordered_set<std::string> whitelist_seen;
    std::string section;
    std::string line;
    size_t line_no = 0;

    static const std::unordered_set<std::string> valid_sections = {"sysfs_whitelist"};

    auto type_error = [&](const std::string& msg) {
        issues.errors.push_back("line " + std::to_string(line_no) + ": " + msg);
        issues.type_mismatch = true;
    };

    while (std::getline(in, line)) {
        ++line_no;
        std::string trimmed = trim(strip_inline_comment(line));
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            if (valid_sections.find(section) == valid_sections.end()) {
                issues.errors.push_back("line " + std::to_string(line_no) + ": unknown section '" + section + "'");
                section.clear();
            }
            continue;
        }

        if (section.empty()) {
            std::string key;
            std::string value;
            if (!parse_key_value(trimmed, key, value)) {
                issues.errors.push_back("line " + std::to_string(line_no) + ": expected key=value in header");
                continue;
            }
            if (key == "version") {
                uint64_t version = 0;
                if (!parse_uint64(value, version)) {
                    type_error("version must be an integer");
                    continue;
                }
                if (version != static_cast<uint64_t>(kConfigVersion)) {
                    issues.errors.push_back("line " + std::to_string(line_no) + ": unsupported version " + value);
                    continue;
                }
                config.version = static_cast<int>(version);
            } else if (key == "sysfs_root") {
                if (value.empty() || value.front() != '/') {
                    type_error("sysfs_root must be an absolute path");
                    continue;
                }
                config.sysfs_root = value;
            } else if (key == "max_name_length") {
                uint64_t len = 0;
                if (!parse_uint64(value, len)) {
                    type_error("max_name_length must be an integer");
                    continue;
                }
                if (len == 0 || len > kAttributeNameMax) {
                    issues.errors.push_back("line " + std::to_string(line_no) + ": max_name_length must be in 1.." +
                                            std::to_string(kAttributeNameMax));
                    continue;
                }
                config.max_name_length = static_cast<size_t>(len);
            } else {
                issues.errors.push_back("line " + std::to_string(line_no) + ": unknown header key '" + key + "'");
            }
            continue;
        }

        if (section == "sysfs_whitelist") {
            if (starts_with_sysfs_prefix(trimmed)) {
                issues.warnings.push_back("line " + std::to_string(line_no) + ": '" + trimmed +
                                          "' is resolved relative to the sysfs root; drop the leading '" +
                                          kDefaultSysfsRoot + "'");
            }
            if (!whitelist_seen.insert(trimmed).second) {
                issues.warnings.push_back("line " + std::to_string(line_no) + ": duplicate entry '" + trimmed + "'");
                continue;
            }
            whitelist.push_back(trimmed);
            continue;
        }
    }

    if (issues.has_errors()) {
        if (issues.type_mismatch) {
            return Error(ErrorCode::ConfigTypeMismatch, "Configuration value has the wrong type", issues.errors.front());
        }
        return Error(ErrorCode::ConfigParseFailed, "Invalid configuration", issues.errors.front());
    }

    if (!whitelist.empty()) {
        config.whitelist = std::move(whitelist);
    }
    return config;
}

} // namespace

Result<SysfsConfig> parse_config_file(const std::string& path, ConfigIssues& issues)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        issues.errors.push_back("Failed to open '" + path + "': " + std::strerror(errno));
        return Error(ErrorCode::ConfigParseFailed, "Failed to open config file", path);
    }
    return parse_config_stream(in, issues);
}

Result<SysfsConfig> parse_config_string(const std::string& content, ConfigIssues& issues)
{
    std::istringstream in(content);
    return parse_config_stream(in, issues);
}

void report_config_issues(const ConfigIssues& issues)
{
    for (const auto& err : issues.errors) {
        logger().log(SLOG_ERROR("Config error").field("detail", err));
    }
    for (const auto& warn : issues.warnings) {
        logger().log(SLOG_WARN("Config warning").field("detail", warn));
    }
}

} // namespace sysattr
