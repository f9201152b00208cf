// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace sysattr {

// Base of every feature source configuration; sources downcast to their own type.
class SourceConfig {
  public:
    virtual ~SourceConfig() = default;

    [[nodiscard]] virtual std::unique_ptr<SourceConfig> clone() const = 0;
};

class SysfsConfig : public SourceConfig {
  public:
    [[nodiscard]] std::unique_ptr<SourceConfig> clone() const override
    {
        return std::make_unique<SysfsConfig>(*this);
    }

    int version = kConfigVersion;
    // Empty means: use SYSATTR_SYSFS_ROOT or "/sys".
    std::string sysfs_root;
    size_t max_name_length = kAttributeNameMax;
    // Paths relative to the sysfs root. The default single empty entry names the root itself.
    std::vector<std::string> whitelist{""};
};

struct ConfigIssues {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    // Set when a value had the wrong shape for its key.
    bool type_mismatch = false;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }
};

/**
 * Parse a sysfs source configuration file.
 *
 * Format:
 *
 *   version=1
 *   sysfs_root=/host-sys
 *   max_name_length=55
 *
 *   [sysfs_whitelist]
 *   class/power_supply/BAT0/capacity
 *
 * Whitelist entries are always relative to the sysfs root. An entry spelled
 * with a leading "/sys" is kept verbatim and reported as a warning.
 * Fails with ConfigTypeMismatch when a value has the wrong shape and with
 * ConfigParseFailed for any other error; details are in issues.
 */
Result<SysfsConfig> parse_config_file(const std::string& path, ConfigIssues& issues);
Result<SysfsConfig> parse_config_string(const std::string& content, ConfigIssues& issues);

void report_config_issues(const ConfigIssues& issues);

} // namespace sysattr
