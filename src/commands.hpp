// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>

#include "config.hpp"
#include "result.hpp"
#include "types.hpp"

namespace sysattr {

struct DiscoverOptions {
    std::string config_path; // empty: kDefaultConfigPath when present, built-in defaults otherwise
    bool json_output = false;
};

int cmd_discover(const DiscoverOptions& options);
int cmd_features(const std::string& config_path);
int cmd_check_config(const std::string& config_path);

Result<SysfsConfig> load_config(const std::string& config_path);

// Test helpers (output formatting).
std::string build_labels_text(const Labels& labels);
std::string build_labels_json(const Labels& labels);
std::string build_features_json(const Features& features);

} // namespace sysattr
