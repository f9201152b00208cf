// cppcheck-suppress-file missingIncludeSystem
#include "commands.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

#include "logging.hpp"
#include "sysfs_source.hpp"
#include "utils.hpp"

namespace sysattr {

namespace {

std::string json_string_map(const std::map<std::string, std::string>& values)
{
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) {
            out << ",";
        }
        first = false;
        out << "\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
    }
    out << "}";
    return out.str();
}

Result<SysfsSource> run_discovery(const std::string& config_path)
{
    auto config = load_config(config_path);
    if (!config) {
        return config.error();
    }
    SysfsSource source(std::move(*config));
    TRY(source.discover());
    return source;
}

} // namespace

Result<SysfsConfig> load_config(const std::string& config_path)
{
    std::string path = config_path;
    if (path.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(kDefaultConfigPath, ec)) {
            logger().log(SLOG_DEBUG("No config file; using defaults").field("path", kDefaultConfigPath));
            return SysfsConfig{};
        }
        path = kDefaultConfigPath;
    }

    ConfigIssues issues;
    auto config = parse_config_file(path, issues);
    report_config_issues(issues);
    if (!config) {
        return config.error();
    }
    logger().log(SLOG_INFO("Loaded config")
                     .field("path", path)
                     .field("whitelist", static_cast<int64_t>(config->whitelist.size())));
    return config;
}

std::string build_labels_text(const Labels& labels)
{
    std::ostringstream out;
    for (const auto& [key, value] : labels) {
        out << key << "=" << value << "\n";
    }
    return out.str();
}

std::string build_labels_json(const Labels& labels)
{
    return json_string_map(labels);
}

std::string build_features_json(const Features& features)
{
    std::ostringstream out;
    out << "{\"attributes\":{";
    bool first = true;
    for (const auto& [name, feature] : features.attributes) {
        if (!first) {
            out << ",";
        }
        first = false;
        out << "\"" << json_escape(name) << "\":{\"elements\":" << json_string_map(feature.elements) << "}";
    }
    out << "}}";
    return out.str();
}

int cmd_discover(const DiscoverOptions& options)
{
    auto source = run_discovery(options.config_path);
    if (!source) {
        logger().log(SLOG_ERROR("Discovery failed").field("error", source.error().to_string()));
        return 1;
    }

    const Labels labels = source->labels();
    if (options.json_output) {
        std::cout << build_labels_json(labels) << '\n';
    } else {
        std::cout << build_labels_text(labels);
    }
    return 0;
}

int cmd_features(const std::string& config_path)
{
    auto source = run_discovery(config_path);
    if (!source) {
        logger().log(SLOG_ERROR("Discovery failed").field("error", source.error().to_string()));
        return 1;
    }
    std::cout << build_features_json(source->features()) << '\n';
    return 0;
}

int cmd_check_config(const std::string& config_path)
{
    if (config_path.empty()) {
        logger().log(SLOG_ERROR("Missing required --config"));
        return 1;
    }

    ConfigIssues issues;
    auto config = parse_config_file(config_path, issues);
    report_config_issues(issues);
    if (!config) {
        std::cout << "Config invalid: " << config.error().to_string() << '\n';
        return 1;
    }

    std::cout << "Config OK (" << config->whitelist.size() << " whitelist entries";
    if (issues.has_warnings()) {
        std::cout << ", " << issues.warnings.size() << " warnings";
    }
    std::cout << ")" << '\n';
    return 0;
}

} // namespace sysattr
