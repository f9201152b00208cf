// cppcheck-suppress-file missingIncludeSystem
/*
 * sysattr - sysfs attribute discovery
 *
 * Command-line entry point.
 */

#include <iostream>
#include <string>

#include "commands.hpp"
#include "logging.hpp"

namespace {

void print_usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " [--log-format text|json] [--log-level LEVEL] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  discover [--config PATH] [--json]   Read whitelisted attributes and print labels\n"
              << "  features [--config PATH]            Read whitelisted attributes and print features as JSON\n"
              << "  check-config --config PATH          Validate a config file\n";
}

} // namespace

int main(int argc, char** argv)
{
    using namespace sysattr;

    std::string command;
    std::string config_path;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                logger().log(SLOG_ERROR("Missing value for option").field("option", arg));
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--log-format") {
            std::string value;
            if (!next_value(value)) {
                return 1;
            }
            if (value != "json" && value != "text") {
                logger().log(SLOG_ERROR("Invalid --log-format").field("value", value));
                return 1;
            }
            logger().set_json_format(value == "json");
        } else if (arg == "--log-level") {
            std::string value;
            LogLevel level = LogLevel::Info;
            if (!next_value(value)) {
                return 1;
            }
            if (!parse_log_level(value, level)) {
                logger().log(SLOG_ERROR("Invalid --log-level").field("value", value));
                return 1;
            }
            logger().set_level(level);
        } else if (arg == "--config") {
            if (!next_value(config_path)) {
                return 1;
            }
        } else if (arg == "--json") {
            json_output = true;
        } else if (command.empty() && !arg.empty() && arg[0] != '-') {
            command = arg;
        } else {
            logger().log(SLOG_ERROR("Unknown argument").field("argument", arg));
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command == "discover") {
        DiscoverOptions options;
        options.config_path = config_path;
        options.json_output = json_output;
        return cmd_discover(options);
    }
    if (command == "features") {
        return cmd_features(config_path);
    }
    if (command == "check-config") {
        return cmd_check_config(config_path);
    }

    print_usage(argv[0]);
    return command.empty() ? 1 : 2;
}
