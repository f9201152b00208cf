// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

namespace sysattr {

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);

// Split "key=value" at the first '='; both halves are trimmed.
bool parse_key_value(const std::string& line, std::string& key, std::string& value);

bool parse_uint64(const std::string& s, uint64_t& out);

std::string json_escape(const std::string& in);

std::string env_or_default(const char* env_name, const std::string& fallback);

// "1", "true", "yes", "on" (case-insensitive).
bool env_truthy(const char* env_name);

} // namespace sysattr
