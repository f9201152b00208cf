// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <string>

#include "types.hpp"

namespace sysattr {

// [-A-Za-z0-9]: characters a label value may start and end with.
bool is_label_alnum(char c);

// [-A-Za-z0-9_.]: characters allowed anywhere in a label key or value.
bool is_label_char(char c);

/**
 * Derive a dotted attribute name from a cleaned absolute logical path.
 *
 * "/class/power_supply/BAT0/capacity" becomes "class.power_supply.BAT0.capacity".
 * Names longer than max_len are cut from the front at the first '.' found at
 * or after (length - max_len), so the kept suffix starts on a whole path
 * segment. The result may be shorter than max_len. When that region holds no
 * separator the last max_len characters are kept as they are.
 */
std::string build_attribute_name(const std::string& cleaned_path, size_t max_len = kAttributeNameMax);

/**
 * Turn raw attribute content into a label value.
 *
 * Strips a leading run outside [-A-Za-z0-9], collapses each run outside
 * [-A-Za-z0-9_.] into one '_', truncates to kLabelValueMax and then strips a
 * trailing run outside [-A-Za-z0-9]. Applying it twice gives the same result.
 */
std::string sanitize_label_value(const std::string& raw);

// Export pass applied to both keys and values: every run outside
// [-A-Za-z0-9_.] becomes a single '_'.
std::string sanitize_label_key(const std::string& in);

} // namespace sysattr
