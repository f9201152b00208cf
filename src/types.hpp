// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace sysattr {

inline constexpr const char* kSourceName = "sysfs";
inline constexpr const char* kAttributeFeature = "attribute";
inline constexpr const char* kDefaultSysfsRoot = "/sys";
inline constexpr const char* kSysfsRootEnv = "SYSATTR_SYSFS_ROOT";
inline constexpr const char* kDefaultConfigPath = "/etc/sysattr/sysfs.conf";
inline constexpr int kConfigVersion = 1;

// Label values are capped at 63 characters downstream; 62 keeps one spare.
inline constexpr size_t kLabelValueMax = 62;
// Attribute names leave room for a fixed-size suffix appended by the consumer.
inline constexpr size_t kAttributeNameMax = 55;
// Upper bound on bytes read from a single attribute node.
inline constexpr size_t kAttributeReadMax = 64 * 1024;

using AttributeElements = std::map<std::string, std::string>;
using Labels = std::map<std::string, std::string>;

struct AttributeFeature {
    AttributeElements elements;
};

struct Features {
    std::map<std::string, AttributeFeature> attributes;
};

} // namespace sysattr
