// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>

#include "result.hpp"

namespace sysattr {

/**
 * Lexically clean a path: collapse repeated separators, drop "." segments,
 * resolve ".." against the preceding segment and remove trailing separators.
 * ".." never climbs above the root of a rooted path. No filesystem access.
 */
std::string clean_path(const std::string& path);

// Root a whitelist entry under "/" (unless already absolute) and clean it.
std::string logical_attribute_path(const std::string& entry);

/**
 * Maps logical sysfs paths onto the directory where the tree is mounted.
 *
 * On a bare host the root is "/sys". In a container the host tree is usually
 * bind-mounted elsewhere and the root points there instead.
 */
class SysfsRoot {
  public:
    explicit SysfsRoot(std::string root);

    // SYSATTR_SYSFS_ROOT if set, otherwise "/sys".
    static SysfsRoot from_env();

    [[nodiscard]] const std::string& root() const { return root_; }

    // Real path of a cleaned absolute logical path.
    [[nodiscard]] std::string path(const std::string& logical) const;

  private:
    std::string root_;
};

/**
 * Read one attribute node.
 *
 * Directories and files that exist but cannot be read for permission reasons
 * yield an empty value. Missing nodes fail with ResourceNotFound. Other stat
 * failures, and open or read failures not caused by permissions, fail with the
 * code Error::system derives from errno. At most kAttributeReadMax bytes are
 * read.
 */
Result<std::string> read_attribute(const std::string& real_path);

} // namespace sysattr
