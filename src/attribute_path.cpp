// cppcheck-suppress-file missingIncludeSystem
#include "attribute_path.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>

#include "types.hpp"
#include "utils.hpp"

namespace sysattr {

namespace {

class ScopedFd {
  public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd()
    {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] bool ok() const { return fd_ >= 0; }
    [[nodiscard]] int get() const { return fd_; }

  private:
    int fd_ = -1;
};

bool is_permission_error(int err)
{
    return err == EACCES || err == EPERM;
}

} // namespace

std::string clean_path(const std::string& path)
{
    std::string out = std::filesystem::path(path).lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    if (out.empty()) {
        return ".";
    }
    return out;
}

std::string logical_attribute_path(const std::string& entry)
{
    if (entry.empty() || entry.front() != '/') {
        return clean_path("/" + entry);
    }
    return clean_path(entry);
}

SysfsRoot::SysfsRoot(std::string root) : root_(std::move(root))
{
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
    if (root_.empty()) {
        root_ = "/";
    }
}

SysfsRoot SysfsRoot::from_env()
{
    return SysfsRoot(env_or_default(kSysfsRootEnv, kDefaultSysfsRoot));
}

std::string SysfsRoot::path(const std::string& logical) const
{
    if (root_ == "/") {
        return logical;
    }
    if (logical.empty() || logical == "/") {
        return root_;
    }
    return root_ + logical;
}

Result<std::string> read_attribute(const std::string& real_path)
{
    struct stat st {};
    if (::stat(real_path.c_str(), &st) != 0) {
        const int err = errno;
        return Error::system(err, "Failed to stat attribute " + real_path);
    }

    if (S_ISDIR(st.st_mode)) {
        // Presence of a directory is the whole signal.
        return std::string{};
    }

    ScopedFd fd(::open(real_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.ok()) {
        const int err = errno;
        if (is_permission_error(err)) {
            return std::string{};
        }
        return Error::system(err, "Failed to open attribute " + real_path);
    }

    std::string content;
    char buf[4096];
    while (content.size() < kAttributeReadMax) {
        const size_t want = std::min(sizeof(buf), kAttributeReadMax - content.size());
        const ssize_t n = ::read(fd.get(), buf, want);
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (is_permission_error(err)) {
                return std::string{};
            }
            return Error::system(err, "Failed to read attribute " + real_path);
        }
        if (n == 0) {
            break;
        }
        content.append(buf, static_cast<size_t>(n));
    }
    return content;
}

} // namespace sysattr
