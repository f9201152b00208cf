// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sysattr {

enum class ErrorCode {
    Ok = 0,
    InvalidArgument,
    ResourceNotFound,
    PermissionDenied,
    IoError,
    ConfigParseFailed,
    ConfigTypeMismatch,
};

const char* error_code_name(ErrorCode code);

class Error {
  public:
    Error(ErrorCode code, std::string message, std::string context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context))
    {
    }

    static Error system(int err, const std::string& message)
    {
        ErrorCode code = ErrorCode::IoError;
        if (err == ENOENT || err == ENOTDIR) {
            code = ErrorCode::ResourceNotFound;
        } else if (err == EACCES || err == EPERM) {
            code = ErrorCode::PermissionDenied;
        }
        return Error(code, message, std::strerror(err));
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& context() const { return context_; }

    [[nodiscard]] std::string to_string() const
    {
        std::string out = message_;
        if (!context_.empty()) {
            out += ": " + context_;
        }
        return out;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string context_;
};

template <typename T>
class [[nodiscard]] Result {
  public:
    Result(const T& value) : storage_(value) {}
    Result(T&& value) : storage_(std::move(value)) {}
    Result(const Error& error) : storage_(error) {}
    Result(Error&& error) : storage_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(storage_); }
    const T& value() const& { return std::get<T>(storage_); }
    T&& value() && { return std::get<T>(std::move(storage_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(storage_); }

  private:
    std::variant<T, Error> storage_;
};

template <>
class [[nodiscard]] Result<void> {
  public:
    Result() = default;
    Result(const Error& error) : error_(error), has_error_(true) {}
    Result(Error&& error) : error_(std::move(error)), has_error_(true) {}

    [[nodiscard]] bool ok() const { return !has_error_; }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_{ErrorCode::Ok, {}};
    bool has_error_ = false;
};

// Propagate the error of a Result-returning expression to the caller.
#define TRY(expr)                                                                                                      \
    do {                                                                                                               \
        auto _sysattr_try_result = (expr);                                                                             \
        if (!_sysattr_try_result) {                                                                                    \
            return _sysattr_try_result.error();                                                                        \
        }                                                                                                              \
    } while (0)

} // namespace sysattr
