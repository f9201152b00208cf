// cppcheck-suppress-file missingIncludeSystem
#include "result.hpp"

namespace sysattr {

const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::ResourceNotFound:
            return "resource_not_found";
        case ErrorCode::PermissionDenied:
            return "permission_denied";
        case ErrorCode::IoError:
            return "io_error";
        case ErrorCode::ConfigParseFailed:
            return "config_parse_failed";
        case ErrorCode::ConfigTypeMismatch:
            return "config_type_mismatch";
    }
    return "unknown";
}

} // namespace sysattr
