#include <stdio_mcp/core/result.hpp>

#include <cerrno>
#include <cstring>

namespace stdio_mcp {

Error Error::FromErrno(const std::string& operation,
                       const std::string& target,
                       int errno_value,
                       ErrorCategory category) {
    if (errno_value == ENOENT) {
        category = ErrorCategory::NotFound;
    } else if (errno_value == EACCES || errno_value == EPERM) {
        category = ErrorCategory::NotAllowed;
    }
    return Error{operation, target, std::strerror(errno_value), category,
                 errno_value};
}

} // namespace stdio_mcp
