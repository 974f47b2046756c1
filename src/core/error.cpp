#include "tsync/core/error.hpp"

#include <cerrno>

namespace tsync {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Io: return "io";
        case ErrorKind::Corrupt: return "corrupt";
        case ErrorKind::Invalid: return "invalid";
    }
    return "unknown";
}

ErrorKind classify_status(int status) noexcept {
    if (status == 404 || status == 410) {
        return ErrorKind::NotFound;
    }
    if (status == 423 || status >= 500) {
        return ErrorKind::Transient;
    }
    return ErrorKind::Io;
}

ErrorKind classify_errno(const std::error_code& ec) noexcept {
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorKind::Io;
    }
    switch (ec.value()) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case ETIMEDOUT:
        case ECONNREFUSED:
        case ECONNRESET:
        case ECONNABORTED:
        case ENETUNREACH:
        case ENETDOWN:
        case EHOSTUNREACH:
        case EHOSTDOWN:
        case ENOTCONN:
        case EAGAIN:
        case EBUSY:
            return ErrorKind::Transient;
        default:
            return ErrorKind::Io;
    }
}

Error error_from_status(int status, const std::string& context) {
    Error error;
    error.kind = classify_status(status);
    error.status = status;
    error.message = context + " (status " + std::to_string(status) + ")";
    return error;
}

Error error_from_code(const std::error_code& ec, const std::string& context) {
    Error error;
    error.kind = classify_errno(ec);
    error.message = context + ": " + ec.message();
    return error;
}

} // namespace tsync
