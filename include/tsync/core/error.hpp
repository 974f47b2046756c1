#pragma once

#include <string>
#include <system_error>

namespace tsync {

/**
 * @brief Failure classes the engine reacts to differently
 *
 * Transient  - connectivity loss, timeouts, busy server (drives backoff)
 * NotFound   - entity missing on one side (drives upload/download decisions)
 * Io         - any other failure on a single item (logged, item skipped)
 * Corrupt    - unreadable persisted state (replaced by an empty value)
 * Invalid    - bad configuration or arguments
 */
enum class ErrorKind {
    Transient,
    NotFound,
    Io,
    Corrupt,
    Invalid
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    int status = 0; ///< Protocol status code when the adapter has one (0 otherwise)

    [[nodiscard]] bool is_transient() const noexcept { return kind == ErrorKind::Transient; }
    [[nodiscard]] bool is_not_found() const noexcept { return kind == ErrorKind::NotFound; }
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Map a protocol status code (HTTP/WebDAV numbering) to an error kind
 *
 * 404 and 410 are NotFound; 423 (locked) and anything >= 500 are Transient.
 */
ErrorKind classify_status(int status) noexcept;

/**
 * @brief Map an OS-level error to an error kind
 */
ErrorKind classify_errno(const std::error_code& ec) noexcept;

Error error_from_status(int status, const std::string& context);

Error error_from_code(const std::error_code& ec, const std::string& context);

} // namespace tsync
