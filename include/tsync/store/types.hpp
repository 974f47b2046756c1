#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tsync::store {

/// Millisecond-precision wall clock time used for every modify-time comparison
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

using Buffer = std::vector<std::uint8_t>;

enum class EntryKind {
    File,
    Directory
};

/**
 * @brief One node of either replica
 *
 * path is a path key: forward-slash separated, relative to the sync root,
 * no leading or trailing slash.
 */
struct TreeEntry {
    std::string path;
    EntryKind kind = EntryKind::File;
    Timestamp modified_time{};

    [[nodiscard]] bool is_file() const noexcept { return kind == EntryKind::File; }
    [[nodiscard]] bool is_directory() const noexcept { return kind == EntryKind::Directory; }
};

inline Timestamp now_ms() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

inline std::int64_t to_millis(Timestamp ts) noexcept {
    return ts.time_since_epoch().count();
}

inline Timestamp from_millis(std::int64_t millis) noexcept {
    return Timestamp{std::chrono::milliseconds{millis}};
}

} // namespace tsync::store
