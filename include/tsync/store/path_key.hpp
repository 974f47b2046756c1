#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tsync::store {

/// Token that marks a conflict artifact; such paths are never synchronized
inline constexpr std::string_view kConflictMarker = ".conflict-";

/**
 * @brief Helpers for forward-slash relative path keys
 *
 * The root of a tree is the empty key "".
 */
class PathKey {
public:
    static std::string join(const std::string& parent, const std::string& name);

    /// Parent key, "" for top-level entries and for the root itself
    static std::string parent(const std::string& path);

    static std::string filename(const std::string& path);

    /// Number of segments ("a" -> 1, "a/b" -> 2, "" -> 0)
    static std::size_t depth(const std::string& path) noexcept;

    /// True if any segment carries the conflict marker
    static bool is_conflict(const std::string& path) noexcept;

    /// True if path equals ancestor or lies beneath it ("" contains everything)
    static bool is_within(const std::string& path, const std::string& ancestor) noexcept;

    /// True if any segment is ".."; such keys never name an entry of the tree
    static bool escapes_root(const std::string& path);

    /// Collapse duplicate and trailing slashes, drop leading "/" and "./".
    /// ".." is left in place; check escapes_root() before touching the disk.
    static std::string normalize(const std::string& raw);
};

} // namespace tsync::store
