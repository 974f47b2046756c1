#pragma once

#include "tsync/core/result.hpp"
#include "tsync/store/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tsync::store {

/**
 * @brief Full recursive listing of the remote tree taken once per cycle
 *
 * Conflict artifacts are never part of a snapshot.
 */
struct RemoteSnapshot {
    std::unordered_map<std::string, TreeEntry> files;
    std::unordered_set<std::string> directories;

    [[nodiscard]] bool has_file(const std::string& path) const {
        return files.find(path) != files.end();
    }

    [[nodiscard]] bool has_directory(const std::string& path) const {
        return path.empty() || directories.find(path) != directories.end();
    }

    [[nodiscard]] std::optional<TreeEntry> file(const std::string& path) const {
        auto it = files.find(path);
        if (it == files.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * @brief Capability interface over the remote replica
 *
 * All paths are path keys relative to the remote sync root. Implementations
 * report failures with an Error whose kind follows the engine's taxonomy:
 * NotFound for a missing entity, Transient for connectivity problems and
 * busy servers, Io for anything else.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /// Direct children of a directory ("" is the root)
    virtual Result<std::vector<TreeEntry>> list(const std::string& directory) = 0;

    virtual Result<Buffer> read(const std::string& path) = 0;

    /// Create or overwrite a file with the whole buffer
    virtual Result<void> write(const std::string& path, const Buffer& data) = 0;

    virtual Result<TreeEntry> stat(const std::string& path) = 0;

    /// Create one directory; the parent must exist
    virtual Result<void> create_directory(const std::string& path) = 0;

    virtual Result<void> remove(const std::string& path) = 0;

    /// Server-side copy, overwriting the destination
    virtual Result<void> copy(const std::string& from, const std::string& to) = 0;

    /// Human readable endpoint description for logs
    virtual std::string describe() const = 0;

    /**
     * @brief Recursive listing of the whole tree
     *
     * Uses an explicit worklist over list(); any listing failure aborts the
     * snapshot and is returned as is.
     */
    Result<RemoteSnapshot> snapshot();

    /**
     * @brief Create a directory and any missing ancestors
     */
    Result<void> ensure_directory(const std::string& path);
};

} // namespace tsync::store
