#pragma once

#include "tsync/core/result.hpp"
#include "tsync/store/types.hpp"

#include <string>
#include <vector>

namespace tsync::store {

/**
 * @brief Capability interface over the local replica
 *
 * Paths are path keys relative to the local sync root.
 */
class LocalStore {
public:
    virtual ~LocalStore() = default;

    virtual Result<std::vector<TreeEntry>> list(const std::string& directory) = 0;

    virtual Result<Buffer> read(const std::string& path) = 0;

    /// Create or overwrite a file, creating missing parent directories
    virtual Result<void> write(const std::string& path, const Buffer& data) = 0;

    virtual Result<TreeEntry> stat(const std::string& path) = 0;

    virtual Result<void> set_modified_time(const std::string& path, Timestamp time) = 0;

    virtual Result<void> make_directories(const std::string& path) = 0;

    virtual Result<void> remove_file(const std::string& path) = 0;

    /// Fails (kind Io) if the directory still has children
    virtual Result<void> remove_empty_directory(const std::string& path) = 0;

    bool exists(const std::string& path) { return stat(path).is_ok(); }
};

} // namespace tsync::store
