#include "tsync/store/remote_store.hpp"
#include "tsync/store/path_key.hpp"

#include <vector>

namespace tsync::store {

Result<RemoteSnapshot> RemoteStore::snapshot() {
    RemoteSnapshot snapshot;
    std::vector<std::string> pending{""};

    while (!pending.empty()) {
        const std::string directory = pending.back();
        pending.pop_back();

        auto listing = list(directory);
        if (listing.is_error()) {
            return Err<RemoteSnapshot>(listing.error());
        }

        for (const auto& entry : listing.value()) {
            if (PathKey::is_conflict(entry.path)) {
                continue;
            }
            if (entry.is_directory()) {
                snapshot.directories.insert(entry.path);
                pending.push_back(entry.path);
            } else {
                snapshot.files.emplace(entry.path, entry);
            }
        }
    }

    return Ok(std::move(snapshot));
}

Result<void> RemoteStore::ensure_directory(const std::string& path) {
    const std::string normalized = PathKey::normalize(path);
    if (normalized.empty()) {
        return Ok();
    }

    std::string current;
    std::size_t start = 0;
    while (start <= normalized.size()) {
        auto slash = normalized.find('/', start);
        if (slash == std::string::npos) {
            slash = normalized.size();
        }
        current = PathKey::join(current, normalized.substr(start, slash - start));
        start = slash + 1;

        auto existing = stat(current);
        if (existing.is_ok()) {
            if (!existing.value().is_directory()) {
                return Err<void>(ErrorKind::Io, "Remote path exists and is not a directory: " + current);
            }
            continue;
        }
        if (!existing.error().is_not_found()) {
            return Err<void>(existing.error());
        }
        auto created = create_directory(current);
        if (created.is_error()) {
            return created;
        }
    }
    return Ok();
}

} // namespace tsync::store
