#include "tsync/store/filesystem_store.hpp"
#include "tsync/store/path_key.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace tsync::store {
namespace fs = std::filesystem;

namespace {

std::error_code last_os_error() {
    return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

Error not_found(const std::string& what) {
    return Error{ErrorKind::NotFound, "No such entry: " + what, 0};
}

} // namespace

FilesystemTree::FilesystemTree(fs::path root) : root_(std::move(root)) {}

Result<fs::path> FilesystemTree::absolute(const std::string& path) const {
    const auto key = PathKey::normalize(path);
    if (PathKey::escapes_root(key)) {
        return Err<fs::path>(ErrorKind::Invalid, "Path leaves the tree: " + path);
    }
    if (key.empty()) {
        return Ok(root_);
    }
    return Ok(root_ / fs::path(key));
}

Timestamp FilesystemTree::to_timestamp(fs::file_time_type time) {
    return std::chrono::round<std::chrono::milliseconds>(
        time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

fs::file_time_type FilesystemTree::to_file_time(Timestamp time) {
    return std::chrono::time_point_cast<fs::file_time_type::duration>(
        time - std::chrono::system_clock::now() + fs::file_time_type::clock::now());
}

Result<std::vector<TreeEntry>> FilesystemTree::list(const std::string& directory) const {
    const auto key = PathKey::normalize(directory);
    auto location = absolute(key);
    if (location.is_error()) {
        return Err<std::vector<TreeEntry>>(location.error());
    }
    std::error_code ec;
    fs::directory_iterator it(location.value(), ec);
    if (ec) {
        return Err<std::vector<TreeEntry>>(error_from_code(ec, "Failed to list '" + key + "'"));
    }

    std::vector<TreeEntry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        const auto& item = *it;
        std::error_code item_ec;
        const auto status = item.status(item_ec);
        if (item_ec) {
            continue;
        }

        TreeEntry entry;
        entry.path = PathKey::join(key, item.path().filename().string());
        if (fs::is_directory(status)) {
            entry.kind = EntryKind::Directory;
        } else if (fs::is_regular_file(status)) {
            entry.kind = EntryKind::File;
        } else {
            continue;
        }

        const auto write_time = item.last_write_time(item_ec);
        if (item_ec) {
            continue;
        }
        entry.modified_time = to_timestamp(write_time);
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return Err<std::vector<TreeEntry>>(error_from_code(ec, "Failed to list '" + key + "'"));
    }
    return Ok(std::move(entries));
}

Result<Buffer> FilesystemTree::read(const std::string& path) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<Buffer>(location.error());
    }
    const auto& absolute_path = location.value();
    std::error_code ec;
    const auto status = fs::status(absolute_path, ec);
    if (ec) {
        return Err<Buffer>(error_from_code(ec, "Failed to stat '" + path + "'"));
    }
    if (!fs::is_regular_file(status)) {
        return Err<Buffer>(ErrorKind::Io, "Not a regular file: " + path);
    }

    errno = 0;
    std::ifstream input(absolute_path, std::ios::binary);
    if (!input) {
        return Err<Buffer>(error_from_code(last_os_error(), "Failed to open '" + path + "'"));
    }

    Buffer data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<Buffer>(error_from_code(last_os_error(), "Failed to read '" + path + "'"));
    }
    return Ok(std::move(data));
}

Result<void> FilesystemTree::write(const std::string& path, const Buffer& data) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<void>(location.error());
    }
    const auto& absolute_path = location.value();
    std::error_code ec;
    fs::create_directories(absolute_path.parent_path(), ec);
    if (ec && !fs::exists(absolute_path.parent_path())) {
        return Err<void>(error_from_code(ec, "Failed to create parent of '" + path + "'"));
    }

    errno = 0;
    std::ofstream output(absolute_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(error_from_code(last_os_error(), "Failed to open '" + path + "' for writing"));
    }
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    output.flush();
    if (!output) {
        return Err<void>(error_from_code(last_os_error(), "Failed to write '" + path + "'"));
    }
    return Ok();
}

Result<TreeEntry> FilesystemTree::stat(const std::string& path) const {
    const auto key = PathKey::normalize(path);
    auto location = absolute(key);
    if (location.is_error()) {
        return Err<TreeEntry>(location.error());
    }
    const auto& absolute_path = location.value();
    std::error_code ec;
    const auto status = fs::status(absolute_path, ec);
    if (ec) {
        return Err<TreeEntry>(error_from_code(ec, "Failed to stat '" + key + "'"));
    }
    if (!fs::exists(status)) {
        return Err<TreeEntry>(not_found(key));
    }

    TreeEntry entry;
    entry.path = key;
    entry.kind = fs::is_directory(status) ? EntryKind::Directory : EntryKind::File;
    const auto write_time = fs::last_write_time(absolute_path, ec);
    if (ec) {
        return Err<TreeEntry>(error_from_code(ec, "Failed to read modify time of '" + key + "'"));
    }
    entry.modified_time = to_timestamp(write_time);
    return Ok(std::move(entry));
}

Result<void> FilesystemTree::set_modified_time(const std::string& path, Timestamp time) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<void>(location.error());
    }
    std::error_code ec;
    fs::last_write_time(location.value(), to_file_time(time), ec);
    if (ec) {
        return Err<void>(error_from_code(ec, "Failed to set modify time of '" + path + "'"));
    }
    return Ok();
}

Result<void> FilesystemTree::make_directories(const std::string& path) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<void>(location.error());
    }
    const auto& absolute_path = location.value();
    std::error_code ec;
    fs::create_directories(absolute_path, ec);
    if (ec && !fs::is_directory(absolute_path)) {
        return Err<void>(error_from_code(ec, "Failed to create directory '" + path + "'"));
    }
    return Ok();
}

Result<void> FilesystemTree::create_directory(const std::string& path) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<void>(location.error());
    }
    std::error_code ec;
    fs::create_directory(location.value(), ec);
    if (ec) {
        return Err<void>(error_from_code(ec, "Failed to create directory '" + path + "'"));
    }
    return Ok();
}

Result<void> FilesystemTree::remove_file(const std::string& path) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<void>(location.error());
    }
    const auto& absolute_path = location.value();
    std::error_code ec;
    if (fs::is_directory(absolute_path, ec)) {
        return Err<void>(ErrorKind::Io, "Refusing to remove directory as file: " + path);
    }
    if (!fs::remove(absolute_path, ec)) {
        if (ec) {
            return Err<void>(error_from_code(ec, "Failed to remove '" + path + "'"));
        }
        return Err<void>(not_found(path));
    }
    return Ok();
}

Result<void> FilesystemTree::remove_empty_directory(const std::string& path) const {
    auto location = absolute(path);
    if (location.is_error()) {
        return Err<void>(location.error());
    }
    const auto& absolute_path = location.value();
    std::error_code ec;
    if (!fs::is_directory(absolute_path, ec)) {
        if (ec) {
            return Err<void>(error_from_code(ec, "Failed to stat '" + path + "'"));
        }
        return Err<void>(not_found(path));
    }
    fs::remove(absolute_path, ec);
    if (ec) {
        return Err<void>(error_from_code(ec, "Failed to remove directory '" + path + "'"));
    }
    return Ok();
}

Result<void> FilesystemTree::copy_file(const std::string& from, const std::string& to) const {
    auto source = absolute(from);
    if (source.is_error()) {
        return Err<void>(source.error());
    }
    auto target = absolute(to);
    if (target.is_error()) {
        return Err<void>(target.error());
    }
    std::error_code ec;
    fs::copy_file(source.value(), target.value(), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<void>(error_from_code(ec, "Failed to copy '" + from + "' to '" + to + "'"));
    }
    return Ok();
}

// ───────────────────────────── FilesystemLocalStore ─────────────────────────────

FilesystemLocalStore::FilesystemLocalStore(fs::path root) : tree_(std::move(root)) {}

Result<std::vector<TreeEntry>> FilesystemLocalStore::list(const std::string& directory) {
    return tree_.list(directory);
}

Result<Buffer> FilesystemLocalStore::read(const std::string& path) {
    return tree_.read(path);
}

Result<void> FilesystemLocalStore::write(const std::string& path, const Buffer& data) {
    return tree_.write(path, data);
}

Result<TreeEntry> FilesystemLocalStore::stat(const std::string& path) {
    return tree_.stat(path);
}

Result<void> FilesystemLocalStore::set_modified_time(const std::string& path, Timestamp time) {
    return tree_.set_modified_time(path, time);
}

Result<void> FilesystemLocalStore::make_directories(const std::string& path) {
    return tree_.make_directories(path);
}

Result<void> FilesystemLocalStore::remove_file(const std::string& path) {
    return tree_.remove_file(path);
}

Result<void> FilesystemLocalStore::remove_empty_directory(const std::string& path) {
    return tree_.remove_empty_directory(path);
}

// ───────────────────────────── DirectoryRemoteStore ─────────────────────────────

DirectoryRemoteStore::DirectoryRemoteStore(fs::path mount_root) : tree_(std::move(mount_root)) {}

Result<std::vector<TreeEntry>> DirectoryRemoteStore::list(const std::string& directory) {
    return tree_.list(directory);
}

Result<Buffer> DirectoryRemoteStore::read(const std::string& path) {
    return tree_.read(path);
}

Result<void> DirectoryRemoteStore::write(const std::string& path, const Buffer& data) {
    return tree_.write(path, data);
}

Result<TreeEntry> DirectoryRemoteStore::stat(const std::string& path) {
    return tree_.stat(path);
}

Result<void> DirectoryRemoteStore::create_directory(const std::string& path) {
    return tree_.create_directory(path);
}

Result<void> DirectoryRemoteStore::remove(const std::string& path) {
    return tree_.remove_file(path);
}

Result<void> DirectoryRemoteStore::copy(const std::string& from, const std::string& to) {
    return tree_.copy_file(from, to);
}

std::string DirectoryRemoteStore::describe() const {
    return "dir:" + tree_.root().string();
}

} // namespace tsync::store
