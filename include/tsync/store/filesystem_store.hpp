#pragma once

#include "tsync/store/local_store.hpp"
#include "tsync/store/remote_store.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tsync::store {

/**
 * @brief std::filesystem operations rooted at a directory
 *
 * Shared by both filesystem-backed adapters. OS errors are translated with
 * classify_errno, so a dropped network mount surfaces as Transient.
 */
class FilesystemTree {
public:
    explicit FilesystemTree(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    Result<std::vector<TreeEntry>> list(const std::string& directory) const;
    Result<Buffer> read(const std::string& path) const;
    Result<void> write(const std::string& path, const Buffer& data) const;
    Result<TreeEntry> stat(const std::string& path) const;
    Result<void> set_modified_time(const std::string& path, Timestamp time) const;
    Result<void> make_directories(const std::string& path) const;
    Result<void> create_directory(const std::string& path) const;
    Result<void> remove_file(const std::string& path) const;
    Result<void> remove_empty_directory(const std::string& path) const;
    Result<void> copy_file(const std::string& from, const std::string& to) const;

    /// Location of a key under the root; keys with a ".." segment are Invalid
    Result<std::filesystem::path> absolute(const std::string& path) const;

    static Timestamp to_timestamp(std::filesystem::file_time_type time);
    static std::filesystem::file_time_type to_file_time(Timestamp time);

private:
    std::filesystem::path root_;
};

/**
 * @brief Local replica on the machine's own disk
 */
class FilesystemLocalStore : public LocalStore {
public:
    explicit FilesystemLocalStore(std::filesystem::path root);

    Result<std::vector<TreeEntry>> list(const std::string& directory) override;
    Result<Buffer> read(const std::string& path) override;
    Result<void> write(const std::string& path, const Buffer& data) override;
    Result<TreeEntry> stat(const std::string& path) override;
    Result<void> set_modified_time(const std::string& path, Timestamp time) override;
    Result<void> make_directories(const std::string& path) override;
    Result<void> remove_file(const std::string& path) override;
    Result<void> remove_empty_directory(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return tree_.root(); }

private:
    FilesystemTree tree_;
};

/**
 * @brief Remote replica reached through a mounted directory
 *
 * Used with a davfs2/sshfs/SMB mount of the remote share: the mount point is
 * treated as the remote root and connectivity failures of the mount surface as
 * Transient errors.
 */
class DirectoryRemoteStore : public RemoteStore {
public:
    explicit DirectoryRemoteStore(std::filesystem::path mount_root);

    Result<std::vector<TreeEntry>> list(const std::string& directory) override;
    Result<Buffer> read(const std::string& path) override;
    Result<void> write(const std::string& path, const Buffer& data) override;
    Result<TreeEntry> stat(const std::string& path) override;
    Result<void> create_directory(const std::string& path) override;
    Result<void> remove(const std::string& path) override;
    Result<void> copy(const std::string& from, const std::string& to) override;
    std::string describe() const override;

private:
    FilesystemTree tree_;
};

} // namespace tsync::store
