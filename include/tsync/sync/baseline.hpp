#pragma once

#include "tsync/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace tsync::sync {

/**
 * @brief Set of file paths known to exist on both replicas
 *
 * Kept as a sorted map so the persisted document and every candidate list
 * derived from it come out in a deterministic order. Conflict artifacts are
 * never admitted.
 *
 * Directories seen on both replicas are tracked separately; they only decide
 * whether an empty local directory missing on the server was deleted there
 * or has not been uploaded yet.
 */
class Ledger {
public:
    /// Returns false when the path was rejected (conflict artifact or empty key)
    bool add(const std::string& path);

    bool remove(const std::string& path);

    [[nodiscard]] bool contains(const std::string& path) const;

    [[nodiscard]] std::vector<std::string> paths() const;

    bool add_directory(const std::string& path);
    bool remove_directory(const std::string& path);
    [[nodiscard]] bool contains_directory(const std::string& path) const;
    [[nodiscard]] const std::set<std::string>& directories() const noexcept { return directories_; }

    /// Number of files
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty() && directories_.empty(); }

    void clear() noexcept {
        entries_.clear();
        directories_.clear();
    }

    [[nodiscard]] const std::map<std::string, bool>& entries() const noexcept { return entries_; }

    bool operator==(const Ledger& other) const {
        return entries_ == other.entries_ && directories_ == other.directories_;
    }
    bool operator!=(const Ledger& other) const { return !(*this == other); }

private:
    std::map<std::string, bool> entries_;
    std::set<std::string> directories_;
};

/**
 * @brief Make a path key safe for a JSON document
 *
 * Filenames are arbitrary bytes but JSON strings must be UTF-8. '%' and every
 * byte that is not part of a well-formed UTF-8 sequence become %XX;
 * decode_key reverses it exactly.
 */
std::string encode_key(const std::string& path);
std::string decode_key(const std::string& key);

/**
 * @brief Durable home of the ledger
 *
 * Document format: {"files": {"<path>": true, ...}, "directories": {...}}
 * with keys run through encode_key; "directories" is optional. Anything
 * else, including a missing or truncated file, loads as an empty ledger.
 */
class BaselineStore {
public:
    explicit BaselineStore(std::filesystem::path file);

    /// Never fails; corruption is logged and replaced by an empty ledger
    [[nodiscard]] Ledger load() const;

    /// Write to a sibling temp file, then rename it over the target
    Result<void> save(const Ledger& ledger) const;

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

    static Ledger parse(const std::string& document);
    static std::string serialize(const Ledger& ledger);

private:
    std::filesystem::path file_;
};

} // namespace tsync::sync
