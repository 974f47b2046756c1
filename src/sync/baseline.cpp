#include "tsync/sync/baseline.hpp"
#include "tsync/store/path_key.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>

namespace tsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kFilesField = "files";
constexpr const char* kDirectoriesField = "directories";
constexpr const char* kHexDigits = "0123456789ABCDEF";

bool in_range(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

// Length of the well-formed UTF-8 sequence starting at pos, 0 if there is none
std::size_t utf8_sequence(const std::string& text, std::size_t pos) {
    const auto at = [&text, pos](std::size_t offset) -> unsigned char {
        return pos + offset < text.size() ? static_cast<unsigned char>(text[pos + offset]) : 0;
    };

    const unsigned char lead = at(0);
    if (lead < 0x80) {
        return 1;
    }
    if (in_range(lead, 0xC2, 0xDF)) {
        return in_range(at(1), 0x80, 0xBF) ? 2 : 0;
    }
    if (in_range(lead, 0xE0, 0xEF)) {
        const unsigned char low = lead == 0xE0 ? 0xA0 : 0x80;
        const unsigned char high = lead == 0xED ? 0x9F : 0xBF;
        return in_range(at(1), low, high) && in_range(at(2), 0x80, 0xBF) ? 3 : 0;
    }
    if (in_range(lead, 0xF0, 0xF4)) {
        const unsigned char low = lead == 0xF0 ? 0x90 : 0x80;
        const unsigned char high = lead == 0xF4 ? 0x8F : 0xBF;
        return in_range(at(1), low, high) && in_range(at(2), 0x80, 0xBF) && in_range(at(3), 0x80, 0xBF) ? 4 : 0;
    }
    return 0;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

void read_keys(const json& root, const char* field, const std::function<void(const std::string&)>& add) {
    auto section = root.find(field);
    if (section == root.end() || !section->is_object()) {
        return;
    }
    for (auto it = section->begin(); it != section->end(); ++it) {
        if (it.value().is_boolean() && !it.value().get<bool>()) {
            continue;
        }
        add(decode_key(it.key()));
    }
}

} // namespace

std::string encode_key(const std::string& path) {
    std::string encoded;
    encoded.reserve(path.size());

    std::size_t pos = 0;
    while (pos < path.size()) {
        const auto length = utf8_sequence(path, pos);
        if (length == 0 || path[pos] == '%') {
            const auto byte = static_cast<unsigned char>(path[pos]);
            encoded += '%';
            encoded += kHexDigits[byte >> 4];
            encoded += kHexDigits[byte & 0x0F];
            ++pos;
            continue;
        }
        encoded.append(path, pos, length);
        pos += length;
    }
    return encoded;
}

std::string decode_key(const std::string& key) {
    std::string decoded;
    decoded.reserve(key.size());

    for (std::size_t pos = 0; pos < key.size(); ++pos) {
        if (key[pos] == '%' && pos + 2 < key.size()) {
            const int high = hex_value(key[pos + 1]);
            const int low = hex_value(key[pos + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>((high << 4) | low);
                pos += 2;
                continue;
            }
        }
        decoded += key[pos];
    }
    return decoded;
}

bool Ledger::add(const std::string& path) {
    if (path.empty() || store::PathKey::is_conflict(path)) {
        return false;
    }
    entries_[path] = true;
    return true;
}

bool Ledger::remove(const std::string& path) {
    return entries_.erase(path) > 0;
}

bool Ledger::contains(const std::string& path) const {
    return entries_.find(path) != entries_.end();
}

bool Ledger::add_directory(const std::string& path) {
    if (path.empty() || store::PathKey::is_conflict(path)) {
        return false;
    }
    return directories_.insert(path).second;
}

bool Ledger::remove_directory(const std::string& path) {
    return directories_.erase(path) > 0;
}

bool Ledger::contains_directory(const std::string& path) const {
    return directories_.count(path) != 0;
}

std::vector<std::string> Ledger::paths() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [path, present] : entries_) {
        result.push_back(path);
    }
    return result;
}

BaselineStore::BaselineStore(fs::path file) : file_(std::move(file)) {}

Ledger BaselineStore::parse(const std::string& document) {
    Ledger ledger;
    auto root = json::parse(document, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return ledger;
    }
    read_keys(root, kFilesField, [&ledger](const std::string& path) { ledger.add(path); });
    read_keys(root, kDirectoriesField, [&ledger](const std::string& path) { ledger.add_directory(path); });
    return ledger;
}

std::string BaselineStore::serialize(const Ledger& ledger) {
    json files = json::object();
    for (const auto& [path, present] : ledger.entries()) {
        files[encode_key(path)] = present;
    }
    json root;
    root[kFilesField] = files;

    if (!ledger.directories().empty()) {
        json directories = json::object();
        for (const auto& path : ledger.directories()) {
            directories[encode_key(path)] = true;
        }
        root[kDirectoriesField] = directories;
    }
    return root.dump(2);
}

Ledger BaselineStore::load() const {
    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        spdlog::debug("No baseline at {}, starting empty", file_.string());
        return Ledger{};
    }

    std::ifstream input(file_, std::ios::binary);
    if (!input) {
        spdlog::warn("Baseline {} unreadable, starting empty", file_.string());
        return Ledger{};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto root = json::parse(buffer.str(), nullptr, false);
    if (root.is_discarded() || !root.is_object() || !root.contains(kFilesField)) {
        spdlog::warn("Baseline {} is corrupt, starting empty", file_.string());
        return Ledger{};
    }
    return parse(buffer.str());
}

Result<void> BaselineStore::save(const Ledger& ledger) const {
    std::error_code ec;
    const auto parent = file_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Err<void>(error_from_code(ec, "Failed to create baseline directory"));
        }
    }

    fs::path temp = file_;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorKind::Io, "Failed to open " + temp.string());
        }
        output << serialize(ledger);
        output.flush();
        if (!output) {
            return Err<void>(ErrorKind::Io, "Failed to write " + temp.string());
        }
    }

    fs::rename(temp, file_, ec);
    if (ec) {
        const auto rename_error = ec;
        fs::remove(temp, ec);
        return Err<void>(error_from_code(rename_error, "Failed to replace baseline " + file_.string()));
    }
    return Ok();
}

} // namespace tsync::sync
