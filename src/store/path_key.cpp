#include "tsync/store/path_key.hpp"

#include <sstream>
#include <vector>

namespace tsync::store {

std::string PathKey::join(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    if (name.empty()) {
        return parent;
    }
    return parent + "/" + name;
}

std::string PathKey::parent(const std::string& path) {
    const auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return {};
    }
    return path.substr(0, slash);
}

std::string PathKey::filename(const std::string& path) {
    const auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::size_t PathKey::depth(const std::string& path) noexcept {
    if (path.empty()) {
        return 0;
    }
    std::size_t segments = 1;
    for (char c : path) {
        if (c == '/') {
            ++segments;
        }
    }
    return segments;
}

bool PathKey::is_conflict(const std::string& path) noexcept {
    return path.find(kConflictMarker) != std::string::npos;
}

bool PathKey::is_within(const std::string& path, const std::string& ancestor) noexcept {
    if (ancestor.empty() || path == ancestor) {
        return true;
    }
    return path.size() > ancestor.size()
        && path.compare(0, ancestor.size(), ancestor) == 0
        && path[ancestor.size()] == '/';
}

bool PathKey::escapes_root(const std::string& path) {
    std::stringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment == "..") {
            return true;
        }
    }
    return false;
}

std::string PathKey::normalize(const std::string& raw) {
    std::vector<std::string> segments;
    std::stringstream stream(raw);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized;
    for (const auto& part : segments) {
        normalized = join(normalized, part);
    }
    return normalized;
}

} // namespace tsync::store
