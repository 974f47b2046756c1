#include "tsync/sync/conflict.hpp"
#include "tsync/store/path_key.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace tsync::sync {
namespace {

std::string format_utc(Timestamp when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(when));
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%d-%H%M%S");
    return oss.str();
}

// "a.txt" -> {"a", ".txt"}, ".bashrc" -> {".bashrc", ""}
std::pair<std::string, std::string> split_extension(const std::string& filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {filename, {}};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

} // namespace

const char* to_string(Action action) noexcept {
    switch (action) {
        case Action::NoOp: return "noop";
        case Action::Upload: return "upload";
        case Action::Download: return "download";
        case Action::UploadPreservingRemote: return "upload-preserving-remote";
        case Action::PreserveRemoteLocally: return "preserve-remote-locally";
    }
    return "unknown";
}

const char* to_string(ArtifactOrigin origin) noexcept {
    return origin == ArtifactOrigin::Local ? "local" : "remote";
}

ConflictResolver::ConflictResolver(std::chrono::milliseconds tolerance)
    : tolerance_(tolerance) {}

Decision ConflictResolver::decide(const std::optional<TreeEntry>& local,
                                  const std::optional<TreeEntry>& remote,
                                  Direction direction) const {
    if (!local && !remote) {
        return Decision{Action::NoOp, 0};
    }
    if (!local) {
        return Decision{Action::Download, 0};
    }
    if (!remote) {
        return Decision{Action::Upload, 0};
    }

    const auto delta = (remote->modified_time - local->modified_time).count();
    const auto tolerance = tolerance_.count();

    if (delta > tolerance) {
        const auto action = direction == Direction::Upload ? Action::UploadPreservingRemote
                                                           : Action::PreserveRemoteLocally;
        return Decision{action, delta};
    }
    if (delta < -tolerance) {
        // Local newer: only the upload walk acts on it
        const auto action = direction == Direction::Upload ? Action::Upload : Action::NoOp;
        return Decision{action, delta};
    }
    return Decision{Action::NoOp, delta};
}

std::string artifact_name(const std::string& path,
                          ArtifactOrigin origin,
                          Timestamp when,
                          unsigned disambiguator) {
    const auto parent = store::PathKey::parent(path);
    const auto [stem, extension] = split_extension(store::PathKey::filename(path));

    std::ostringstream name;
    name << stem << store::kConflictMarker << to_string(origin) << '-' << format_utc(when);
    if (disambiguator > 0) {
        name << '-' << disambiguator;
    }
    name << extension;
    return store::PathKey::join(parent, name.str());
}

std::string unique_artifact_name(const std::string& path,
                                 ArtifactOrigin origin,
                                 Timestamp when,
                                 const std::function<bool(const std::string&)>& exists) {
    unsigned disambiguator = 0;
    std::string candidate = artifact_name(path, origin, when, disambiguator);
    while (exists(candidate)) {
        candidate = artifact_name(path, origin, when, ++disambiguator);
    }
    return candidate;
}

} // namespace tsync::sync
