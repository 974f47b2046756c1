#pragma once

#include "tsync/store/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tsync::sync {

using store::Timestamp;
using store::TreeEntry;

/// Which walk is asking for a decision
enum class Direction {
    Upload,
    Download
};

enum class Action {
    NoOp,
    Upload,
    Download,
    UploadPreservingRemote,  ///< Copy remote to an artifact, then upload local over it
    PreserveRemoteLocally    ///< Store remote content as a local artifact, keep local file
};

/// Side whose version a conflict artifact preserves
enum class ArtifactOrigin {
    Local,
    Remote
};

struct Decision {
    Action action = Action::NoOp;
    std::int64_t delta_ms = 0; ///< remote - local, 0 when either side is absent
};

const char* to_string(Action action) noexcept;
const char* to_string(ArtifactOrigin origin) noexcept;

/**
 * @brief Timestamp-only decision function with a local-wins policy
 *
 * Versions whose modify times differ by no more than the tolerance are treated
 * as converged. When remote is newer beyond tolerance the local version still
 * wins and the remote version is preserved as a conflict artifact.
 */
class ConflictResolver {
public:
    static constexpr std::chrono::milliseconds kDefaultTolerance{2000};

    explicit ConflictResolver(std::chrono::milliseconds tolerance = kDefaultTolerance);

    [[nodiscard]] Decision decide(const std::optional<TreeEntry>& local,
                                  const std::optional<TreeEntry>& remote,
                                  Direction direction) const;

    [[nodiscard]] std::chrono::milliseconds tolerance() const noexcept { return tolerance_; }

private:
    std::chrono::milliseconds tolerance_;
};

/**
 * @brief Name of a conflict artifact for path
 *
 * "docs/a.txt" -> "docs/a.conflict-remote-20240101-101500.txt"; a non-zero
 * disambiguator appends "-<n>" before the extension.
 */
std::string artifact_name(const std::string& path,
                          ArtifactOrigin origin,
                          Timestamp when,
                          unsigned disambiguator = 0);

/**
 * @brief First artifact name for which exists() returns false
 */
std::string unique_artifact_name(const std::string& path,
                                 ArtifactOrigin origin,
                                 Timestamp when,
                                 const std::function<bool(const std::string&)>& exists);

} // namespace tsync::sync
