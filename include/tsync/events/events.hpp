/**
 * @file events.hpp
 * @brief Event types published by the sync engine
 *
 * The engine never prints progress itself. Everything a user or an operator
 * might want to see (status lines, transfers, conflicts, deletions) is
 * published on the EventBus and rendered by subscribers.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileUploadedEvent, DeletionsAppliedEvent
 */

#pragma once

#include "tsync/core/error.hpp"
#include "tsync/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tsync::events {

enum class StatusLevel {
    Ok,
    Warning,
    Error
};

/// Which replica an operation touched
enum class Replica {
    Local,
    Remote
};

inline const char* to_string(StatusLevel level) noexcept {
    switch (level) {
        case StatusLevel::Ok: return "ok";
        case StatusLevel::Warning: return "warning";
        case StatusLevel::Error: return "error";
    }
    return "unknown";
}

inline const char* to_string(Replica replica) noexcept {
    return replica == Replica::Local ? "local" : "remote";
}

// ════════════════════════════════════════════════════════
// Status Events
// ════════════════════════════════════════════════════════

/**
 * @brief User-facing status line
 *
 * WHO EMITS:
 * - SyncService (login outcome)
 * - Orchestrator (exactly once per cycle attempt)
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (prints it)
 * - StatusComponent (keeps the latest one)
 */
struct StatusEvent {
    StatusLevel level = StatusLevel::Ok;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct SessionStartedEvent {
    std::string endpoint;
    std::string local_root;
    std::chrono::minutes interval{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionStoppedEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Cycle Events
// ════════════════════════════════════════════════════════

struct CycleStartedEvent {
    std::uint64_t cycle_id = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct CycleCompletedEvent {
    sync::CycleReport report;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A cycle attempt was aborted
 *
 * consecutive_failures already includes this failure.
 */
struct CycleFailedEvent {
    std::uint64_t cycle_id = 0;
    ErrorKind kind = ErrorKind::Io;
    std::string error_message;
    std::size_t consecutive_failures = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// A scheduled tick arrived while a cycle was still running
struct TickDroppedEvent {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct IntervalChangedEvent {
    std::chrono::minutes previous{0};
    std::chrono::minutes current{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// File Events
// ════════════════════════════════════════════════════════

struct FileUploadedEvent {
    std::string path;
    std::size_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDownloadedEvent {
    std::string path;
    std::size_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A losing version was preserved under a conflict name
 *
 * WHO EMITS: CycleRunner (upload walk stores it remotely, download walk locally)
 */
struct ConflictArtifactCreatedEvent {
    std::string path;
    std::string artifact_path;
    Replica stored_on = Replica::Remote;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Deletion Events
// ════════════════════════════════════════════════════════

/**
 * @brief A confirmed deletion batch was applied
 *
 * target is the replica the entries were removed from. paths lists only the
 * entries actually removed.
 */
struct DeletionsAppliedEvent {
    Replica target = Replica::Local;
    std::vector<std::string> paths;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct DeletionsDeclinedEvent {
    Replica target = Replica::Local;
    std::size_t count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace tsync::events
