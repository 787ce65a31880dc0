/**
 * @file events.hpp
 * @brief Outbound events of the upload pipeline
 *
 * NAMING CONVENTION:
 * - Events are past-tense or state reports: UploadCancelledEvent, UploadProgressEvent
 * - Inbound commands live in upload/commands.hpp
 *
 * Every event is an immutable snapshot; handlers may keep copies.
 */

#pragma once

#include "rup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rup::events {

// ════════════════════════════════════════════════════════
// Task Events
// ════════════════════════════════════════════════════════

/**
 * @brief A task's progress or status changed
 *
 * WHO EMITS: UploadScheduler, after the change has been persisted
 * WHO SUBSCRIBES: UploadManager listeners, LoggerComponent
 */
struct UploadProgressEvent {
    std::string task_id;
    std::string file_name;
    int progress_percent = 0;
    upload::TaskStatus status = upload::TaskStatus::Pending;
    std::optional<std::string> error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A task was cancelled and will disappear from the active set
 */
struct UploadCancelledEvent {
    std::string task_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Progress was written to the task state store
 *
 * Always precedes the UploadProgressEvent for the same change.
 */
struct ProgressSavedEvent {
    std::string task_id;
    std::vector<std::uint32_t> uploaded_chunk_indices;
    int progress_percent = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Answer to a GetStatus command
 */
struct StatusSnapshotEvent {
    std::vector<upload::TaskSnapshot> tasks;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

/**
 * @brief One negotiation round is waiting for decisions
 *
 * WHO EMITS: ConflictNegotiator
 * WHO SUBSCRIBES: the caller's conflict UI, which answers through
 *                 UploadManager::resolve_conflict / resolve_all
 */
struct ConflictBatchEvent {
    std::uint64_t round_id = 0;
    std::vector<upload::ConflictRecord> conflicts;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConflictResolvedEvent {
    std::uint64_t round_id = 0;
    std::string task_id;
    upload::ConflictResolution resolution = upload::ConflictResolution::Cancel;
    std::string destination_name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Everything a manager subscriber can receive
 */
using UploadEvent = std::variant<
    UploadProgressEvent,
    UploadCancelledEvent,
    ProgressSavedEvent,
    StatusSnapshotEvent,
    ConflictBatchEvent,
    ConflictResolvedEvent>;

} // namespace rup::events
