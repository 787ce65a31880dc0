#pragma once

/**
 * @file commands.hpp
 * @brief Inbound messages consumed by the scheduling loop
 *
 * The manager (and the worker pool, for UnitFinished) push these into the
 * scheduler's command queue; only the scheduling thread handles them, so
 * task state has a single writer.
 */

#include "rup/state/task_state_store.hpp"
#include "rup/upload/conflict.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/transfer_executor.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rup::upload {

struct AddUpload {
    std::string task_id;
    std::shared_ptr<const FileSource> file;
    std::string destination_prefix;
    std::string auth_token;
    bool awaiting_conflict = false;
    std::optional<state::PersistedTaskState> restored;   ///< Progress from an earlier run
};

struct PauseUpload {
    std::string task_id;
};

struct ResumeUpload {
    std::string task_id;
};

struct CancelUpload {
    std::string task_id;
};

struct SetAuth {
    std::string auth_token;
};

/**
 * @brief Publish a StatusSnapshotEvent; also fulfil reply when set
 */
struct GetStatus {
    std::shared_ptr<std::promise<std::vector<TaskSnapshot>>> reply;
};

struct RetryUpload {
    std::string task_id;
};

struct DismissUpload {
    std::string task_id;
};

/**
 * @brief Dismiss every Completed and Failed task at once
 */
struct ClearFinished {};

struct ApplyResolution {
    ConflictDecision decision;
};

/**
 * @brief Posted by a worker when a transfer unit returns
 */
struct UnitFinished {
    std::string task_id;
    TransferUnit unit;
    UnitResult result;
};

struct Shutdown {};

using Command = std::variant<
    AddUpload,
    PauseUpload,
    ResumeUpload,
    CancelUpload,
    SetAuth,
    GetStatus,
    RetryUpload,
    DismissUpload,
    ClearFinished,
    ApplyResolution,
    UnitFinished,
    Shutdown>;

} // namespace rup::upload
