#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <string>

namespace rup::upload {

/**
 * @brief Legal status transitions for an UploadTask
 *
 * Pending -> Uploading | Paused | AwaitingConflictResolution | Completed | Cancelled
 * Uploading -> Paused | AwaitingConflictResolution | Completed | Failed | Cancelled
 * Paused -> Pending | Cancelled
 * AwaitingConflictResolution -> Pending | Cancelled
 * Failed -> Pending (explicit retry only)
 * Completed, Cancelled -> nothing
 */
class TaskLifecycle {
public:
    [[nodiscard]] static bool can_transition(TaskStatus current, TaskStatus target) noexcept;

    /**
     * @brief Move the task to target, clearing last_error unless target is Failed
     */
    static Result<void> transition(UploadTask& task, TaskStatus target);

    static Result<void> mark_failed(UploadTask& task, std::string error_message);
};

} // namespace rup::upload
