#include "rup/upload/task_lifecycle.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace rup::upload {
namespace {

const std::unordered_map<TaskStatus, std::vector<TaskStatus>>& transition_table() {
    static const std::unordered_map<TaskStatus, std::vector<TaskStatus>> transitions {
        {TaskStatus::Pending, {TaskStatus::Uploading, TaskStatus::Paused, TaskStatus::AwaitingConflictResolution,
                               TaskStatus::Completed, TaskStatus::Cancelled}},
        {TaskStatus::Uploading, {TaskStatus::Paused, TaskStatus::AwaitingConflictResolution, TaskStatus::Completed,
                                 TaskStatus::Failed, TaskStatus::Cancelled}},
        {TaskStatus::Paused, {TaskStatus::Pending, TaskStatus::Cancelled}},
        {TaskStatus::AwaitingConflictResolution, {TaskStatus::Pending, TaskStatus::Cancelled}},
        {TaskStatus::Failed, {TaskStatus::Pending}},
    };
    return transitions;
}

} // namespace

bool TaskLifecycle::can_transition(TaskStatus current, TaskStatus target) noexcept {
    if (current == target) {
        return true;
    }
    const auto& table = transition_table();
    const auto it = table.find(current);
    if (it == table.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), target) != it->second.end();
}

Result<void> TaskLifecycle::transition(UploadTask& task, TaskStatus target) {
    if (!can_transition(task.status, target)) {
        return Err<void>(ErrorKind::InvalidInput,
                         std::string("illegal task transition ") + to_string(task.status) + " -> " + to_string(target));
    }
    task.status = target;
    if (target != TaskStatus::Failed) {
        task.last_error.reset();
    }
    return Ok();
}

Result<void> TaskLifecycle::mark_failed(UploadTask& task, std::string error_message) {
    auto result = transition(task, TaskStatus::Failed);
    if (result.is_ok()) {
        task.last_error = std::move(error_message);
    }
    return result;
}

} // namespace rup::upload
