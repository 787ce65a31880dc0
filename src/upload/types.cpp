#include "rup/upload/types.hpp"

#include <unordered_map>

namespace rup::upload {

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Uploading: return "uploading";
        case TaskStatus::Paused: return "paused";
        case TaskStatus::AwaitingConflictResolution: return "awaiting_conflict_resolution";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

TaskStatus status_from_string(const std::string& name) {
    static const std::unordered_map<std::string, TaskStatus> names {
        {"pending", TaskStatus::Pending},
        {"uploading", TaskStatus::Uploading},
        {"paused", TaskStatus::Paused},
        {"awaiting_conflict_resolution", TaskStatus::AwaitingConflictResolution},
        {"completed", TaskStatus::Completed},
        {"failed", TaskStatus::Failed},
        {"cancelled", TaskStatus::Cancelled},
    };
    const auto it = names.find(name);
    return it == names.end() ? TaskStatus::Pending : it->second;
}

const char* to_string(ConflictResolution resolution) {
    switch (resolution) {
        case ConflictResolution::Replace: return "replace";
        case ConflictResolution::Keep: return "keep";
        case ConflictResolution::Cancel: return "cancel";
    }
    return "unknown";
}

int UploadTask::progress_percent() const noexcept {
    if (status == TaskStatus::Completed) {
        return 100;
    }
    if (chunk_plan.empty()) {
        return 0;
    }
    return static_cast<int>((uploaded_chunks.size() * 100) / chunk_plan.size());
}

std::optional<ChunkDescriptor> UploadTask::next_missing_chunk() const {
    for (const auto& chunk : chunk_plan) {
        if (uploaded_chunks.count(chunk.index) == 0) {
            return chunk;
        }
    }
    return std::nullopt;
}

TaskSnapshot make_snapshot(const UploadTask& task) {
    TaskSnapshot snapshot;
    snapshot.task_id = task.id;
    snapshot.file_name = task.file_name;
    snapshot.destination_name = task.destination_name;
    snapshot.file_size = task.file_size;
    snapshot.progress_percent = task.progress_percent();
    snapshot.status = task.status;
    snapshot.error = task.last_error;
    snapshot.uploaded_chunks.assign(task.uploaded_chunks.begin(), task.uploaded_chunks.end());
    snapshot.total_chunks = task.chunk_plan.size();
    return snapshot;
}

} // namespace rup::upload
