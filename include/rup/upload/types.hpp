#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rup::upload {

enum class TaskStatus {
    Pending,
    Uploading,
    Paused,
    AwaitingConflictResolution,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(TaskStatus status);

/**
 * @brief Parse the persisted status name; unknown names map to Pending
 */
TaskStatus status_from_string(const std::string& name);

[[nodiscard]] inline bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed
        || status == TaskStatus::Failed
        || status == TaskStatus::Cancelled;
}

/**
 * @brief One contiguous byte range of a file
 */
struct ChunkDescriptor {
    std::uint32_t index = 0;
    std::uint64_t byte_offset = 0;
    std::uint64_t byte_length = 0;

    bool operator==(const ChunkDescriptor& other) const {
        return index == other.index
            && byte_offset == other.byte_offset
            && byte_length == other.byte_length;
    }
};

using ChunkPlan = std::vector<ChunkDescriptor>;

/**
 * @brief One logical file transfer, owned by the scheduler
 */
struct UploadTask {
    std::string id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string destination_prefix;
    std::string destination_name;       ///< Differs from file_name after a "keep" resolution
    bool overwrite = false;             ///< Set by a "replace" resolution
    ChunkPlan chunk_plan;
    std::set<std::uint32_t> uploaded_chunks;
    TaskStatus status = TaskStatus::Pending;
    std::optional<std::string> last_error;
    std::string auth_token;

    /**
     * @brief floor(|uploaded| / |plan| * 100), 100 once Completed
     */
    [[nodiscard]] int progress_percent() const noexcept;

    [[nodiscard]] bool all_chunks_uploaded() const noexcept {
        return uploaded_chunks.size() == chunk_plan.size();
    }

    [[nodiscard]] std::optional<ChunkDescriptor> next_missing_chunk() const;
};

/**
 * @brief Object already present at the destination, as reported by a listing
 */
struct RemoteObject {
    std::string key;
    std::uint64_t size = 0;
    std::string last_modified;
};

struct ConflictRecord {
    std::string task_id;
    std::string destination_path;   ///< prefix + file name
    RemoteObject existing;
};

enum class ConflictResolution {
    Replace,
    Keep,
    Cancel
};

const char* to_string(ConflictResolution resolution);

/**
 * @brief Read-only view of a task handed to observers
 */
struct TaskSnapshot {
    std::string task_id;
    std::string file_name;
    std::string destination_name;
    std::uint64_t file_size = 0;
    int progress_percent = 0;
    TaskStatus status = TaskStatus::Pending;
    std::optional<std::string> error;
    std::vector<std::uint32_t> uploaded_chunks;
    std::size_t total_chunks = 0;
};

TaskSnapshot make_snapshot(const UploadTask& task);

} // namespace rup::upload
