#pragma once

/**
 * @file task_state_store.hpp
 * @brief Durable mirror of per-task upload progress
 *
 * The scheduler writes a task's entry after every state-changing event
 * and the manager reads it back when a file is resubmitted under the same
 * task id, so an interrupted upload continues from its last confirmed
 * chunk instead of starting over.
 *
 * Layout of one entry (JSON):
 * {
 *   "uploadedChunkIndices": [0, 1, 2],
 *   "progressPercent": 30,
 *   "status": "paused",
 *   "fileName": "video.mp4", "fileSize": 52428800, "chunkSize": 5242880,
 *   "destinationPrefix": "media/", "destinationName": "video.mp4",
 *   "overwrite": false, "lastError": null
 * }
 *
 * CONCURRENCY:
 * Writes for the same task id are serialized; different ids may be
 * written concurrently.
 */

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rup::state {

struct PersistedTaskState {
    std::string task_id;
    std::vector<std::uint32_t> uploaded_chunk_indices;
    int progress_percent = 0;
    upload::TaskStatus status = upload::TaskStatus::Pending;

    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_size = 0;
    std::string destination_prefix;
    std::string destination_name;
    bool overwrite = false;
    std::optional<std::string> last_error;
};

/**
 * @brief Capture everything needed to resume the task later
 */
PersistedTaskState capture(const upload::UploadTask& task, std::uint64_t chunk_size);

std::string encode(const PersistedTaskState& state);
Result<PersistedTaskState> decode(const std::string& document);

class TaskStateStore {
public:
    virtual ~TaskStateStore() = default;

    virtual Result<void> save(const PersistedTaskState& state) = 0;

    /**
     * @return nullopt when nothing is stored for the id
     */
    virtual Result<std::optional<PersistedTaskState>> load(const std::string& task_id) = 0;

    /**
     * @brief Removing an unknown id succeeds
     */
    virtual Result<void> remove(const std::string& task_id) = 0;

    virtual Result<std::vector<PersistedTaskState>> load_all() = 0;
};

/**
 * @brief Process-lifetime store, used when no state directory is configured
 */
class MemoryTaskStateStore : public TaskStateStore {
public:
    Result<void> save(const PersistedTaskState& state) override;
    Result<std::optional<PersistedTaskState>> load(const std::string& task_id) override;
    Result<void> remove(const std::string& task_id) override;
    Result<std::vector<PersistedTaskState>> load_all() override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, PersistedTaskState> entries_;
};

/**
 * @brief One JSON document per task under a directory
 *
 * File names are the hex encoding of the task id, so any id is a valid
 * key. Each save writes a temporary file and renames it over the old one,
 * so a crash mid-write leaves the previous entry intact.
 */
class FileTaskStateStore : public TaskStateStore {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit FileTaskStateStore(std::filesystem::path directory);

    Result<void> save(const PersistedTaskState& state) override;
    Result<std::optional<PersistedTaskState>> load(const std::string& task_id) override;
    Result<void> remove(const std::string& task_id) override;
    Result<std::vector<PersistedTaskState>> load_all() override;

    const std::filesystem::path& directory() const noexcept { return directory_; }

    /**
     * @brief Number of per-id mutexes currently held or waited on
     */
    std::size_t lock_count() const;

private:
    /**
     * @brief Serializes access to one id's file
     *
     * The table entry lives only while some caller holds or waits for it.
     */
    class EntryLock {
    public:
        EntryLock(FileTaskStateStore& store, const std::string& task_id);
        ~EntryLock();

        EntryLock(const EntryLock&) = delete;
        EntryLock& operator=(const EntryLock&) = delete;

    private:
        FileTaskStateStore& store_;
        std::string task_id_;
        std::shared_ptr<std::mutex> mutex_;
    };

    std::filesystem::path path_for(const std::string& task_id) const;

    std::filesystem::path directory_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace rup::state
