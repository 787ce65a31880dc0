#pragma once

/**
 * @file upload_manager.hpp
 * @brief Caller-facing entry point of the upload pipeline
 *
 * EXAMPLE:
 * UploadManager manager(config, std::make_shared<HttpUploadTransport>(...));
 * auto sub = manager.subscribe([](const events::UploadEvent& e) { ... });
 * manager.set_auth_token(token);
 * auto id = manager.submit("/data/video.mp4", "media/");
 *
 * Every mutating call is a message to the scheduling thread; its effect
 * is observable through events and the task state store, never through a
 * return value (except submit's InvalidInput).
 *
 * Handlers run on the scheduling thread. They may call any method except
 * status() and submit() with an explicit task id, which wait for that
 * thread. clear_finished() only posts a command and is safe there.
 */

#include "rup/core/config.hpp"
#include "rup/core/result.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"
#include "rup/state/task_state_store.hpp"
#include "rup/upload/conflict.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/scheduler.hpp"
#include "rup/upload/transport.hpp"

#include <boost/uuid/random_generator.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rup::upload {

/**
 * @brief Outcome of a batch submission
 */
struct BatchSubmission {
    std::vector<std::string> task_ids;          ///< In input order
    std::optional<std::uint64_t> conflict_round; ///< Set when some files collided
};

/**
 * @brief Outcome of a directory submission
 */
struct TreeSubmission {
    std::vector<std::string> task_ids;            ///< Ordered by relative path
    std::vector<std::uint64_t> conflict_rounds;   ///< At most one per directory
};

class UploadManager {
public:
    using Listener = std::function<void(const events::UploadEvent&)>;

    /**
     * @param store Durable progress; a MemoryTaskStateStore is used when null
     *              and config.state_dir is empty, a FileTaskStateStore otherwise
     * @throws std::invalid_argument if config does not validate
     */
    UploadManager(UploaderConfig config,
                  std::shared_ptr<UploadTransport> transport,
                  std::shared_ptr<state::TaskStateStore> store = nullptr);
    ~UploadManager();

    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;

    /**
     * @brief Queue one file for upload under destination_prefix
     *
     * @param task_id Reuse an id from recoverable_tasks() to resume; a new
     *                UUID is generated when empty
     * @return Task id, or InvalidInput for a missing / nameless file or an id
     *         that is already active
     */
    Result<std::string> submit(std::shared_ptr<const FileSource> file,
                               const std::string& destination_prefix,
                               const std::string& task_id = {});

    Result<std::string> submit(const std::filesystem::path& path,
                               const std::string& destination_prefix,
                               const std::string& task_id = {});

    /**
     * @brief Queue several files with one existence check and one conflict round
     *
     * Nothing is queued if any file is invalid.
     */
    Result<BatchSubmission> submit_batch(const std::vector<std::shared_ptr<const FileSource>>& files,
                                         const std::string& destination_prefix);

    /**
     * @brief Queue every regular file below root, keeping the folder layout
     *
     * root/sub/a.txt goes to "<prefix>/<root name>/sub/a.txt". Each
     * directory is one batch: one existence check, one conflict round.
     *
     * @return InvalidInput if root is not a directory or holds no files;
     *         nothing is queued if any file cannot be opened
     */
    Result<TreeSubmission> submit_tree(const std::filesystem::path& root,
                                       const std::string& destination_prefix);

    // Unknown or terminal ids are ignored
    void pause(const std::string& task_id);
    void resume(const std::string& task_id);
    void cancel(const std::string& task_id);

    /**
     * @brief Failed -> Pending, keeping the chunks already uploaded
     */
    void retry(const std::string& task_id);

    /**
     * @brief Forget a Completed or Failed task and its saved state
     */
    void dismiss(const std::string& task_id);

    /**
     * @brief Dismiss every Completed and Failed task
     */
    void clear_finished();

    /**
     * @brief Used from the next transfer attempt on; in-flight attempts keep the old one
     */
    void set_auth_token(std::string token);

    /**
     * @brief Receive every event published from now on
     */
    [[nodiscard]] events::Subscription subscribe(Listener listener);

    Result<void> resolve_conflict(const std::string& task_id, ConflictResolution resolution);
    Result<void> resolve_all(std::uint64_t round_id, ConflictResolution resolution);

    /**
     * @brief Snapshot of every active task, in submission order
     *
     * Blocks until the scheduling thread answers.
     */
    std::vector<TaskSnapshot> status();

    /**
     * @brief Ask for a StatusSnapshotEvent without waiting for it
     */
    void request_status();

    /**
     * @brief Progress left behind by an earlier run
     *
     * Unfinished entries come back as Paused; Completed and Cancelled
     * entries are skipped.
     */
    Result<std::vector<state::PersistedTaskState>> recoverable_tasks();

    events::EventBus& bus() noexcept { return bus_; }
    [[nodiscard]] const UploaderConfig& config() const noexcept { return config_; }

private:
    static Result<void> check_file(const std::shared_ptr<const FileSource>& file);
    std::string new_task_id();
    bool is_active(const std::string& task_id);
    std::optional<state::PersistedTaskState> restorable(const std::string& task_id, const FileSource& file);
    void post(Command command);

    UploaderConfig config_;
    std::shared_ptr<UploadTransport> transport_;
    std::shared_ptr<state::TaskStateStore> store_;

    events::EventBus bus_;
    AuthToken auth_;
    ConflictNegotiator negotiator_;
    UploadScheduler scheduler_;

    std::mutex id_mutex_;
    boost::uuids::random_generator id_generator_;
};

} // namespace rup::upload
