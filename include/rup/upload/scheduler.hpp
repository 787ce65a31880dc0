#pragma once

/**
 * @file scheduler.hpp
 * @brief Bounded-concurrency driver for upload tasks
 *
 * ARCHITECTURE:
 *
 *   commands ──► [scheduling thread] ──► jobs ──► [worker 1..W]
 *                      ▲                               │
 *                      └──────── UnitFinished ◄────────┘
 *
 * The scheduling thread owns every UploadTask. Workers only run a
 * TransferExecutor on a copy of the unit and report the outcome back
 * through the command queue.
 *
 * SLOTS:
 * A task holds one of the W slots while a unit of it is in flight. After
 * a successful chunk the next chunk is dispatched under the same slot, so
 * chunks of one task run strictly in order. When a task stops (complete,
 * failed, paused, cancelled, conflict) its slot goes to the oldest Pending
 * task.
 *
 * ORDER OF EFFECTS for every change: persist, ProgressSavedEvent,
 * UploadProgressEvent. If the save fails the UploadProgressEvent repeats
 * the last saved state instead.
 *
 * TIMERS:
 * The loop waits on the command queue until the nearest deadline: a
 * Completed task's removal after completed_grace, or a Failed task's
 * automatic retry after auto_retry_delay.
 */

#include "rup/core/config.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/events/event_queue.hpp"
#include "rup/state/task_state_store.hpp"
#include "rup/upload/cancellation.hpp"
#include "rup/upload/commands.hpp"
#include "rup/upload/conflict.hpp"
#include "rup/upload/transfer_executor.hpp"
#include "rup/upload/transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rup::upload {

class UploadScheduler {
public:
    UploadScheduler(const UploaderConfig& config,
                    UploadTransport& transport,
                    AuthToken& auth,
                    state::TaskStateStore& store,
                    events::EventBus& bus,
                    ConflictNegotiator& negotiator);
    ~UploadScheduler();

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    /**
     * @brief Start the scheduling thread and the worker pool
     */
    void start();

    /**
     * @brief Abort in-flight units and join every thread
     *
     * Tasks keep their persisted progress and can be resubmitted later.
     */
    void stop();

    /**
     * @return false once the scheduler has stopped
     */
    bool post(Command command);

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

private:
    struct ActiveTask {
        UploadTask task;
        std::uint64_t sequence = 0;         ///< Submission order, for snapshots
        std::shared_ptr<const FileSource> file;
        bool whole_file = false;            ///< Small file, or chunk endpoint unsupported (sticky)
        bool in_flight = false;             ///< Holds a slot until the unit returns
        std::optional<CancellationSource> cancel;
        std::optional<std::chrono::steady_clock::time_point> reclaim_at;
        std::optional<std::chrono::steady_clock::time_point> retry_at;
        std::uint32_t auto_retries = 0;
        std::optional<state::PersistedTaskState> last_saved;   ///< Newest state the store accepted
    };

    struct Job {
        TransferUnit unit;
        std::shared_ptr<const FileSource> file;
        CancellationToken cancel;
    };

    void run_loop();
    void worker_loop();

    void handle(AddUpload& cmd);
    void handle(PauseUpload& cmd);
    void handle(ResumeUpload& cmd);
    void handle(CancelUpload& cmd);
    void handle(SetAuth& cmd);
    void handle(GetStatus& cmd);
    void handle(RetryUpload& cmd);
    void handle(DismissUpload& cmd);
    void handle(ClearFinished& cmd);
    void handle(ApplyResolution& cmd);
    void handle(UnitFinished& cmd);

    ActiveTask* find(const std::string& task_id);

    void enqueue(ActiveTask& entry);
    void remove_pending(const std::string& task_id);
    void fill_slots();
    void start_task(ActiveTask& entry);
    void dispatch(ActiveTask& entry);
    void release(ActiveTask& entry);
    void complete(ActiveTask& entry);
    void finalize_cancel(const std::string& task_id);
    void raise_conflict(ActiveTask& entry, const UnitResult& result);
    void schedule_auto_retry(ActiveTask& entry);
    void restart_failed(ActiveTask& entry);
    void forget(const std::string& task_id);

    bool persist(ActiveTask& entry);
    void publish(const UploadTask& task);

    /**
     * @brief Save, then tell observers
     *
     * When the save fails observers get the last state that was saved
     * (nothing if none was), never progress the store does not hold.
     */
    void persist_and_publish(ActiveTask& entry);
    bool change_status(ActiveTask& entry, TaskStatus target);

    std::vector<TaskSnapshot> snapshot() const;
    std::optional<std::chrono::steady_clock::time_point> next_deadline() const;
    void reclaim_expired();
    void retry_due();
    void shutdown_workers();

    UploaderConfig config_;
    AuthToken& auth_;
    state::TaskStateStore& store_;
    events::EventBus& bus_;
    ConflictNegotiator& negotiator_;
    TransferExecutor executor_;

    events::ThreadSafeQueue<Command> commands_;
    events::ThreadSafeQueue<Job> jobs_;
    std::thread loop_thread_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    // Owned by the scheduling thread
    std::unordered_map<std::string, ActiveTask> tasks_;
    std::deque<std::string> pending_;
    std::size_t busy_slots_ = 0;
    std::uint64_t next_sequence_ = 0;
};

} // namespace rup::upload
