#include "rup/upload/scheduler.hpp"

#include "rup/events/events.hpp"
#include "rup/upload/chunk_splitter.hpp"
#include "rup/upload/task_lifecycle.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>

namespace rup::upload {

UploadScheduler::UploadScheduler(const UploaderConfig& config,
                                 UploadTransport& transport,
                                 AuthToken& auth,
                                 state::TaskStateStore& store,
                                 events::EventBus& bus,
                                 ConflictNegotiator& negotiator)
    : config_(config)
    , auth_(auth)
    , store_(store)
    , bus_(bus)
    , negotiator_(negotiator)
    , executor_(transport, auth, RetryPolicy::from_config(config)) {}

UploadScheduler::~UploadScheduler() {
    stop();
}

void UploadScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    commands_.reset();
    jobs_.reset();

    for (std::size_t i = 0; i < config_.max_concurrent_uploads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    loop_thread_ = std::thread([this] { run_loop(); });
    spdlog::debug("Upload scheduler started with {} worker(s)", config_.max_concurrent_uploads);
}

void UploadScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    commands_.push(Shutdown{});
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    commands_.shutdown();

    // Answer status requests that raced with shutdown so no caller waits forever
    while (auto leftover = commands_.try_pop()) {
        if (auto* status = std::get_if<GetStatus>(&*leftover); status != nullptr && status->reply) {
            status->reply->set_value(snapshot());
        }
    }
    spdlog::debug("Upload scheduler stopped");
}

bool UploadScheduler::post(Command command) {
    if (!running_.load()) {
        return false;
    }
    return commands_.push(std::move(command));
}

// ──────────────────────────────────────────────────────────
// Threads
// ──────────────────────────────────────────────────────────

void UploadScheduler::run_loop() {
    for (;;) {
        const auto deadline = next_deadline();
        auto command = deadline ? commands_.pop_until(*deadline) : commands_.pop();

        if (command) {
            if (std::holds_alternative<Shutdown>(*command)) {
                break;
            }
            std::visit([this](auto& cmd) {
                using T = std::decay_t<decltype(cmd)>;
                if constexpr (!std::is_same_v<T, Shutdown>) {
                    handle(cmd);
                }
            }, *command);
        }
        reclaim_expired();
        retry_due();
    }
    shutdown_workers();
}

void UploadScheduler::worker_loop() {
    while (auto job = jobs_.pop()) {
        UnitResult result;
        try {
            result = executor_.execute(job->unit, *job->file, job->cancel);
        } catch (const std::exception& e) {
            spdlog::error("Transfer of {} threw: {}", job->unit.remote_name(), e.what());
            result.outcome = UnitOutcome::Failed;
            result.error = e.what();
        }

        spdlog::debug("Unit {} of task {} finished: {} after {} attempt(s)",
                      job->unit.remote_name(), job->unit.task_id, to_string(result.outcome), result.attempts);

        if (!commands_.push(UnitFinished{job->unit.task_id, job->unit, std::move(result)})) {
            spdlog::debug("Scheduler stopped, dropping result for task {}", job->unit.task_id);
        }
    }
}

void UploadScheduler::shutdown_workers() {
    for (auto& [id, entry] : tasks_) {
        if (entry.cancel) {
            entry.cancel->cancel();
        }
    }
    jobs_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

// ──────────────────────────────────────────────────────────
// Command handlers
// ──────────────────────────────────────────────────────────

void UploadScheduler::handle(AddUpload& cmd) {
    if (tasks_.count(cmd.task_id) > 0) {
        spdlog::warn("Task {} is already active, ignoring duplicate submission", cmd.task_id);
        return;
    }
    if (!cmd.file) {
        spdlog::warn("Task {} submitted without a file", cmd.task_id);
        return;
    }

    ChunkSplitter splitter(config_.chunk_size);
    auto plan = splitter.plan(cmd.file->size());
    if (plan.is_error()) {
        spdlog::error("Cannot plan task {}: {}", cmd.task_id, plan.error().message);
        return;
    }

    ActiveTask entry;
    entry.sequence = next_sequence_++;
    entry.file = cmd.file;
    entry.whole_file = cmd.file->size() < config_.single_shot_threshold;

    UploadTask& task = entry.task;
    task.id = cmd.task_id;
    task.file_name = cmd.file->name();
    task.file_size = cmd.file->size();
    task.destination_prefix = cmd.destination_prefix;
    task.destination_name = task.file_name;
    task.chunk_plan = std::move(plan.value());
    task.auth_token = cmd.auth_token;

    if (cmd.restored) {
        const auto& saved = *cmd.restored;
        if (saved.chunk_size == config_.chunk_size) {
            for (auto index : saved.uploaded_chunk_indices) {
                if (index < task.chunk_plan.size()) {
                    task.uploaded_chunks.insert(index);
                }
            }
        } else {
            spdlog::warn("Task {} was saved with {} byte chunks, restarting it from the first chunk",
                         task.id, saved.chunk_size);
        }
        if (!saved.destination_name.empty()) {
            task.destination_name = saved.destination_name;
        }
        task.overwrite = saved.overwrite;
        entry.last_saved = saved;
        spdlog::info("Restored task {} with {}/{} chunk(s) already uploaded",
                     task.id, task.uploaded_chunks.size(), task.chunk_plan.size());
    }

    auto [it, inserted] = tasks_.emplace(task.id, std::move(entry));
    ActiveTask& added = it->second;

    spdlog::info("Queued upload {} ({}, {} bytes, {} chunk(s))",
                 added.task.id, added.task.file_name, added.task.file_size, added.task.chunk_plan.size());

    if (cmd.awaiting_conflict) {
        change_status(added, TaskStatus::AwaitingConflictResolution);
        persist_and_publish(added);
        return;
    }

    persist_and_publish(added);
    enqueue(added);
    fill_slots();
}

void UploadScheduler::handle(PauseUpload& cmd) {
    auto* entry = find(cmd.task_id);
    if (entry == nullptr) {
        return;
    }
    switch (entry->task.status) {
        case TaskStatus::Uploading:
            if (entry->cancel) {
                entry->cancel->cancel();
            }
            break;
        case TaskStatus::Pending:
            remove_pending(cmd.task_id);
            break;
        default:
            spdlog::debug("Pause ignored for task {} in state {}", cmd.task_id, to_string(entry->task.status));
            return;
    }
    change_status(*entry, TaskStatus::Paused);
    persist_and_publish(*entry);
    fill_slots();
}

void UploadScheduler::handle(ResumeUpload& cmd) {
    auto* entry = find(cmd.task_id);
    if (entry == nullptr || entry->task.status != TaskStatus::Paused) {
        return;
    }
    change_status(*entry, TaskStatus::Pending);
    persist_and_publish(*entry);
    enqueue(*entry);
    fill_slots();
}

void UploadScheduler::handle(CancelUpload& cmd) {
    auto* entry = find(cmd.task_id);
    if (entry == nullptr || is_terminal(entry->task.status)) {
        return;
    }

    negotiator_.withdraw(cmd.task_id);
    remove_pending(cmd.task_id);
    change_status(*entry, TaskStatus::Cancelled);

    if (entry->in_flight) {
        // Finished when the aborted unit reports back
        if (entry->cancel) {
            entry->cancel->cancel();
        }
        return;
    }
    finalize_cancel(cmd.task_id);
}

void UploadScheduler::handle(SetAuth& cmd) {
    auth_.set(cmd.auth_token);
    for (auto& [id, entry] : tasks_) {
        entry.task.auth_token = cmd.auth_token;
    }
    spdlog::info("Auth token updated for {} active task(s)", tasks_.size());
}

void UploadScheduler::handle(GetStatus& cmd) {
    auto tasks = snapshot();
    if (cmd.reply) {
        cmd.reply->set_value(tasks);
    }
    bus_.emit(events::StatusSnapshotEvent{std::move(tasks)});
}

void UploadScheduler::handle(RetryUpload& cmd) {
    auto* entry = find(cmd.task_id);
    if (entry == nullptr || entry->task.status != TaskStatus::Failed) {
        return;
    }
    entry->auto_retries = 0;
    restart_failed(*entry);
}

void UploadScheduler::handle(DismissUpload& cmd) {
    auto* entry = find(cmd.task_id);
    if (entry == nullptr) {
        return;
    }
    const auto status = entry->task.status;
    if (status != TaskStatus::Completed && status != TaskStatus::Failed) {
        spdlog::debug("Dismiss ignored for task {} in state {}", cmd.task_id, to_string(status));
        return;
    }
    forget(cmd.task_id);
}

void UploadScheduler::handle(ClearFinished&) {
    std::vector<std::string> finished;
    for (const auto& [id, entry] : tasks_) {
        if (entry.task.status == TaskStatus::Completed || entry.task.status == TaskStatus::Failed) {
            finished.push_back(id);
        }
    }
    for (const auto& id : finished) {
        forget(id);
    }
    spdlog::debug("Cleared {} finished task(s)", finished.size());
}

void UploadScheduler::handle(ApplyResolution& cmd) {
    const auto& decision = cmd.decision;
    auto* entry = find(decision.task_id);
    if (entry == nullptr || entry->task.status != TaskStatus::AwaitingConflictResolution) {
        spdlog::debug("Resolution for task {} no longer applies", decision.task_id);
        return;
    }

    UploadTask& task = entry->task;
    switch (decision.resolution) {
        case ConflictResolution::Cancel:
            change_status(*entry, TaskStatus::Cancelled);
            finalize_cancel(task.id);
            return;
        case ConflictResolution::Replace:
            task.overwrite = true;
            break;
        case ConflictResolution::Keep:
            if (decision.destination_name != task.destination_name) {
                // Parts already sent were written under the old name
                task.uploaded_chunks.clear();
                task.destination_name = decision.destination_name;
            }
            break;
    }

    spdlog::info("Task {} will upload as {}{}", task.id,
                 join_destination(task.destination_prefix, task.destination_name),
                 task.overwrite ? " (overwrite)" : "");
    change_status(*entry, TaskStatus::Pending);
    persist_and_publish(*entry);
    enqueue(*entry);
    fill_slots();
}

void UploadScheduler::handle(UnitFinished& cmd) {
    auto* entry = find(cmd.task_id);
    if (entry == nullptr) {
        spdlog::debug("Result for unknown task {} dropped", cmd.task_id);
        return;
    }
    UploadTask& task = entry->task;
    const UnitResult& result = cmd.result;
    entry->cancel.reset();

    // Confirmed bytes count whatever the task's status became meanwhile
    bool progressed = false;
    if (result.outcome == UnitOutcome::Succeeded) {
        if (cmd.unit.is_whole_file()) {
            for (const auto& chunk : task.chunk_plan) {
                task.uploaded_chunks.insert(chunk.index);
            }
        } else {
            task.uploaded_chunks.insert(cmd.unit.chunk->index);
        }
        progressed = true;
    }
    if (result.outcome == UnitOutcome::FallbackToWholeFile && !entry->whole_file) {
        spdlog::warn("Chunk endpoint unsupported, task {} falls back to whole-file upload", task.id);
        entry->whole_file = true;
    }

    if (task.status == TaskStatus::Cancelled) {
        release(*entry);
        finalize_cancel(cmd.task_id);
        fill_slots();
        return;
    }
    if (task.status != TaskStatus::Uploading) {
        // Paused, or paused and resumed, while the unit was in flight
        release(*entry);
        if (progressed) {
            persist_and_publish(*entry);
        }
        fill_slots();
        return;
    }

    switch (result.outcome) {
        case UnitOutcome::Succeeded:
            persist_and_publish(*entry);
            if (task.all_chunks_uploaded()) {
                release(*entry);
                complete(*entry);
            } else {
                dispatch(*entry);
            }
            break;

        case UnitOutcome::FallbackToWholeFile:
            dispatch(*entry);
            break;

        case UnitOutcome::Conflict:
            release(*entry);
            raise_conflict(*entry, result);
            break;

        case UnitOutcome::Cancelled:
            // Aborted without a pause or cancel request (scheduler stopping)
            release(*entry);
            change_status(*entry, TaskStatus::Paused);
            persist_and_publish(*entry);
            break;

        case UnitOutcome::Failed:
            release(*entry);
            spdlog::error("Upload {} ({}) failed: {}", task.id, task.file_name, result.error);
            if (auto failed = TaskLifecycle::mark_failed(task, result.error); failed.is_error()) {
                spdlog::warn("{}", failed.error().message);
            }
            persist_and_publish(*entry);
            schedule_auto_retry(*entry);
            break;
    }
    fill_slots();
}

// ──────────────────────────────────────────────────────────
// Scheduling
// ──────────────────────────────────────────────────────────

UploadScheduler::ActiveTask* UploadScheduler::find(const std::string& task_id) {
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : &it->second;
}

void UploadScheduler::enqueue(ActiveTask& entry) {
    remove_pending(entry.task.id);
    pending_.push_back(entry.task.id);
}

void UploadScheduler::remove_pending(const std::string& task_id) {
    pending_.erase(std::remove(pending_.begin(), pending_.end(), task_id), pending_.end());
}

void UploadScheduler::fill_slots() {
    while (busy_slots_ < config_.max_concurrent_uploads && !pending_.empty()) {
        ActiveTask* chosen = nullptr;
        for (auto it = pending_.begin(); it != pending_.end();) {
            auto* entry = find(*it);
            if (entry == nullptr || entry->task.status != TaskStatus::Pending) {
                it = pending_.erase(it);
                continue;
            }
            if (entry->in_flight) {
                // Resumed before its aborted unit came back; wait for it
                ++it;
                continue;
            }
            chosen = entry;
            pending_.erase(it);
            break;
        }
        if (chosen == nullptr) {
            return;
        }
        start_task(*chosen);
    }
}

void UploadScheduler::start_task(ActiveTask& entry) {
    if (entry.task.all_chunks_uploaded()) {
        complete(entry);
        return;
    }
    change_status(entry, TaskStatus::Uploading);
    persist_and_publish(entry);
    spdlog::info("Starting upload {} ({}, {})", entry.task.id, entry.task.file_name,
                 entry.whole_file ? "whole file" : std::to_string(entry.task.chunk_plan.size()) + " chunks");
    dispatch(entry);
}

void UploadScheduler::dispatch(ActiveTask& entry) {
    const UploadTask& task = entry.task;

    TransferUnit unit;
    unit.task_id = task.id;
    unit.file_name = task.destination_name;
    unit.destination_prefix = task.destination_prefix;
    unit.total_chunks = static_cast<std::uint32_t>(task.chunk_plan.size());
    unit.overwrite = task.overwrite;
    if (!entry.whole_file) {
        unit.chunk = task.next_missing_chunk();
        if (!unit.chunk) {
            release(entry);
            complete(entry);
            return;
        }
    }

    entry.cancel.emplace();
    if (!entry.in_flight) {
        entry.in_flight = true;
        ++busy_slots_;
    }
    if (!jobs_.push(Job{std::move(unit), entry.file, entry.cancel->token()})) {
        spdlog::error("Worker pool is shut down, task {} cannot run", task.id);
        release(entry);
    }
}

void UploadScheduler::release(ActiveTask& entry) {
    if (entry.in_flight) {
        entry.in_flight = false;
        --busy_slots_;
    }
}

void UploadScheduler::complete(ActiveTask& entry) {
    change_status(entry, TaskStatus::Completed);
    persist_and_publish(entry);
    entry.reclaim_at = std::chrono::steady_clock::now() + config_.completed_grace;
    spdlog::info("Upload {} ({}) completed", entry.task.id, entry.task.file_name);
}

void UploadScheduler::finalize_cancel(const std::string& task_id) {
    auto* entry = find(task_id);
    if (entry == nullptr) {
        return;
    }
    auto removed = store_.remove(task_id);
    if (removed.is_error()) {
        spdlog::error("Failed to remove saved state of {}: {}", task_id, removed.error().message);
    }
    publish(entry->task);
    tasks_.erase(task_id);
    bus_.emit(events::UploadCancelledEvent{task_id});
}

void UploadScheduler::raise_conflict(ActiveTask& entry, const UnitResult& result) {
    UploadTask& task = entry.task;
    if (task.overwrite) {
        // Already told to replace; another 409 is a real rejection
        if (auto failed = TaskLifecycle::mark_failed(task, result.error); failed.is_error()) {
            spdlog::warn("{}", failed.error().message);
        }
        persist_and_publish(entry);
        schedule_auto_retry(entry);
        return;
    }

    change_status(entry, TaskStatus::AwaitingConflictResolution);
    persist_and_publish(entry);

    const auto path = join_destination(task.destination_prefix, task.destination_name);
    RemoteObject existing;
    existing.key = path;
    negotiator_.open_round(task.destination_prefix, {ConflictRecord{task.id, path, existing}});
}

void UploadScheduler::schedule_auto_retry(ActiveTask& entry) {
    if (!config_.auto_retry || entry.task.status != TaskStatus::Failed) {
        return;
    }
    if (entry.auto_retries >= config_.max_auto_retries) {
        spdlog::warn("Upload {} failed after {} automatic retr{}, leaving it failed",
                     entry.task.id, entry.auto_retries, entry.auto_retries == 1 ? "y" : "ies");
        return;
    }
    entry.retry_at = std::chrono::steady_clock::now() + config_.auto_retry_delay;
    spdlog::info("Upload {} will be retried in {} ms", entry.task.id, config_.auto_retry_delay.count());
}

void UploadScheduler::restart_failed(ActiveTask& entry) {
    entry.retry_at.reset();
    spdlog::info("Retrying upload {} from chunk {}", entry.task.id, entry.task.uploaded_chunks.size());
    change_status(entry, TaskStatus::Pending);
    persist_and_publish(entry);
    enqueue(entry);
    fill_slots();
}

void UploadScheduler::forget(const std::string& task_id) {
    auto removed = store_.remove(task_id);
    if (removed.is_error()) {
        spdlog::error("Failed to remove saved state of {}: {}", task_id, removed.error().message);
    }
    tasks_.erase(task_id);
}

// ──────────────────────────────────────────────────────────
// State and events
// ──────────────────────────────────────────────────────────

bool UploadScheduler::change_status(ActiveTask& entry, TaskStatus target) {
    auto changed = TaskLifecycle::transition(entry.task, target);
    if (changed.is_error()) {
        spdlog::warn("Task {}: {}", entry.task.id, changed.error().message);
        return false;
    }
    return true;
}

bool UploadScheduler::persist(ActiveTask& entry) {
    auto state = state::capture(entry.task, config_.chunk_size);
    auto saved = store_.save(state);
    if (saved.is_error()) {
        spdlog::error("Failed to save progress of {}: {}", entry.task.id, saved.error().message);
        return false;
    }
    bus_.emit(events::ProgressSavedEvent{entry.task.id, state.uploaded_chunk_indices, state.progress_percent});
    entry.last_saved = std::move(state);
    return true;
}

void UploadScheduler::publish(const UploadTask& task) {
    bus_.emit(events::UploadProgressEvent{
        task.id, task.file_name, task.progress_percent(), task.status, task.last_error});
}

void UploadScheduler::persist_and_publish(ActiveTask& entry) {
    if (persist(entry)) {
        publish(entry.task);
        return;
    }
    if (!entry.last_saved) {
        return;
    }
    const auto& saved = *entry.last_saved;
    bus_.emit(events::UploadProgressEvent{
        entry.task.id, entry.task.file_name, saved.progress_percent, saved.status, saved.last_error});
}

std::vector<TaskSnapshot> UploadScheduler::snapshot() const {
    std::vector<const ActiveTask*> ordered;
    ordered.reserve(tasks_.size());
    for (const auto& [id, entry] : tasks_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(),
        [](const ActiveTask* a, const ActiveTask* b) { return a->sequence < b->sequence; });

    std::vector<TaskSnapshot> tasks;
    tasks.reserve(ordered.size());
    for (const auto* entry : ordered) {
        tasks.push_back(make_snapshot(entry->task));
    }
    return tasks;
}

std::optional<std::chrono::steady_clock::time_point> UploadScheduler::next_deadline() const {
    std::optional<std::chrono::steady_clock::time_point> earliest;
    for (const auto& [id, entry] : tasks_) {
        for (const auto& at : {entry.reclaim_at, entry.retry_at}) {
            if (at && (!earliest || *at < *earliest)) {
                earliest = at;
            }
        }
    }
    return earliest;
}

void UploadScheduler::reclaim_expired() {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const auto& entry = it->second;
        if (!entry.reclaim_at || *entry.reclaim_at > now) {
            ++it;
            continue;
        }
        auto removed = store_.remove(it->first);
        if (removed.is_error()) {
            spdlog::error("Failed to remove saved state of {}: {}", it->first, removed.error().message);
        }
        spdlog::debug("Task {} left the active set", it->first);
        it = tasks_.erase(it);
    }
}

void UploadScheduler::retry_due() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> due;
    for (const auto& [id, entry] : tasks_) {
        if (entry.retry_at && *entry.retry_at <= now) {
            due.push_back(id);
        }
    }
    for (const auto& id : due) {
        auto* entry = find(id);
        if (entry == nullptr) {
            continue;
        }
        if (entry->task.status != TaskStatus::Failed) {
            entry->retry_at.reset();
            continue;
        }
        ++entry->auto_retries;
        restart_failed(*entry);
    }
}

} // namespace rup::upload
