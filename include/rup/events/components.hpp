/**
 * @file components.hpp
 * @brief Ready-made subscribers for the upload event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * TransferStatsComponent stats(bus);
 */

#pragma once

#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <string>

namespace rup::events {

/**
 * @brief Logs every upload event using spdlog
 *
 * Per-chunk progress goes to debug; status changes, cancellations and
 * conflicts to info; failures to error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscription_.merge(bus.subscribe<UploadProgressEvent>([this](const UploadProgressEvent& e) {
            on_progress(e);
        }));
        subscription_.merge(bus.subscribe<UploadCancelledEvent>([](const UploadCancelledEvent& e) {
            spdlog::info("[UploadCancelled] task={}", e.task_id);
        }));
        subscription_.merge(bus.subscribe<ProgressSavedEvent>([](const ProgressSavedEvent& e) {
            spdlog::debug("[ProgressSaved] task={} chunks={} progress={}%",
                e.task_id, e.uploaded_chunk_indices.size(), e.progress_percent);
        }));
        subscription_.merge(bus.subscribe<ConflictBatchEvent>([](const ConflictBatchEvent& e) {
            spdlog::info("[ConflictDetected] round={} conflicts={}", e.round_id, e.conflicts.size());
            for (const auto& record : e.conflicts) {
                spdlog::info("  {} already exists (task {})", record.destination_path, record.task_id);
            }
        }));
        subscription_.merge(bus.subscribe<ConflictResolvedEvent>([](const ConflictResolvedEvent& e) {
            spdlog::info("[ConflictResolved] task={} resolution={} destination={}",
                e.task_id, upload::to_string(e.resolution), e.destination_name);
        }));
    }

private:
    void on_progress(const UploadProgressEvent& e) {
        if (e.status == upload::TaskStatus::Failed) {
            spdlog::error("[UploadFailed] task={} file={} error={}",
                e.task_id, e.file_name, e.error.value_or("unknown"));
            return;
        }
        if (e.status == upload::TaskStatus::Uploading && e.progress_percent == last_percent_ && e.task_id == last_task_) {
            return;
        }
        last_task_ = e.task_id;
        last_percent_ = e.progress_percent;
        if (e.status == upload::TaskStatus::Uploading) {
            spdlog::debug("[UploadProgress] task={} file={} progress={}%",
                e.task_id, e.file_name, e.progress_percent);
        } else {
            spdlog::info("[UploadStatus] task={} file={} status={} progress={}%",
                e.task_id, e.file_name, upload::to_string(e.status), e.progress_percent);
        }
    }

    Subscription subscription_;
    std::string last_task_;
    int last_percent_ = -1;
};

/**
 * @brief Counts terminal outcomes, for summaries and tests
 */
class TransferStatsComponent {
public:
    explicit TransferStatsComponent(EventBus& bus) {
        subscription_.merge(bus.subscribe<UploadProgressEvent>([this](const UploadProgressEvent& e) {
            if (e.status == upload::TaskStatus::Completed) {
                completed_++;
            } else if (e.status == upload::TaskStatus::Failed) {
                failed_++;
            }
        }));
        subscription_.merge(bus.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            cancelled_++;
        }));
        subscription_.merge(bus.subscribe<ConflictBatchEvent>([this](const ConflictBatchEvent& e) {
            conflicts_ += e.conflicts.size();
        }));
    }

    size_t completed() const { return completed_.load(); }
    size_t failed() const { return failed_.load(); }
    size_t cancelled() const { return cancelled_.load(); }
    size_t conflicts() const { return conflicts_.load(); }

private:
    Subscription subscription_;
    std::atomic<size_t> completed_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<size_t> cancelled_{0};
    std::atomic<size_t> conflicts_{0};
};

} // namespace rup::events
