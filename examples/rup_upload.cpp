#include "rup/core/config.hpp"
#include "rup/events/components.hpp"
#include "rup/events/events.hpp"
#include "rup/network/http_upload_transport.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/upload_manager.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using rup::upload::ConflictResolution;
using rup::upload::TaskStatus;

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] FILE|DIR...\n\n";
    std::cout << "Options:\n";
    std::cout << "  --endpoint URL        Storage API base URL (http://host[:port]/path)\n";
    std::cout << "  --prefix PATH         Destination folder (default: bucket root)\n";
    std::cout << "  --token TOKEN         Bearer token (default: $RUP_TOKEN)\n";
    std::cout << "  --config FILE         JSON config file, flags override it\n";
    std::cout << "  --chunk-size MIB      Chunk size in MiB (default: 5)\n";
    std::cout << "  --concurrency N       Parallel uploads (default: 3)\n";
    std::cout << "  --state-dir DIR       Keep resumable progress in DIR\n";
    std::cout << "  --on-conflict MODE    replace | keep | cancel (default: cancel)\n";
    std::cout << "  --resume              Continue unfinished uploads found in --state-dir\n";
    std::cout << "  --no-auto-retry       Leave failed uploads failed instead of retrying them\n";
    std::cout << "  --verbose             Log per-chunk progress\n";
    std::cout << "  --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --endpoint http://localhost:8080/api/v2/external/storage a.bin\n";
    std::cout << "  " << program_name << " --state-dir ~/.rup --resume --prefix media/ video.mp4\n";
    std::cout << "  " << program_name << " --prefix backups/ ./photos   (uploads photos/... keeping folders)\n";
}

bool parse_resolution(const std::string& text, ConflictResolution& out) {
    if (text == "replace") {
        out = ConflictResolution::Replace;
    } else if (text == "keep") {
        out = ConflictResolution::Keep;
    } else if (text == "cancel") {
        out = ConflictResolution::Cancel;
    } else {
        return false;
    }
    return true;
}

/**
 * @brief Tracks submitted tasks until each one reaches a terminal state
 *
 * A failure is final once the task has used up its automatic retries.
 */
class CompletionTracker {
public:
    explicit CompletionTracker(std::uint32_t retries_per_task) : retries_per_task_(retries_per_task) {}

    // Events may arrive before the submitting call has returned the id
    void expect(const std::string& task_id) {
        std::lock_guard lock(mutex_);
        if (finished_.count(task_id) == 0) {
            outstanding_.insert(task_id);
        }
    }

    void on_event(const rup::events::UploadEvent& event) {
        std::lock_guard lock(mutex_);
        if (const auto* progress = std::get_if<rup::events::UploadProgressEvent>(&event)) {
            if (progress->status == TaskStatus::Completed) {
                failed_.erase(progress->task_id);
                finish(progress->task_id);
            } else if (progress->status == TaskStatus::Failed) {
                failed_[progress->task_id] = progress->file_name + ": " + progress->error.value_or("unknown error");
                if (++failures_[progress->task_id] > retries_per_task_) {
                    finish(progress->task_id);
                }
            }
        } else if (const auto* cancelled = std::get_if<rup::events::UploadCancelledEvent>(&event)) {
            finish(cancelled->task_id);
        }
        cv_.notify_all();
    }

    /**
     * @return false if interrupted before everything finished
     */
    bool wait() {
        std::unique_lock lock(mutex_);
        while (!outstanding_.empty()) {
            if (g_interrupted) {
                return false;
            }
            cv_.wait_for(lock, std::chrono::milliseconds(200));
        }
        return true;
    }

    std::set<std::string> outstanding() const {
        std::lock_guard lock(mutex_);
        return outstanding_;
    }

    std::map<std::string, std::string> failures() const {
        std::lock_guard lock(mutex_);
        return failed_;
    }

private:
    void finish(const std::string& task_id) {
        outstanding_.erase(task_id);
        finished_.insert(task_id);
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<std::string> outstanding_;
    std::set<std::string> finished_;
    std::map<std::string, std::string> failed_;
    std::map<std::string, std::uint32_t> failures_;
    std::uint32_t retries_per_task_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    rup::UploaderConfig config;
    std::string prefix;
    std::string token;
    if (const char* env = std::getenv("RUP_TOKEN")) {
        token = env;
    }
    ConflictResolution on_conflict = ConflictResolution::Cancel;
    bool resume = false;
    std::vector<fs::path> files;

    // A config file sets the baseline; look for it first so flags win regardless of order
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            auto loaded = rup::load_config(argv[i + 1]);
            if (loaded.is_error()) {
                spdlog::error("{}", loaded.error().message);
                return 1;
            }
            config = loaded.value();
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", flag);
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--endpoint") {
            config.endpoint = next("--endpoint");
        } else if (arg == "--prefix") {
            prefix = next("--prefix");
        } else if (arg == "--token") {
            token = next("--token");
        } else if (arg == "--chunk-size") {
            const char* value = next("--chunk-size");
            try {
                config.chunk_size = std::stoull(value) * rup::UploaderConfig::kMiB;
            } catch (const std::exception&) {
                spdlog::error("Invalid chunk size: {}", value);
                return 1;
            }
        } else if (arg == "--concurrency") {
            const char* value = next("--concurrency");
            try {
                config.max_concurrent_uploads = std::stoul(value);
            } catch (const std::exception&) {
                spdlog::error("Invalid concurrency: {}", value);
                return 1;
            }
        } else if (arg == "--state-dir") {
            config.state_dir = next("--state-dir");
        } else if (arg == "--on-conflict") {
            const char* value = next("--on-conflict");
            if (!parse_resolution(value, on_conflict)) {
                spdlog::error("Invalid conflict mode: {}", value);
                return 1;
            }
        } else if (arg == "--resume") {
            resume = true;
        } else if (arg == "--no-auto-retry") {
            config.auto_retry = false;
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        } else {
            files.emplace_back(arg);
        }
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (config.endpoint.empty()) {
        spdlog::error("No endpoint given (use --endpoint or \"endpoint\" in the config file)");
        return 1;
    }
    if (auto valid = rup::validate(config); valid.is_error()) {
        spdlog::error("{}", valid.error().message);
        return 1;
    }

    spdlog::info("====================================");
    spdlog::info("Resumable upload");
    spdlog::info("====================================");
    spdlog::info("  Endpoint: {}", config.endpoint);
    spdlog::info("  Destination: {}", prefix.empty() ? "/" : prefix);
    spdlog::info("  Chunk size: {} MiB, concurrency: {}", config.chunk_size / rup::UploaderConfig::kMiB,
                 config.max_concurrent_uploads);
    spdlog::info("  State: {}", config.state_dir.empty() ? "memory only" : config.state_dir.string());

    std::signal(SIGINT, signal_handler);

    try {
        auto transport = std::make_shared<rup::network::HttpUploadTransport>(config.endpoint, config.request_timeout);
        rup::upload::UploadManager manager(config, transport);
        manager.set_auth_token(token);

        rup::events::LoggerComponent logger(manager.bus());
        rup::events::TransferStatsComponent stats(manager.bus());
        CompletionTracker tracker(config.auto_retry ? config.max_auto_retries : 0);

        auto tracking = manager.subscribe([&tracker](const rup::events::UploadEvent& event) {
            tracker.on_event(event);
        });
        auto conflicts = manager.bus().subscribe<rup::events::ConflictBatchEvent>(
            [&manager, on_conflict](const rup::events::ConflictBatchEvent& batch) {
                spdlog::info("Applying '{}' to {} conflicting file(s)",
                             rup::upload::to_string(on_conflict), batch.conflicts.size());
                if (auto resolved = manager.resolve_all(batch.round_id, on_conflict); resolved.is_error()) {
                    spdlog::error("{}", resolved.error().message);
                }
            });

        // Unfinished uploads from an earlier run, by file name
        std::map<std::string, std::string> resumable;
        if (resume) {
            auto recoverable = manager.recoverable_tasks();
            if (recoverable.is_error()) {
                spdlog::warn("Cannot read saved progress: {}", recoverable.error().message);
            } else {
                for (const auto& entry : recoverable.value()) {
                    if (entry.destination_prefix == prefix) {
                        resumable[entry.file_name] = entry.task_id;
                    }
                }
            }
        }

        std::vector<std::shared_ptr<const rup::upload::FileSource>> fresh;
        for (const auto& path : files) {
            std::error_code ec;
            if (fs::is_directory(path, ec)) {
                auto tree = manager.submit_tree(path, prefix);
                if (tree.is_error()) {
                    spdlog::error("{}", tree.error().message);
                    return 1;
                }
                for (const auto& id : tree.value().task_ids) {
                    tracker.expect(id);
                }
                continue;
            }

            auto source = rup::upload::LocalFileSource::open(path);
            if (source.is_error()) {
                spdlog::error("{}", source.error().message);
                return 1;
            }
            auto it = resumable.find(source.value()->name());
            if (it == resumable.end()) {
                fresh.push_back(source.value());
                continue;
            }
            tracker.expect(it->second);
            auto id = manager.submit(std::shared_ptr<const rup::upload::FileSource>(source.value()), prefix, it->second);
            if (id.is_error()) {
                spdlog::error("{}", id.error().message);
                return 1;
            }
            spdlog::info("Resuming {} as task {}", path.string(), id.value());
        }

        if (!fresh.empty()) {
            auto batch = manager.submit_batch(fresh, prefix);
            if (batch.is_error()) {
                spdlog::error("{}", batch.error().message);
                return 1;
            }
            for (const auto& id : batch.value().task_ids) {
                tracker.expect(id);
            }
        }

        if (!tracker.wait()) {
            spdlog::warn("Interrupted, pausing {} upload(s)", tracker.outstanding().size());
            for (const auto& id : tracker.outstanding()) {
                manager.pause(id);
            }
            // Round-trip through the scheduler so every pause is persisted before exit
            const auto remaining = manager.status();
            spdlog::debug("{} task(s) still active", remaining.size());
            if (!config.state_dir.empty()) {
                spdlog::info("Progress saved; rerun with --resume to continue");
            }
            return 130;
        }

        const auto failures = tracker.failures();
        spdlog::info("Done: {} completed, {} failed, {} cancelled",
                     stats.completed(), stats.failed(), stats.cancelled());
        for (const auto& [id, message] : failures) {
            spdlog::error("  {} ({})", message, id);
        }
        return failures.empty() ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
