#include "rup/upload/upload_manager.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_set>

namespace rup::upload {
namespace {

UploaderConfig validated(UploaderConfig config) {
    auto valid = validate(config);
    if (valid.is_error()) {
        throw std::invalid_argument("invalid uploader configuration: " + valid.error().message);
    }
    return config;
}

std::shared_ptr<state::TaskStateStore> default_store(const UploaderConfig& config) {
    if (config.state_dir.empty()) {
        return std::make_shared<state::MemoryTaskStateStore>();
    }
    return std::make_shared<state::FileTaskStateStore>(config.state_dir);
}

template<typename EventType>
void forward(events::EventBus& bus,
             events::Subscription& into,
             const std::shared_ptr<UploadManager::Listener>& listener) {
    into.merge(bus.subscribe<EventType>([listener](const EventType& event) {
        (*listener)(events::UploadEvent{event});
    }));
}

} // namespace

UploadManager::UploadManager(UploaderConfig config,
                             std::shared_ptr<UploadTransport> transport,
                             std::shared_ptr<state::TaskStateStore> store)
    : config_(validated(std::move(config)))
    , transport_(transport ? std::move(transport) : throw std::invalid_argument("upload transport is required"))
    , store_(store ? std::move(store) : default_store(config_))
    , negotiator_(bus_, *transport_, auth_, config_.listing_limit)
    , scheduler_(config_, *transport_, auth_, *store_, bus_, negotiator_) {
    negotiator_.set_decision_sink([this](const ConflictDecision& decision) {
        post(ApplyResolution{decision});
    });
    scheduler_.start();
}

UploadManager::~UploadManager() {
    scheduler_.stop();
    negotiator_.set_decision_sink(nullptr);
}

// ──────────────────────────────────────────────────────────
// Submission
// ──────────────────────────────────────────────────────────

Result<void> UploadManager::check_file(const std::shared_ptr<const FileSource>& file) {
    if (!file) {
        return Err<void>(ErrorKind::InvalidInput, "no file given");
    }
    if (file->name().empty()) {
        return Err<void>(ErrorKind::InvalidInput, "file has no name");
    }
    if (file->name().find('/') != std::string::npos) {
        return Err<void>(ErrorKind::InvalidInput, "file name must not contain '/': " + file->name());
    }
    return Ok();
}

std::string UploadManager::new_task_id() {
    std::lock_guard lock(id_mutex_);
    return boost::uuids::to_string(id_generator_());
}

bool UploadManager::is_active(const std::string& task_id) {
    for (const auto& task : status()) {
        if (task.task_id == task_id) {
            return true;
        }
    }
    return false;
}

std::optional<state::PersistedTaskState> UploadManager::restorable(const std::string& task_id,
                                                                   const FileSource& file) {
    auto saved = store_->load(task_id);
    if (saved.is_error()) {
        spdlog::warn("Cannot read saved progress of {}: {}", task_id, saved.error().message);
        return std::nullopt;
    }
    if (!saved.value()) {
        return std::nullopt;
    }
    const auto& state = *saved.value();
    if (state.file_name != file.name() || state.file_size != file.size()) {
        spdlog::warn("Saved progress of {} belongs to {} ({} bytes), starting {} from scratch",
                     task_id, state.file_name, state.file_size, file.name());
        return std::nullopt;
    }
    return state;
}

Result<std::string> UploadManager::submit(std::shared_ptr<const FileSource> file,
                                          const std::string& destination_prefix,
                                          const std::string& task_id) {
    if (auto valid = check_file(file); valid.is_error()) {
        return Err<std::string>(valid.error());
    }

    std::string id = task_id;
    std::optional<state::PersistedTaskState> restored;
    if (id.empty()) {
        id = new_task_id();
    } else {
        if (is_active(id)) {
            return Err<std::string>(ErrorKind::InvalidInput, "task " + id + " is already active");
        }
        restored = restorable(id, *file);
    }

    AddUpload add{id, file, destination_prefix, auth_.get(), false, restored};

    // A restored task already went through its existence check
    if (!restored) {
        auto check = negotiator_.detect(destination_prefix, {PendingFile{id, file->name()}});
        if (!check.conflicts.empty()) {
            // The round exists before the task is admitted, so an early cancel finds it
            add.awaiting_conflict = true;
            const auto round = negotiator_.create_round(destination_prefix, std::move(check.conflicts), check.listing);
            post(std::move(add));
            negotiator_.announce_round(round);
            return Ok(id);
        }
    }

    post(std::move(add));
    return Ok(id);
}

Result<std::string> UploadManager::submit(const std::filesystem::path& path,
                                          const std::string& destination_prefix,
                                          const std::string& task_id) {
    auto file = LocalFileSource::open(path);
    if (file.is_error()) {
        return Err<std::string>(file.error());
    }
    return submit(std::shared_ptr<const FileSource>(file.value()), destination_prefix, task_id);
}

Result<BatchSubmission> UploadManager::submit_batch(const std::vector<std::shared_ptr<const FileSource>>& files,
                                                    const std::string& destination_prefix) {
    if (files.empty()) {
        return Err<BatchSubmission>(ErrorKind::InvalidInput, "empty batch");
    }
    for (const auto& file : files) {
        if (auto valid = check_file(file); valid.is_error()) {
            return Err<BatchSubmission>(valid.error());
        }
    }

    BatchSubmission submission;
    std::vector<PendingFile> candidates;
    std::set<std::string> batch_names;
    for (const auto& file : files) {
        submission.task_ids.push_back(new_task_id());
        candidates.push_back(PendingFile{submission.task_ids.back(), file->name()});
        batch_names.insert(file->name());
    }

    auto check = negotiator_.detect(destination_prefix, candidates);
    std::unordered_set<std::string> conflicting;
    for (const auto& record : check.conflicts) {
        conflicting.insert(record.task_id);
    }

    if (!check.conflicts.empty()) {
        submission.conflict_round = negotiator_.create_round(
            destination_prefix, std::move(check.conflicts), check.listing, std::move(batch_names));
    }

    const std::string token = auth_.get();
    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto& id = submission.task_ids[i];
        post(AddUpload{id, files[i], destination_prefix, token, conflicting.count(id) > 0, std::nullopt});
    }

    if (submission.conflict_round) {
        negotiator_.announce_round(*submission.conflict_round);
    }
    spdlog::info("Submitted {} file(s) to '{}', {} awaiting conflict resolution",
                 files.size(), destination_prefix, conflicting.size());
    return Ok(submission);
}

Result<TreeSubmission> UploadManager::submit_tree(const std::filesystem::path& root,
                                                  const std::string& destination_prefix) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto base = fs::canonical(root, ec);
    if (ec || !fs::is_directory(base, ec)) {
        return Err<TreeSubmission>(ErrorKind::InvalidInput, "not a directory: " + root.string());
    }

    std::vector<fs::path> paths;
    for (fs::recursive_directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            paths.push_back(it->path());
        }
    }
    if (ec) {
        return Err<TreeSubmission>(ErrorKind::InvalidInput, "cannot walk " + base.string() + ": " + ec.message());
    }
    if (paths.empty()) {
        return Err<TreeSubmission>(ErrorKind::InvalidInput, "no files under " + base.string());
    }
    std::sort(paths.begin(), paths.end());

    // Destination folder -> files directly inside it
    std::map<std::string, std::vector<std::shared_ptr<const FileSource>>> folders;
    const auto top = join_destination(destination_prefix, base.filename().generic_string());
    for (const auto& path : paths) {
        auto file = LocalFileSource::open(path);
        if (file.is_error()) {
            return Err<TreeSubmission>(file.error());
        }
        const auto relative = path.parent_path().lexically_relative(base).generic_string();
        const auto folder = (relative == "." ? top : join_destination(top, relative)) + "/";
        folders[folder].push_back(std::shared_ptr<const FileSource>(file.value()));
    }

    TreeSubmission submission;
    for (const auto& [folder, files] : folders) {
        auto batch = submit_batch(files, folder);
        if (batch.is_error()) {
            return Err<TreeSubmission>(batch.error());
        }
        auto& queued = batch.value();
        submission.task_ids.insert(submission.task_ids.end(), queued.task_ids.begin(), queued.task_ids.end());
        if (queued.conflict_round) {
            submission.conflict_rounds.push_back(*queued.conflict_round);
        }
    }
    spdlog::info("Submitted {} file(s) from {} in {} folder(s)", paths.size(), base.string(), folders.size());
    return Ok(submission);
}

// ──────────────────────────────────────────────────────────
// Control
// ──────────────────────────────────────────────────────────

void UploadManager::post(Command command) {
    if (!scheduler_.post(std::move(command))) {
        spdlog::warn("Upload scheduler is not running, command dropped");
    }
}

void UploadManager::pause(const std::string& task_id) {
    post(PauseUpload{task_id});
}

void UploadManager::resume(const std::string& task_id) {
    post(ResumeUpload{task_id});
}

void UploadManager::cancel(const std::string& task_id) {
    post(CancelUpload{task_id});
}

void UploadManager::retry(const std::string& task_id) {
    post(RetryUpload{task_id});
}

void UploadManager::dismiss(const std::string& task_id) {
    post(DismissUpload{task_id});
}

void UploadManager::clear_finished() {
    post(ClearFinished{});
}

void UploadManager::set_auth_token(std::string token) {
    // Visible to executors immediately; the scheduler copy follows in order
    auth_.set(token);
    post(SetAuth{std::move(token)});
}

events::Subscription UploadManager::subscribe(Listener listener) {
    auto shared = std::make_shared<Listener>(std::move(listener));
    events::Subscription subscription;
    forward<events::UploadProgressEvent>(bus_, subscription, shared);
    forward<events::UploadCancelledEvent>(bus_, subscription, shared);
    forward<events::ProgressSavedEvent>(bus_, subscription, shared);
    forward<events::StatusSnapshotEvent>(bus_, subscription, shared);
    forward<events::ConflictBatchEvent>(bus_, subscription, shared);
    forward<events::ConflictResolvedEvent>(bus_, subscription, shared);
    return subscription;
}

Result<void> UploadManager::resolve_conflict(const std::string& task_id, ConflictResolution resolution) {
    return negotiator_.resolve(task_id, resolution);
}

Result<void> UploadManager::resolve_all(std::uint64_t round_id, ConflictResolution resolution) {
    return negotiator_.resolve_all(round_id, resolution);
}

// ──────────────────────────────────────────────────────────
// Inspection
// ──────────────────────────────────────────────────────────

std::vector<TaskSnapshot> UploadManager::status() {
    auto reply = std::make_shared<std::promise<std::vector<TaskSnapshot>>>();
    auto answer = reply->get_future();
    if (!scheduler_.post(GetStatus{reply})) {
        return {};
    }
    return answer.get();
}

void UploadManager::request_status() {
    post(GetStatus{});
}

Result<std::vector<state::PersistedTaskState>> UploadManager::recoverable_tasks() {
    auto all = store_->load_all();
    if (all.is_error()) {
        return all;
    }

    std::vector<state::PersistedTaskState> recoverable;
    for (auto& entry : all.value()) {
        if (entry.status == TaskStatus::Completed || entry.status == TaskStatus::Cancelled) {
            continue;
        }
        if (entry.status == TaskStatus::Pending || entry.status == TaskStatus::Uploading) {
            entry.status = TaskStatus::Paused;
        }
        recoverable.push_back(std::move(entry));
    }
    return Ok(recoverable);
}

} // namespace rup::upload
