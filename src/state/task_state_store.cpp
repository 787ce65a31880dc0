#include "rup/state/task_state_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rup::state {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string hex_encode(const std::string& text) {
    std::ostringstream oss;
    for (unsigned char byte : text) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

Result<std::string> read_text(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Storage, "cannot open " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return Ok(contents.str());
}

} // namespace

PersistedTaskState capture(const upload::UploadTask& task, std::uint64_t chunk_size) {
    PersistedTaskState state;
    state.task_id = task.id;
    state.uploaded_chunk_indices.assign(task.uploaded_chunks.begin(), task.uploaded_chunks.end());
    state.progress_percent = task.progress_percent();
    state.status = task.status;
    state.file_name = task.file_name;
    state.file_size = task.file_size;
    state.chunk_size = chunk_size;
    state.destination_prefix = task.destination_prefix;
    state.destination_name = task.destination_name;
    state.overwrite = task.overwrite;
    state.last_error = task.last_error;
    return state;
}

std::string encode(const PersistedTaskState& state) {
    json doc;
    doc["taskId"] = state.task_id;
    doc["uploadedChunkIndices"] = state.uploaded_chunk_indices;
    doc["progressPercent"] = state.progress_percent;
    doc["status"] = upload::to_string(state.status);
    doc["fileName"] = state.file_name;
    doc["fileSize"] = state.file_size;
    doc["chunkSize"] = state.chunk_size;
    doc["destinationPrefix"] = state.destination_prefix;
    doc["destinationName"] = state.destination_name;
    doc["overwrite"] = state.overwrite;
    doc["lastError"] = state.last_error ? json(*state.last_error) : json(nullptr);
    return doc.dump();
}

Result<PersistedTaskState> decode(const std::string& document) {
    auto doc = json::parse(document, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<PersistedTaskState>(ErrorKind::Storage, "task state is not a JSON object");
    }

    PersistedTaskState state;
    try {
        state.task_id = doc.at("taskId").get<std::string>();
        state.uploaded_chunk_indices = doc.value("uploadedChunkIndices", std::vector<std::uint32_t>{});
        state.progress_percent = doc.value("progressPercent", 0);
        state.status = upload::status_from_string(doc.value("status", std::string("pending")));
        state.file_name = doc.value("fileName", std::string{});
        state.file_size = doc.value("fileSize", std::uint64_t{0});
        state.chunk_size = doc.value("chunkSize", std::uint64_t{0});
        state.destination_prefix = doc.value("destinationPrefix", std::string{});
        state.destination_name = doc.value("destinationName", state.file_name);
        state.overwrite = doc.value("overwrite", false);
        if (doc.contains("lastError") && doc["lastError"].is_string()) {
            state.last_error = doc["lastError"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<PersistedTaskState>(ErrorKind::Storage, std::string("malformed task state: ") + e.what());
    }
    return Ok(state);
}

// ──────────────────────────────────────────────────────────
// MemoryTaskStateStore
// ──────────────────────────────────────────────────────────

Result<void> MemoryTaskStateStore::save(const PersistedTaskState& state) {
    std::unique_lock lock(mutex_);
    entries_[state.task_id] = state;
    return Ok();
}

Result<std::optional<PersistedTaskState>> MemoryTaskStateStore::load(const std::string& task_id) {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return Ok(std::optional<PersistedTaskState>{});
    }
    return Ok(std::optional<PersistedTaskState>{it->second});
}

Result<void> MemoryTaskStateStore::remove(const std::string& task_id) {
    std::unique_lock lock(mutex_);
    entries_.erase(task_id);
    return Ok();
}

Result<std::vector<PersistedTaskState>> MemoryTaskStateStore::load_all() {
    std::shared_lock lock(mutex_);
    std::vector<PersistedTaskState> all;
    all.reserve(entries_.size());
    for (const auto& [id, state] : entries_) {
        all.push_back(state);
    }
    return Ok(all);
}

size_t MemoryTaskStateStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

// ──────────────────────────────────────────────────────────
// FileTaskStateStore
// ──────────────────────────────────────────────────────────

FileTaskStateStore::FileTaskStateStore(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec && !fs::is_directory(directory_)) {
        throw std::runtime_error("cannot create state directory " + directory_.string() + ": " + ec.message());
    }
}

fs::path FileTaskStateStore::path_for(const std::string& task_id) const {
    return directory_ / (hex_encode(task_id) + ".json");
}

FileTaskStateStore::EntryLock::EntryLock(FileTaskStateStore& store, const std::string& task_id)
    : store_(store)
    , task_id_(task_id) {
    {
        std::lock_guard lock(store_.locks_mutex_);
        auto& slot = store_.locks_[task_id_];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        mutex_ = slot;
    }
    mutex_->lock();
}

FileTaskStateStore::EntryLock::~EntryLock() {
    mutex_->unlock();
    mutex_.reset();

    std::lock_guard lock(store_.locks_mutex_);
    auto it = store_.locks_.find(task_id_);
    if (it != store_.locks_.end() && it->second.use_count() == 1) {
        store_.locks_.erase(it);
    }
}

std::size_t FileTaskStateStore::lock_count() const {
    std::lock_guard lock(locks_mutex_);
    return locks_.size();
}

Result<void> FileTaskStateStore::save(const PersistedTaskState& state) {
    EntryLock lock(*this, state.task_id);

    const auto target = path_for(state.task_id);
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorKind::Storage, "cannot write " + temp.string());
        }
        out << encode(state);
        out.flush();
        if (!out) {
            return Err<void>(ErrorKind::Storage, "short write to " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        return Err<void>(ErrorKind::Storage, "cannot replace " + target.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::optional<PersistedTaskState>> FileTaskStateStore::load(const std::string& task_id) {
    using Maybe = std::optional<PersistedTaskState>;
    EntryLock lock(*this, task_id);

    const auto path = path_for(task_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(Maybe{});
    }
    auto text = read_text(path);
    if (text.is_error()) {
        return Err<Maybe>(text.error());
    }
    auto state = decode(text.value());
    if (state.is_error()) {
        return Err<Maybe>(state.error());
    }
    return Ok(Maybe{state.value()});
}

Result<void> FileTaskStateStore::remove(const std::string& task_id) {
    EntryLock lock(*this, task_id);

    std::error_code ec;
    fs::remove(path_for(task_id), ec);
    if (ec) {
        return Err<void>(ErrorKind::Storage, "cannot remove state for " + task_id + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<PersistedTaskState>> FileTaskStateStore::load_all() {
    std::vector<PersistedTaskState> all;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto text = read_text(entry.path());
        if (text.is_error()) {
            spdlog::warn("Skipping unreadable task state {}: {}", entry.path().string(), text.error().message);
            continue;
        }
        auto state = decode(text.value());
        if (state.is_error()) {
            spdlog::warn("Skipping corrupt task state {}: {}", entry.path().string(), state.error().message);
            continue;
        }
        all.push_back(std::move(state.value()));
    }
    if (ec) {
        return Err<std::vector<PersistedTaskState>>(ErrorKind::Storage,
                                                    "cannot list " + directory_.string() + ": " + ec.message());
    }
    return Ok(all);
}

} // namespace rup::state
