#include "rup/upload/conflict.hpp"

#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rup::upload {

std::string join_destination(const std::string& prefix, const std::string& name) {
    if (prefix.empty()) {
        return name;
    }
    if (prefix.back() == '/') {
        return prefix + name;
    }
    return prefix + "/" + name;
}

std::map<std::string, RemoteObject> direct_children(const std::vector<RemoteObject>& listing,
                                                    const std::string& prefix) {
    std::map<std::string, RemoteObject> children;
    for (const auto& object : listing) {
        std::string relative = object.key;
        if (!prefix.empty()) {
            if (relative.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            relative.erase(0, prefix.size());
        }
        if (!relative.empty() && relative.front() == '/') {
            relative.erase(0, 1);
        }
        // Deeper keys belong to subfolders
        if (relative.empty() || relative.find('/') != std::string::npos) {
            continue;
        }
        children.emplace(relative, object);
    }
    return children;
}

std::string unique_name(const std::string& name, const std::set<std::string>& taken) {
    const auto dot = name.find_last_of('.');
    const bool has_extension = dot != std::string::npos && dot != 0;
    const std::string stem = has_extension ? name.substr(0, dot) : name;
    const std::string extension = has_extension ? name.substr(dot) : std::string{};

    for (std::uint64_t n = 1;; ++n) {
        std::string candidate = stem + " (" + std::to_string(n) + ")" + extension;
        if (taken.count(candidate) == 0) {
            return candidate;
        }
    }
}

// ──────────────────────────────────────────────────────────
// NegotiationRound
// ──────────────────────────────────────────────────────────

NegotiationRound::NegotiationRound(std::uint64_t id,
                                   std::string prefix,
                                   std::vector<ConflictRecord> records,
                                   std::set<std::string> reserved_names)
    : id_(id)
    , prefix_(std::move(prefix))
    , records_(std::move(records))
    , taken_names_(std::move(reserved_names)) {}

const ConflictRecord* NegotiationRound::find(const std::string& task_id) const {
    auto it = std::find_if(records_.begin(), records_.end(),
        [&task_id](const ConflictRecord& r) { return r.task_id == task_id; });
    return it == records_.end() ? nullptr : &*it;
}

bool NegotiationRound::is_open(const std::string& task_id) const {
    return find(task_id) != nullptr && decided_.count(task_id) == 0;
}

std::vector<std::string> NegotiationRound::open_tasks() const {
    std::vector<std::string> open;
    for (const auto& record : records_) {
        if (decided_.count(record.task_id) == 0) {
            open.push_back(record.task_id);
        }
    }
    return open;
}

void NegotiationRound::set_listing(const std::vector<RemoteObject>& listing) {
    for (const auto& [name, object] : direct_children(listing, prefix_)) {
        taken_names_.insert(name);
    }
    listing_loaded_ = true;
}

Result<ConflictDecision> NegotiationRound::decide(const std::string& task_id, ConflictResolution resolution) {
    const ConflictRecord* record = find(task_id);
    if (record == nullptr) {
        return Err<ConflictDecision>(ErrorKind::InvalidInput,
                                     "task " + task_id + " is not part of conflict round " + std::to_string(id_));
    }
    if (decided_.count(task_id) > 0) {
        return Err<ConflictDecision>(ErrorKind::InvalidInput, "conflict for task " + task_id + " already resolved");
    }

    ConflictDecision decision;
    decision.round_id = id_;
    decision.task_id = task_id;
    decision.resolution = resolution;

    const auto slash = record->destination_path.find_last_of('/');
    const std::string current_name = slash == std::string::npos
        ? record->destination_path
        : record->destination_path.substr(slash + 1);
    decision.destination_name = current_name;

    if (resolution == ConflictResolution::Keep) {
        taken_names_.insert(current_name);
        decision.destination_name = unique_name(current_name, taken_names_);
        taken_names_.insert(decision.destination_name);
    }

    decided_.insert(task_id);
    return Ok(decision);
}

void NegotiationRound::withdraw(const std::string& task_id) {
    if (find(task_id) != nullptr) {
        decided_.insert(task_id);
    }
}

// ──────────────────────────────────────────────────────────
// ConflictNegotiator
// ──────────────────────────────────────────────────────────

ConflictNegotiator::ConflictNegotiator(events::EventBus& bus,
                                       UploadTransport& transport,
                                       const AuthToken& auth,
                                       std::size_t listing_limit)
    : bus_(bus)
    , transport_(transport)
    , auth_(auth)
    , listing_limit_(listing_limit) {}

void ConflictNegotiator::set_decision_sink(DecisionSink sink) {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
}

Result<std::vector<RemoteObject>> ConflictNegotiator::fetch_listing(const std::string& prefix) {
    return transport_.list_objects(prefix, listing_limit_, auth_.get());
}

ExistenceCheck ConflictNegotiator::detect(const std::string& prefix, const std::vector<PendingFile>& files) {
    ExistenceCheck check;
    if (files.empty()) {
        return check;
    }

    auto listing = fetch_listing(prefix);
    if (listing.is_error()) {
        spdlog::warn("Failed to check for file conflicts under '{}', proceeding with upload: {}",
                     prefix, listing.error().message);
        return check;
    }

    const auto existing = direct_children(listing.value(), prefix);
    for (const auto& file : files) {
        auto it = existing.find(file.destination_name);
        if (it == existing.end()) {
            continue;
        }
        check.conflicts.push_back(ConflictRecord{
            file.task_id,
            join_destination(prefix, file.destination_name),
            it->second});
    }
    check.listing = std::move(listing.value());
    return check;
}

std::uint64_t ConflictNegotiator::create_round(const std::string& prefix,
                                               std::vector<ConflictRecord> records,
                                               const std::optional<std::vector<RemoteObject>>& listing,
                                               std::set<std::string> reserved_names) {
    std::lock_guard lock(mutex_);
    const std::uint64_t id = next_round_id_++;
    auto round = std::make_shared<NegotiationRound>(id, prefix, std::move(records), std::move(reserved_names));
    if (listing) {
        round->set_listing(*listing);
    }
    for (const auto& record : round->records()) {
        round_of_task_[record.task_id] = id;
    }
    rounds_.emplace(id, std::move(round));
    return id;
}

void ConflictNegotiator::announce_round(std::uint64_t round_id) {
    events::ConflictBatchEvent event;
    std::string prefix;
    {
        std::lock_guard lock(mutex_);
        auto round = find_round(round_id);
        if (!round) {
            spdlog::debug("Conflict round {} settled before it was announced", round_id);
            return;
        }
        event.round_id = round_id;
        for (const auto& record : round->records()) {
            if (round->is_open(record.task_id)) {
                event.conflicts.push_back(record);
            }
        }
        prefix = round->prefix();
    }

    spdlog::info("Conflict round {} opened with {} file(s) under '{}'", event.round_id, event.conflicts.size(), prefix);
    bus_.emit(event);
}

std::uint64_t ConflictNegotiator::open_round(const std::string& prefix,
                                             std::vector<ConflictRecord> records,
                                             const std::optional<std::vector<RemoteObject>>& listing,
                                             std::set<std::string> reserved_names) {
    const auto id = create_round(prefix, std::move(records), listing, std::move(reserved_names));
    announce_round(id);
    return id;
}

std::shared_ptr<NegotiationRound> ConflictNegotiator::find_round(std::uint64_t round_id) const {
    auto it = rounds_.find(round_id);
    return it == rounds_.end() ? nullptr : it->second;
}

std::shared_ptr<NegotiationRound> ConflictNegotiator::round_for_task(const std::string& task_id) const {
    auto it = round_of_task_.find(task_id);
    if (it == round_of_task_.end()) {
        return nullptr;
    }
    return find_round(it->second);
}

void ConflictNegotiator::store_listing(NegotiationRound& round, const Result<std::vector<RemoteObject>>& listing) {
    if (listing.is_error()) {
        spdlog::warn("Could not list '{}' to pick a free name: {}", round.prefix(), listing.error().message);
        return;
    }
    if (!round.has_listing()) {
        round.set_listing(listing.value());
    }
}

void ConflictNegotiator::finish(const std::shared_ptr<NegotiationRound>& round, const ConflictDecision& decision) {
    round_of_task_.erase(decision.task_id);
    if (round->settled()) {
        rounds_.erase(round->id());
    }
}

Result<void> ConflictNegotiator::resolve(const std::string& task_id, ConflictResolution resolution) {
    std::unique_lock lock(mutex_);
    auto round = round_for_task(task_id);
    if (!round) {
        return Err<void>(ErrorKind::InvalidInput, "no open conflict for task " + task_id);
    }

    if (resolution == ConflictResolution::Keep && !round->has_listing()) {
        // Listing is network I/O; do it unlocked and re-validate afterwards
        lock.unlock();
        auto listing = fetch_listing(round->prefix());
        lock.lock();
        store_listing(*round, listing);
        if (round_for_task(task_id) != round) {
            return Err<void>(ErrorKind::InvalidInput, "conflict for task " + task_id + " already resolved");
        }
    }

    auto decision = round->decide(task_id, resolution);
    if (decision.is_error()) {
        return Err<void>(decision.error());
    }
    finish(round, decision.value());
    auto sink = sink_;
    lock.unlock();

    bus_.emit(events::ConflictResolvedEvent{
        decision.value().round_id, task_id, resolution, decision.value().destination_name});
    if (sink) {
        sink(decision.value());
    }
    return Ok();
}

Result<void> ConflictNegotiator::resolve_all(std::uint64_t round_id, ConflictResolution resolution) {
    std::unique_lock lock(mutex_);
    auto round = find_round(round_id);
    if (!round) {
        return Err<void>(ErrorKind::InvalidInput, "no open conflict round " + std::to_string(round_id));
    }

    if (resolution == ConflictResolution::Keep && !round->has_listing()) {
        lock.unlock();
        auto listing = fetch_listing(round->prefix());
        lock.lock();
        store_listing(*round, listing);
        if (find_round(round_id) != round) {
            return Err<void>(ErrorKind::InvalidInput, "conflict round " + std::to_string(round_id) + " already resolved");
        }
    }

    std::vector<ConflictDecision> decisions;
    for (const auto& task_id : round->open_tasks()) {
        auto decision = round->decide(task_id, resolution);
        if (decision.is_ok()) {
            decisions.push_back(decision.value());
            finish(round, decision.value());
        }
    }
    auto sink = sink_;
    lock.unlock();

    for (const auto& decision : decisions) {
        bus_.emit(events::ConflictResolvedEvent{
            decision.round_id, decision.task_id, decision.resolution, decision.destination_name});
        if (sink) {
            sink(decision);
        }
    }
    return Ok();
}

void ConflictNegotiator::withdraw(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    auto round = round_for_task(task_id);
    if (!round) {
        return;
    }
    round->withdraw(task_id);
    round_of_task_.erase(task_id);
    if (round->settled()) {
        rounds_.erase(round->id());
    }
}

bool ConflictNegotiator::is_awaiting(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    return round_for_task(task_id) != nullptr;
}

std::size_t ConflictNegotiator::open_round_count() const {
    std::lock_guard lock(mutex_);
    return rounds_.size();
}

} // namespace rup::upload
