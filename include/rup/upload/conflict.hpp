#pragma once

/**
 * @file conflict.hpp
 * @brief Destination collision detection and the resolution protocol
 *
 * FLOW:
 * 1. detect() lists the destination prefix once per submission batch
 * 2. Colliding tasks are admitted as AwaitingConflictResolution
 * 3. open_round() publishes one ConflictBatchEvent for the whole batch;
 *    a submitter that must admit the tasks in between calls create_round()
 *    and announce_round() separately
 * 4. The caller answers per task (resolve) or for the round (resolve_all)
 * 5. Each decision is handed to the decision sink, which forwards it to
 *    the scheduler as an ApplyResolution command
 *
 * Nothing here blocks the scheduler: a round is just bookkeeping until a
 * decision arrives.
 */

#include "rup/core/result.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/upload/transport.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rup::upload {

/**
 * @brief "prefix/name" with exactly one separator; bare name for an empty prefix
 */
std::string join_destination(const std::string& prefix, const std::string& name);

/**
 * @brief Names of the objects directly under prefix (no deeper keys)
 */
std::map<std::string, RemoteObject> direct_children(const std::vector<RemoteObject>& listing,
                                                    const std::string& prefix);

/**
 * @brief Smallest "stem (n).ext" with n >= 1 that is not in taken
 *
 * The extension starts at the last dot; a leading dot (".env") is part of
 * the stem.
 */
std::string unique_name(const std::string& name, const std::set<std::string>& taken);

/**
 * @brief One decision, ready to be applied by the scheduler
 */
struct ConflictDecision {
    std::uint64_t round_id = 0;
    std::string task_id;
    ConflictResolution resolution = ConflictResolution::Cancel;
    std::string destination_name;   ///< Name to upload under (renamed for Keep)
};

/**
 * @brief Candidate for an existence check
 */
struct PendingFile {
    std::string task_id;
    std::string destination_name;
};

struct ExistenceCheck {
    std::vector<ConflictRecord> conflicts;
    std::optional<std::vector<RemoteObject>> listing;   ///< Empty when the listing failed
};

/**
 * @brief Conflicts raised together, resolved together
 */
class NegotiationRound {
public:
    NegotiationRound(std::uint64_t id,
                     std::string prefix,
                     std::vector<ConflictRecord> records,
                     std::set<std::string> reserved_names);

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }
    [[nodiscard]] const std::vector<ConflictRecord>& records() const noexcept { return records_; }

    [[nodiscard]] bool is_open(const std::string& task_id) const;
    [[nodiscard]] std::vector<std::string> open_tasks() const;
    [[nodiscard]] bool settled() const noexcept { return decided_.size() == records_.size(); }

    [[nodiscard]] bool has_listing() const noexcept { return listing_loaded_; }
    void set_listing(const std::vector<RemoteObject>& listing);

    /**
     * @brief Consume the record for task_id
     *
     * @return InvalidInput if the task is not part of this round or was
     *         already decided
     */
    Result<ConflictDecision> decide(const std::string& task_id, ConflictResolution resolution);

    /**
     * @brief Drop a record without a decision (task cancelled meanwhile)
     */
    void withdraw(const std::string& task_id);

private:
    const ConflictRecord* find(const std::string& task_id) const;

    std::uint64_t id_;
    std::string prefix_;
    std::vector<ConflictRecord> records_;
    std::set<std::string> decided_;
    std::set<std::string> taken_names_;   ///< Remote names plus names claimed in this round
    bool listing_loaded_ = false;
};

/**
 * @brief Runs existence checks and owns the open negotiation rounds
 *
 * THREAD SAFETY: every public method may be called from any thread. The
 * decision sink is invoked outside the internal lock.
 */
class ConflictNegotiator {
public:
    using DecisionSink = std::function<void(const ConflictDecision&)>;

    ConflictNegotiator(events::EventBus& bus,
                       UploadTransport& transport,
                       const AuthToken& auth,
                       std::size_t listing_limit);

    void set_decision_sink(DecisionSink sink);

    /**
     * @brief List prefix once and report every candidate whose name is taken
     *
     * A failed listing is logged and treated as "no conflicts".
     */
    ExistenceCheck detect(const std::string& prefix, const std::vector<PendingFile>& files);

    /**
     * @brief Register a round and publish a ConflictBatchEvent
     *
     * @param listing Listing from detect(), reused for "keep" renames; when
     *                absent it is fetched on the first "keep" decision
     * @param reserved_names Other names being uploaded alongside (never
     *                       chosen as a rename target)
     */
    std::uint64_t open_round(const std::string& prefix,
                             std::vector<ConflictRecord> records,
                             const std::optional<std::vector<RemoteObject>>& listing = std::nullopt,
                             std::set<std::string> reserved_names = {});

    /**
     * @brief Register a round without publishing it yet
     *
     * The tasks count as awaiting (withdraw() finds them) from here on.
     */
    std::uint64_t create_round(const std::string& prefix,
                               std::vector<ConflictRecord> records,
                               const std::optional<std::vector<RemoteObject>>& listing = std::nullopt,
                               std::set<std::string> reserved_names = {});

    /**
     * @brief Publish the ConflictBatchEvent for the records still open
     *
     * Does nothing if every record was withdrawn or decided meanwhile.
     */
    void announce_round(std::uint64_t round_id);

    Result<void> resolve(const std::string& task_id, ConflictResolution resolution);

    /**
     * @brief Apply one decision to every still-open record of a round
     */
    Result<void> resolve_all(std::uint64_t round_id, ConflictResolution resolution);

    /**
     * @brief Forget the task's open record, if any
     */
    void withdraw(const std::string& task_id);

    [[nodiscard]] bool is_awaiting(const std::string& task_id) const;
    [[nodiscard]] std::size_t open_round_count() const;

private:
    Result<std::vector<RemoteObject>> fetch_listing(const std::string& prefix);
    std::shared_ptr<NegotiationRound> find_round(std::uint64_t round_id) const;
    std::shared_ptr<NegotiationRound> round_for_task(const std::string& task_id) const;
    void store_listing(NegotiationRound& round, const Result<std::vector<RemoteObject>>& listing);
    void finish(const std::shared_ptr<NegotiationRound>& round, const ConflictDecision& decision);

    events::EventBus& bus_;
    UploadTransport& transport_;
    const AuthToken& auth_;
    std::size_t listing_limit_;

    mutable std::mutex mutex_;
    DecisionSink sink_;
    std::uint64_t next_round_id_ = 1;
    std::unordered_map<std::uint64_t, std::shared_ptr<NegotiationRound>> rounds_;
    std::unordered_map<std::string, std::uint64_t> round_of_task_;
};

} // namespace rup::upload
