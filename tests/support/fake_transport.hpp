#pragma once

/**
 * @file fake_transport.hpp
 * @brief Scriptable in-memory UploadTransport for pipeline tests
 *
 * Records every request it receives (with the token and a timestamp) and
 * tracks how many requests were in flight at once. Responses default to
 * 200 and can be scripted per chunk index or for a whole endpoint.
 */

#include "rup/upload/transport.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rup::test {

using Clock = std::chrono::steady_clock;

struct RecordedChunk {
    std::string file_id;
    std::string part_name;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::string folder_prefix;
    std::size_t size = 0;
    bool overwrite = false;
    std::string token;
    int status = 0;
    Clock::time_point at;
};

struct RecordedBulk {
    std::string folder_prefix;
    std::vector<std::string> file_names;
    std::size_t size = 0;
    bool overwrite = false;
    std::string token;
    int status = 0;
    Clock::time_point at;
};

class FakeTransport : public upload::UploadTransport {
public:
    // ──────────────────────────────────────────────────────────
    // Scripting
    // ──────────────────────────────────────────────────────────

    /**
     * @brief The next `times` attempts of chunk `index` answer `status`
     */
    void fail_chunk(std::uint32_t index, int times, int status = 500) {
        std::lock_guard lock(mutex_);
        auto& queue = chunk_script_[index];
        for (int i = 0; i < times; ++i) {
            queue.push_back(status);
        }
    }

    /**
     * @brief Every chunk request answers `status` (e.g. 501 for no chunk support)
     */
    void set_chunk_status(int status) {
        std::lock_guard lock(mutex_);
        chunk_status_ = status;
    }

    void set_bulk_status(int status) {
        std::lock_guard lock(mutex_);
        bulk_status_ = status;
    }

    /**
     * @brief The next `times` whole-file attempts answer `status`
     */
    void fail_bulk(int times, int status) {
        std::lock_guard lock(mutex_);
        for (int i = 0; i < times; ++i) {
            bulk_script_.push_back(status);
        }
    }

    /**
     * @brief Answer 401 unless the request carries this token
     */
    void require_token(std::string token) {
        std::lock_guard lock(mutex_);
        required_token_ = std::move(token);
    }

    /**
     * @brief Hold every upload request this long (cut short by cancellation)
     */
    void set_latency(std::chrono::milliseconds latency) {
        std::lock_guard lock(mutex_);
        latency_ = latency;
    }

    void set_listing(std::vector<upload::RemoteObject> objects) {
        std::lock_guard lock(mutex_);
        listing_ = std::move(objects);
    }

    void add_remote(const std::string& key, std::uint64_t size = 1) {
        std::lock_guard lock(mutex_);
        listing_.push_back(upload::RemoteObject{key, size, "2024-01-01T00:00:00Z"});
    }

    void fail_listing(bool fail) {
        std::lock_guard lock(mutex_);
        listing_fails_ = fail;
    }

    /**
     * @brief Hold every listing request this long
     */
    void set_listing_latency(std::chrono::milliseconds latency) {
        std::lock_guard lock(mutex_);
        listing_latency_ = latency;
    }

    // ──────────────────────────────────────────────────────────
    // UploadTransport
    // ──────────────────────────────────────────────────────────

    Result<upload::TransportResponse> upload_files(const upload::WholeFileRequest& request,
                                                   const std::string& auth_token,
                                                   const upload::CancellationToken& cancel) override {
        if (!enter(cancel)) {
            return Err<upload::TransportResponse>(ErrorKind::Cancelled, "request cancelled");
        }

        std::lock_guard lock(mutex_);
        --in_flight_;
        RecordedBulk call;
        call.folder_prefix = request.folder_prefix;
        for (const auto& file : request.files) {
            call.file_names.push_back(file.file_name);
            call.size += file.data.size();
        }
        call.overwrite = request.overwrite;
        call.token = auth_token;
        call.at = Clock::now();

        if (required_token_ && auth_token != *required_token_) {
            call.status = 401;
        } else if (!bulk_script_.empty()) {
            call.status = bulk_script_.front();
            bulk_script_.pop_front();
        } else {
            call.status = bulk_status_;
        }
        bulk_calls_.push_back(call);
        cv_.notify_all();
        return Ok(upload::TransportResponse{call.status, "{}"});
    }

    Result<upload::TransportResponse> upload_chunk(const upload::ChunkRequest& request,
                                                   const std::string& auth_token,
                                                   const upload::CancellationToken& cancel) override {
        if (!enter(cancel)) {
            return Err<upload::TransportResponse>(ErrorKind::Cancelled, "request cancelled");
        }

        std::lock_guard lock(mutex_);
        --in_flight_;
        RecordedChunk call;
        call.file_id = request.file_id;
        call.part_name = request.part_name;
        call.chunk_index = request.chunk_index;
        call.total_chunks = request.total_chunks;
        call.folder_prefix = request.folder_prefix;
        call.size = request.data.size();
        call.overwrite = request.overwrite;
        call.token = auth_token;
        call.at = Clock::now();

        auto scripted = chunk_script_.find(request.chunk_index);
        if (required_token_ && auth_token != *required_token_) {
            call.status = 401;
        } else if (chunk_status_) {
            call.status = *chunk_status_;
        } else if (scripted != chunk_script_.end() && !scripted->second.empty()) {
            call.status = scripted->second.front();
            scripted->second.pop_front();
        } else {
            call.status = 200;
        }
        chunk_calls_.push_back(call);
        cv_.notify_all();
        return Ok(upload::TransportResponse{call.status, "{}"});
    }

    Result<std::vector<upload::RemoteObject>> list_objects(const std::string& prefix,
                                                           std::size_t max_objects,
                                                           const std::string& auth_token) override {
        using Objects = std::vector<upload::RemoteObject>;
        std::chrono::milliseconds latency{0};
        {
            std::lock_guard lock(mutex_);
            listing_calls_.push_back(prefix);
            latency = listing_latency_;
            cv_.notify_all();
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        std::lock_guard lock(mutex_);
        if (listing_fails_) {
            return Err<Objects>(ErrorKind::TransientTransfer, "list-files answered 503");
        }
        Objects matching;
        for (const auto& object : listing_) {
            if (object.key.compare(0, prefix.size(), prefix) == 0 && matching.size() < max_objects) {
                matching.push_back(object);
            }
        }
        return Ok(matching);
    }

    // ──────────────────────────────────────────────────────────
    // Inspection
    // ──────────────────────────────────────────────────────────

    std::vector<RecordedChunk> chunk_calls() const {
        std::lock_guard lock(mutex_);
        return chunk_calls_;
    }

    std::vector<RecordedChunk> chunk_calls_for(const std::string& file_id) const {
        std::lock_guard lock(mutex_);
        std::vector<RecordedChunk> calls;
        std::copy_if(chunk_calls_.begin(), chunk_calls_.end(), std::back_inserter(calls),
            [&file_id](const RecordedChunk& call) { return call.file_id == file_id; });
        return calls;
    }

    std::vector<RecordedBulk> bulk_calls() const {
        std::lock_guard lock(mutex_);
        return bulk_calls_;
    }

    std::vector<std::string> listing_calls() const {
        std::lock_guard lock(mutex_);
        return listing_calls_;
    }

    std::size_t request_count() const {
        std::lock_guard lock(mutex_);
        return chunk_calls_.size() + bulk_calls_.size();
    }

    std::size_t max_in_flight() const {
        std::lock_guard lock(mutex_);
        return max_in_flight_;
    }

    std::size_t in_flight() const {
        std::lock_guard lock(mutex_);
        return in_flight_;
    }

    /**
     * @brief Block until at least `count` listing requests started
     */
    bool wait_for_listings(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count] { return listing_calls_.size() >= count; });
    }

    /**
     * @brief Block until at least `count` requests started (completed or not)
     */
    bool wait_for_started(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count] { return started_ >= count; });
    }

private:
    // Counts the request as in flight for the configured latency.
    // Returns false if cancellation cut the wait short.
    bool enter(const upload::CancellationToken& cancel) {
        std::chrono::milliseconds latency{0};
        {
            std::lock_guard lock(mutex_);
            ++started_;
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
            latency = latency_;
            cv_.notify_all();
        }
        if (latency.count() > 0 && cancel.wait_for(latency)) {
            std::lock_guard lock(mutex_);
            --in_flight_;
            return false;
        }
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::map<std::uint32_t, std::deque<int>> chunk_script_;
    std::optional<int> chunk_status_;
    std::deque<int> bulk_script_;
    int bulk_status_ = 200;
    std::optional<std::string> required_token_;
    std::chrono::milliseconds latency_{0};
    std::vector<upload::RemoteObject> listing_;
    bool listing_fails_ = false;
    std::chrono::milliseconds listing_latency_{0};

    std::vector<RecordedChunk> chunk_calls_;
    std::vector<RecordedBulk> bulk_calls_;
    std::vector<std::string> listing_calls_;
    std::size_t started_ = 0;
    std::size_t in_flight_ = 0;
    std::size_t max_in_flight_ = 0;
};

} // namespace rup::test
