#pragma once

#include "rup/core/config.hpp"
#include "rup/upload/cancellation.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/transport.hpp"
#include "rup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rup::upload {

struct RetryPolicy {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};

    static RetryPolicy from_config(const UploaderConfig& config);

    /**
     * @brief Wait before retry number `retry` (1-indexed): base * 2^(retry-1)
     */
    [[nodiscard]] std::chrono::milliseconds delay_before_retry(std::uint32_t retry) const;
};

/**
 * @brief One chunk, or the whole file when chunk is empty
 */
struct TransferUnit {
    std::string task_id;
    std::string file_name;               ///< Destination name (after any rename)
    std::string destination_prefix;
    std::optional<ChunkDescriptor> chunk;
    std::uint32_t total_chunks = 1;
    bool overwrite = false;

    [[nodiscard]] bool is_whole_file() const noexcept { return !chunk.has_value(); }

    /**
     * @brief file_name for whole-file units, "<file_name>.part<index>" for chunks
     */
    [[nodiscard]] std::string remote_name() const;
};

enum class UnitOutcome {
    Succeeded,
    FallbackToWholeFile,  ///< Chunk endpoint unsupported by the backend
    Conflict,             ///< Destination occupied (409)
    Cancelled,
    Failed                ///< Retries exhausted or non-retryable response
};

const char* to_string(UnitOutcome outcome);

struct UnitResult {
    UnitOutcome outcome = UnitOutcome::Failed;
    std::string error;
    std::uint32_t attempts = 0;
};

/**
 * @brief Performs one unit of work against the transport
 *
 * Owns retry and backoff for that unit and never touches task state;
 * the scheduler applies the returned outcome. The auth token is read at
 * the start of every attempt, so a retry after a token rotation uses the
 * new token.
 */
class TransferExecutor {
public:
    TransferExecutor(UploadTransport& transport, const AuthToken& auth, RetryPolicy policy);

    UnitResult execute(const TransferUnit& unit, const FileSource& source, const CancellationToken& cancel) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    enum class AttemptClass {
        Success,
        Retryable,
        Fallback,
        Conflict,
        Fatal
    };

    static AttemptClass classify(int status_code, bool chunked) noexcept;

    UploadTransport& transport_;
    const AuthToken& auth_;
    RetryPolicy policy_;
};

} // namespace rup::upload
