#pragma once

#include "rup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rup {

/**
 * @brief Tunables for one UploadManager instance
 *
 * Defaults match the dashboard behaviour the pipeline replaces:
 * 5 MiB chunks, 3 concurrent uploads, whole-file transfer below 10 MiB,
 * 3 retries with 1s/2s/4s backoff, completed tasks visible for 5s,
 * failed tasks retried automatically after 5s.
 */
struct UploaderConfig {
    static constexpr std::uint64_t kMiB = 1024 * 1024;

    std::uint64_t chunk_size = 5 * kMiB;
    std::size_t max_concurrent_uploads = 3;
    std::uint64_t single_shot_threshold = 10 * kMiB;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds completed_grace{5000};
    bool auto_retry = true;
    std::chrono::milliseconds auto_retry_delay{5000};
    std::uint32_t max_auto_retries = 3;   ///< Per task; a manual retry starts the count again
    std::chrono::milliseconds request_timeout{60000};
    std::size_t listing_limit = 1000;

    std::string endpoint;             ///< e.g. http://storage.local:8080/api/v2/external/storage
    std::filesystem::path state_dir;  ///< Empty = keep progress in memory only
};

/**
 * @brief Reject configurations the scheduler cannot run with
 */
Result<void> validate(const UploaderConfig& config);

/**
 * @brief Load a JSON config file on top of the defaults
 *
 * Unknown keys are ignored; durations are given in milliseconds
 * ("backoff_base_ms", "completed_grace_ms", "auto_retry_delay_ms",
 * "request_timeout_ms").
 */
Result<UploaderConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Same as load_config but from an in-memory JSON document
 */
Result<UploaderConfig> parse_config(const std::string& json_text);

} // namespace rup
