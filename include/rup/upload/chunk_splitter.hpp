#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>

namespace rup::upload {

/**
 * @brief Deterministic partition of a file's byte range
 *
 * Every chunk but the last has exactly chunk_size bytes; the last one
 * holds the remainder. An empty file yields one zero-length chunk so
 * every task has at least one unit of work.
 */
class ChunkSplitter {
public:
    static constexpr std::uint64_t kDefaultChunkSize = 5ULL * 1024 * 1024;

    explicit ChunkSplitter(std::uint64_t chunk_size = kDefaultChunkSize) noexcept
        : chunk_size_(chunk_size) {}

    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    /**
     * @brief Number of chunks for a file of the given size (>= 1)
     */
    [[nodiscard]] std::uint32_t chunk_count(std::uint64_t file_size) const noexcept;

    /**
     * @return Plan, or InvalidInput when the splitter was built with chunk_size 0
     */
    Result<ChunkPlan> plan(std::uint64_t file_size) const;

private:
    std::uint64_t chunk_size_;
};

} // namespace rup::upload
