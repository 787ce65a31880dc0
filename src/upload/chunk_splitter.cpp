#include "rup/upload/chunk_splitter.hpp"

#include <algorithm>

namespace rup::upload {

std::uint32_t ChunkSplitter::chunk_count(std::uint64_t file_size) const noexcept {
    if (file_size == 0 || chunk_size_ == 0) {
        return 1;
    }
    return static_cast<std::uint32_t>((file_size + chunk_size_ - 1) / chunk_size_);
}

Result<ChunkPlan> ChunkSplitter::plan(std::uint64_t file_size) const {
    if (chunk_size_ == 0) {
        return Err<ChunkPlan>(ErrorKind::InvalidInput, "chunk_size must be > 0");
    }

    ChunkPlan chunks;
    if (file_size == 0) {
        chunks.push_back(ChunkDescriptor{0, 0, 0});
        return Ok(chunks);
    }

    const std::uint32_t total = chunk_count(file_size);
    chunks.reserve(total);
    for (std::uint32_t index = 0; index < total; ++index) {
        const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size_;
        const std::uint64_t length = std::min(chunk_size_, file_size - offset);
        chunks.push_back(ChunkDescriptor{index, offset, length});
    }
    return Ok(chunks);
}

} // namespace rup::upload
