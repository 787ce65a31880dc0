#pragma once

#include "rup/upload/file_source.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rup::test {

/**
 * @brief In-memory file of `size` bytes with a repeating byte pattern
 */
inline std::shared_ptr<const upload::FileSource> memory_file(const std::string& name, std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i % 251);
    }
    return std::make_shared<upload::MemoryFileSource>(name, std::move(data));
}

} // namespace rup::test
