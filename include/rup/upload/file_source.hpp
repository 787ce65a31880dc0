#pragma once

#include "rup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rup::upload {

/**
 * @brief Bytes of one file to be uploaded
 *
 * Implementations must allow read() from several threads.
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;

    /**
     * @brief Read [offset, offset + length)
     */
    virtual Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const = 0;

    Result<std::vector<std::uint8_t>> read_all() const { return read(0, size()); }
};

/**
 * @brief File on local disk, opened once and read with positioned reads
 */
class LocalFileSource : public FileSource {
public:
    /**
     * @return InvalidInput when the path is missing, not a regular file or unreadable
     */
    static Result<std::shared_ptr<LocalFileSource>> open(const std::filesystem::path& path);

    /**
     * @brief Upload the file under a different name (used for "keep" renames)
     */
    static Result<std::shared_ptr<LocalFileSource>> open(const std::filesystem::path& path, std::string upload_name);

    const std::string& name() const noexcept override { return name_; }
    std::uint64_t size() const noexcept override { return size_; }
    const std::filesystem::path& path() const noexcept { return path_; }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const override;

private:
    LocalFileSource(std::filesystem::path path, std::string name, std::uint64_t size);

    std::filesystem::path path_;
    std::string name_;
    std::uint64_t size_;
};

/**
 * @brief In-memory payload
 */
class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name, std::vector<std::uint8_t> data);
    MemoryFileSource(std::string name, const std::string& text);

    const std::string& name() const noexcept override { return name_; }
    std::uint64_t size() const noexcept override { return data_.size(); }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const override;

private:
    std::string name_;
    std::vector<std::uint8_t> data_;
};

} // namespace rup::upload
