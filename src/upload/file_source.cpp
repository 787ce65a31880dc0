#include "rup/upload/file_source.hpp"

#include <fstream>

namespace rup::upload {
namespace fs = std::filesystem;

namespace {

Result<void> check_range(std::uint64_t offset, std::uint64_t length, std::uint64_t size, const std::string& name) {
    if (offset > size || length > size - offset) {
        return Err<void>(ErrorKind::InvalidInput, "read past end of " + name);
    }
    return Ok();
}

} // namespace

LocalFileSource::LocalFileSource(fs::path path, std::string name, std::uint64_t size)
    : path_(std::move(path)), name_(std::move(name)), size_(size) {}

Result<std::shared_ptr<LocalFileSource>> LocalFileSource::open(const fs::path& path) {
    return open(path, path.filename().string());
}

Result<std::shared_ptr<LocalFileSource>> LocalFileSource::open(const fs::path& path, std::string upload_name) {
    using Ptr = std::shared_ptr<LocalFileSource>;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<Ptr>(ErrorKind::InvalidInput, "not a readable file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<Ptr>(ErrorKind::InvalidInput, "cannot stat " + path.string() + ": " + ec.message());
    }
    std::ifstream readable(path, std::ios::binary);
    if (!readable) {
        return Err<Ptr>(ErrorKind::InvalidInput, "cannot open " + path.string());
    }
    if (upload_name.empty()) {
        return Err<Ptr>(ErrorKind::InvalidInput, "file has no name: " + path.string());
    }
    return Ok(Ptr(new LocalFileSource(path, std::move(upload_name), static_cast<std::uint64_t>(size))));
}

Result<std::vector<std::uint8_t>> LocalFileSource::read(std::uint64_t offset, std::uint64_t length) const {
    using Bytes = std::vector<std::uint8_t>;
    if (auto range = check_range(offset, length, size_, name_); range.is_error()) {
        return Err<Bytes>(range.error());
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<Bytes>(ErrorKind::PersistentTransfer, "failed to open source file: " + path_.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));

    Bytes buffer(static_cast<std::size_t>(length));
    if (length > 0) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(input.gcount()) != length) {
            return Err<Bytes>(ErrorKind::PersistentTransfer,
                              "short read from " + path_.string() + " (file changed during upload?)");
        }
    }
    return Ok(std::move(buffer));
}

MemoryFileSource::MemoryFileSource(std::string name, std::vector<std::uint8_t> data)
    : name_(std::move(name)), data_(std::move(data)) {}

MemoryFileSource::MemoryFileSource(std::string name, const std::string& text)
    : name_(std::move(name)), data_(text.begin(), text.end()) {}

Result<std::vector<std::uint8_t>> MemoryFileSource::read(std::uint64_t offset, std::uint64_t length) const {
    using Bytes = std::vector<std::uint8_t>;
    if (auto range = check_range(offset, length, data_.size(), name_); range.is_error()) {
        return Err<Bytes>(range.error());
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(Bytes(begin, begin + static_cast<std::ptrdiff_t>(length)));
}

} // namespace rup::upload
