#include "rup/upload/transfer_executor.hpp"

#include "rup/upload/conflict.hpp"

#include <spdlog/spdlog.h>

namespace rup::upload {

RetryPolicy RetryPolicy::from_config(const UploaderConfig& config) {
    return RetryPolicy{config.max_retries, config.backoff_base};
}

std::chrono::milliseconds RetryPolicy::delay_before_retry(std::uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }
    return base_delay * (1LL << (retry - 1));
}

std::string TransferUnit::remote_name() const {
    if (!chunk) {
        return file_name;
    }
    return file_name + ".part" + std::to_string(chunk->index);
}

const char* to_string(UnitOutcome outcome) {
    switch (outcome) {
        case UnitOutcome::Succeeded: return "succeeded";
        case UnitOutcome::FallbackToWholeFile: return "fallback";
        case UnitOutcome::Conflict: return "conflict";
        case UnitOutcome::Cancelled: return "cancelled";
        case UnitOutcome::Failed: return "failed";
    }
    return "unknown";
}

TransferExecutor::TransferExecutor(UploadTransport& transport, const AuthToken& auth, RetryPolicy policy)
    : transport_(transport), auth_(auth), policy_(policy) {}

TransferExecutor::AttemptClass TransferExecutor::classify(int status_code, bool chunked) noexcept {
    if (status_code >= 200 && status_code < 300) {
        return AttemptClass::Success;
    }
    if (chunked && (status_code == 404 || status_code == 501)) {
        return AttemptClass::Fallback;
    }
    if (status_code == 409) {
        return AttemptClass::Conflict;
    }
    if (status_code >= 500 || status_code == 401 || status_code == 408 || status_code == 429) {
        return AttemptClass::Retryable;
    }
    return AttemptClass::Fatal;
}

UnitResult TransferExecutor::execute(const TransferUnit& unit,
                                     const FileSource& source,
                                     const CancellationToken& cancel) const {
    UnitResult result;
    if (cancel.is_cancelled()) {
        result.outcome = UnitOutcome::Cancelled;
        return result;
    }

    const bool chunked = !unit.is_whole_file();
    const std::uint64_t offset = chunked ? unit.chunk->byte_offset : 0;
    const std::uint64_t length = chunked ? unit.chunk->byte_length : source.size();
    auto payload = source.read(offset, length);
    if (payload.is_error()) {
        result.outcome = UnitOutcome::Failed;
        result.error = payload.error().message;
        return result;
    }

    WholeFileRequest whole;
    ChunkRequest part;
    if (chunked) {
        part.file_id = unit.task_id;
        part.part_name = unit.remote_name();
        part.chunk_index = unit.chunk->index;
        part.total_chunks = unit.total_chunks;
        part.folder_prefix = unit.destination_prefix;
        part.data = std::move(payload.value());
        part.overwrite = unit.overwrite;
    } else {
        whole.folder_prefix = unit.destination_prefix;
        whole.files.push_back(FilePart{unit.file_name, std::move(payload.value())});
        whole.overwrite = unit.overwrite;
    }

    const char* what = chunked ? "Chunk upload failed" : "Upload failed";
    std::string last_error;

    for (std::uint32_t attempt = 0; attempt <= policy_.max_retries; ++attempt) {
        if (cancel.is_cancelled()) {
            result.outcome = UnitOutcome::Cancelled;
            return result;
        }

        const std::string token = auth_.get();
        auto response = chunked ? transport_.upload_chunk(part, token, cancel)
                                : transport_.upload_files(whole, token, cancel);
        ++result.attempts;

        if (response.is_error()) {
            if (response.error().kind == ErrorKind::Cancelled) {
                result.outcome = UnitOutcome::Cancelled;
                return result;
            }
            last_error = response.error().message;
            if (response.error().kind != ErrorKind::TransientTransfer) {
                result.outcome = UnitOutcome::Failed;
                result.error = last_error;
                return result;
            }
        } else {
            const int status = response.value().status_code;
            switch (classify(status, chunked)) {
                case AttemptClass::Success:
                    result.outcome = UnitOutcome::Succeeded;
                    return result;
                case AttemptClass::Fallback:
                    spdlog::info("Chunk endpoint answered {} for task {}, switching to whole-file upload",
                                 status, unit.task_id);
                    result.outcome = UnitOutcome::FallbackToWholeFile;
                    return result;
                case AttemptClass::Conflict:
                    result.outcome = UnitOutcome::Conflict;
                    result.error = join_destination(unit.destination_prefix, unit.file_name) + " already exists";
                    return result;
                case AttemptClass::Fatal:
                    result.outcome = UnitOutcome::Failed;
                    result.error = std::string(what) + ": " + std::to_string(status);
                    return result;
                case AttemptClass::Retryable:
                    last_error = std::string(what) + ": " + std::to_string(status);
                    break;
            }
        }

        if (attempt < policy_.max_retries) {
            const auto delay = policy_.delay_before_retry(attempt + 1);
            spdlog::warn("{} for {} (attempt {}/{}): {}; retrying in {}ms",
                         what, unit.remote_name(), attempt + 1, policy_.max_retries + 1,
                         last_error, delay.count());
            if (cancel.wait_for(delay)) {
                result.outcome = UnitOutcome::Cancelled;
                return result;
            }
        }
    }

    result.outcome = UnitOutcome::Failed;
    result.error = last_error.empty() ? std::string(what) + " after retries" : last_error;
    return result;
}

} // namespace rup::upload
