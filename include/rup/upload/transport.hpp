#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/cancellation.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace rup::upload {

struct FilePart {
    std::string file_name;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Whole-file upload of one or more files into one folder
 */
struct WholeFileRequest {
    std::string folder_prefix;
    std::vector<FilePart> files;
    bool overwrite = false;
};

/**
 * @brief One chunk of a multi-part upload, correlated by file_id
 */
struct ChunkRequest {
    std::string file_id;
    std::string part_name;          ///< "<file name>.part<index>"
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::string folder_prefix;
    std::vector<std::uint8_t> data;
    bool overwrite = false;
};

struct TransportResponse {
    int status_code = 0;
    std::string body;
};

/**
 * @brief The object-storage endpoints the pipeline consumes
 *
 * Implementations report I/O failures and timeouts as TransientTransfer
 * and aborted requests as Cancelled. Any HTTP status, including errors,
 * is returned as a successful TransportResponse for the executor to
 * classify.
 */
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual Result<TransportResponse> upload_files(const WholeFileRequest& request,
                                                   const std::string& auth_token,
                                                   const CancellationToken& cancel) = 0;

    virtual Result<TransportResponse> upload_chunk(const ChunkRequest& request,
                                                   const std::string& auth_token,
                                                   const CancellationToken& cancel) = 0;

    /**
     * @brief Objects whose key starts with prefix, at most max_objects of them
     */
    virtual Result<std::vector<RemoteObject>> list_objects(const std::string& prefix,
                                                           std::size_t max_objects,
                                                           const std::string& auth_token) = 0;
};

/**
 * @brief Current bearer token shared by the manager and every executor
 */
class AuthToken {
public:
    AuthToken() = default;
    explicit AuthToken(std::string token) : token_(std::move(token)) {}

    void set(std::string token) {
        std::lock_guard lock(mutex_);
        token_ = std::move(token);
    }

    [[nodiscard]] std::string get() const {
        std::lock_guard lock(mutex_);
        return token_;
    }

private:
    mutable std::mutex mutex_;
    std::string token_;
};

} // namespace rup::upload
