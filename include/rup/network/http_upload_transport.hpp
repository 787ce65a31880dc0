#pragma once

#include "rup/network/http_client.hpp"
#include "rup/network/http_types.hpp"
#include "rup/upload/transport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rup::network {

/**
 * @brief UploadTransport speaking to the storage REST endpoints
 *
 * ENDPOINTS (relative to the configured base URL):
 * - POST upload-bulk   multipart: files (1..n), folder_prefix?, overwrite?
 * - POST upload-chunk  multipart: file (<name>.part<i>), chunk_index,
 *                      total_chunks, file_id, folder_prefix?, overwrite?
 * - GET  list-files?prefix=<p>&max_files=<n>
 *        -> [{"key": "...", "size": 1, "last_modified": "..."}]
 *
 * Every request carries "Authorization: Bearer <token>" when a token is set.
 */
class HttpUploadTransport : public upload::UploadTransport {
public:
    /**
     * @throws std::invalid_argument if endpoint is not an http:// URL
     */
    HttpUploadTransport(const std::string& endpoint, std::chrono::milliseconds request_timeout);

    Result<upload::TransportResponse> upload_files(const upload::WholeFileRequest& request,
                                                   const std::string& auth_token,
                                                   const upload::CancellationToken& cancel) override;

    Result<upload::TransportResponse> upload_chunk(const upload::ChunkRequest& request,
                                                   const std::string& auth_token,
                                                   const upload::CancellationToken& cancel) override;

    Result<std::vector<upload::RemoteObject>> list_objects(const std::string& prefix,
                                                           std::size_t max_objects,
                                                           const std::string& auth_token) override;

    const Url& base_url() const noexcept { return base_; }

    /**
     * @brief Decode a list-files response body
     *
     * Accepts a bare array or an object with a "files" array.
     */
    static Result<std::vector<upload::RemoteObject>> parse_listing(const std::string& body);

    static HttpRequest build_bulk_request(const Url& base,
                                          const upload::WholeFileRequest& request,
                                          const std::string& auth_token);

    static HttpRequest build_chunk_request(const Url& base,
                                           const upload::ChunkRequest& request,
                                           const std::string& auth_token);

private:
    Result<upload::TransportResponse> post(const HttpRequest& request, const upload::CancellationToken& cancel);

    Url base_;
    HttpClient client_;
};

} // namespace rup::network
