#include "rup/network/http_upload_transport.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace rup::network {
namespace {

using json = nlohmann::json;

Url parse_endpoint(const std::string& endpoint) {
    auto url = parse_url(endpoint);
    if (url.is_error()) {
        throw std::invalid_argument(url.error().message);
    }
    return url.value();
}

std::string route(const Url& base, const std::string& name) {
    return (base.path == "/" ? std::string{} : base.path) + "/" + name;
}

void authorize(HttpRequest& request, const std::string& auth_token) {
    if (!auth_token.empty()) {
        request.set_header("Authorization", "Bearer " + auth_token);
    }
}

} // namespace

HttpUploadTransport::HttpUploadTransport(const std::string& endpoint, std::chrono::milliseconds request_timeout)
    : base_(parse_endpoint(endpoint))
    , client_(request_timeout) {}

HttpRequest HttpUploadTransport::build_bulk_request(const Url& base,
                                                    const upload::WholeFileRequest& request,
                                                    const std::string& auth_token) {
    MultipartForm form;
    for (const auto& file : request.files) {
        form.add_file("files", file.file_name, file.data);
    }
    if (!request.folder_prefix.empty()) {
        form.add_field("folder_prefix", request.folder_prefix);
    }
    if (request.overwrite) {
        form.add_field("overwrite", "true");
    }

    HttpRequest http;
    http.method = HttpMethod::POST;
    http.target = route(base, "upload-bulk");
    authorize(http, auth_token);
    http.set_header("Content-Type", form.content_type());
    http.body = form.finish();
    return http;
}

HttpRequest HttpUploadTransport::build_chunk_request(const Url& base,
                                                     const upload::ChunkRequest& request,
                                                     const std::string& auth_token) {
    MultipartForm form;
    form.add_file("file", request.part_name, request.data);
    form.add_field("chunk_index", std::to_string(request.chunk_index));
    form.add_field("total_chunks", std::to_string(request.total_chunks));
    form.add_field("file_id", request.file_id);
    if (!request.folder_prefix.empty()) {
        form.add_field("folder_prefix", request.folder_prefix);
    }
    if (request.overwrite) {
        form.add_field("overwrite", "true");
    }

    HttpRequest http;
    http.method = HttpMethod::POST;
    http.target = route(base, "upload-chunk");
    authorize(http, auth_token);
    http.set_header("Content-Type", form.content_type());
    http.body = form.finish();
    return http;
}

Result<upload::TransportResponse> HttpUploadTransport::post(const HttpRequest& request,
                                                            const upload::CancellationToken& cancel) {
    auto response = client_.send(base_, request, cancel);
    if (response.is_error()) {
        return Err<upload::TransportResponse>(response.error());
    }
    return Ok(upload::TransportResponse{response.value().status_code, response.value().body_as_string()});
}

Result<upload::TransportResponse> HttpUploadTransport::upload_files(const upload::WholeFileRequest& request,
                                                                    const std::string& auth_token,
                                                                    const upload::CancellationToken& cancel) {
    return post(build_bulk_request(base_, request, auth_token), cancel);
}

Result<upload::TransportResponse> HttpUploadTransport::upload_chunk(const upload::ChunkRequest& request,
                                                                    const std::string& auth_token,
                                                                    const upload::CancellationToken& cancel) {
    return post(build_chunk_request(base_, request, auth_token), cancel);
}

Result<std::vector<upload::RemoteObject>> HttpUploadTransport::list_objects(const std::string& prefix,
                                                                            std::size_t max_objects,
                                                                            const std::string& auth_token) {
    using Objects = std::vector<upload::RemoteObject>;

    HttpRequest http;
    http.method = HttpMethod::GET;
    http.target = route(base_, "list-files") + "?prefix=" + url_encode(prefix)
                + "&max_files=" + std::to_string(max_objects);
    authorize(http, auth_token);

    auto response = client_.send(base_, http, upload::CancellationToken{});
    if (response.is_error()) {
        return Err<Objects>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<Objects>(ErrorKind::TransientTransfer,
                            "list-files answered " + std::to_string(response.value().status_code));
    }
    return parse_listing(response.value().body_as_string());
}

Result<std::vector<upload::RemoteObject>> HttpUploadTransport::parse_listing(const std::string& body) {
    using Objects = std::vector<upload::RemoteObject>;

    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        return Err<Objects>(ErrorKind::TransientTransfer, "list-files returned invalid JSON");
    }
    if (doc.is_object() && doc.contains("files")) {
        doc = doc["files"];
    }
    if (!doc.is_array()) {
        return Err<Objects>(ErrorKind::TransientTransfer, "list-files did not return an array");
    }

    Objects objects;
    objects.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object() || !item.contains("key") || !item["key"].is_string()) {
            spdlog::debug("Skipping listing entry without a key");
            continue;
        }
        upload::RemoteObject object;
        object.key = item["key"].get<std::string>();
        if (item.contains("size") && item["size"].is_number_unsigned()) {
            object.size = item["size"].get<std::uint64_t>();
        }
        if (item.contains("last_modified") && item["last_modified"].is_string()) {
            object.last_modified = item["last_modified"].get<std::string>();
        }
        objects.push_back(std::move(object));
    }
    return Ok(objects);
}

} // namespace rup::network
