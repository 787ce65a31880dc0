#pragma once

#include "rup/core/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace rup::network {

/**
 * @brief Request methods the upload client sends
 */
enum class HttpMethod {
    GET,
    POST
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
        }
        return "UNKNOWN";
    }
};

/**
 * @brief Case-insensitive header name comparison (RFC 7230)
 */
inline bool header_name_equals(const std::string& a, const std::string& b) {
#ifdef _WIN32
    return _stricmp(a.c_str(), b.c_str()) == 0;
#else
    return strcasecmp(a.c_str(), b.c_str()) == 0;
#endif
}

/**
 * @brief Absolute http:// URL split into its parts
 *
 * Example: "http://storage.local:8080/api/v2/external/storage"
 *   host = "storage.local", port = 8080, path = "/api/v2/external/storage"
 */
struct Url {
    std::string scheme = "http";
    std::string host;
    std::uint16_t port = 80;
    std::string path = "/";     ///< Never empty, no trailing slash unless root

    /**
     * @brief "host" or "host:port" for the Host header
     */
    std::string authority() const {
        return port == 80 ? host : host + ":" + std::to_string(port);
    }
};

/**
 * @return InvalidInput for anything but http://host[:port][/path]
 */
Result<Url> parse_url(const std::string& text);

/**
 * @brief Percent-encode for use inside a query string
 */
std::string url_encode(const std::string& text);

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * Wire format:
 * POST /upload-chunk HTTP/1.1\r\n
 * Host: storage.local:8080\r\n
 * Content-Length: 1234\r\n
 * \r\n
 * [body]
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target = "/";                                 // Path plus query
    std::vector<std::pair<std::string, std::string>> headers; // Sent in insertion order
    std::vector<std::uint8_t> body;

    void set_header(const std::string& name, const std::string& value) {
        for (auto& [key, current] : headers) {
            if (header_name_equals(key, name)) {
                current = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (header_name_equals(key, name)) {
                return value;
            }
        }
        return "";
    }

    /**
     * @brief Wire bytes; adds Host, Content-Length and Connection: close
     */
    std::vector<std::uint8_t> serialize(const std::string& host) const;
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;   // Names lower-cased
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const;

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief multipart/form-data body builder (RFC 7578)
 *
 * EXAMPLE:
 * MultipartForm form;
 * form.add_field("chunk_index", "0");
 * form.add_file("file", "video.mp4.part0", bytes);
 * request.set_header("Content-Type", form.content_type());
 * request.body = form.finish();
 */
class MultipartForm {
public:
    MultipartForm();
    explicit MultipartForm(std::string boundary);

    void add_field(const std::string& name, const std::string& value);

    void add_file(const std::string& name,
                  const std::string& file_name,
                  const std::vector<std::uint8_t>& data,
                  const std::string& content_type = "application/octet-stream");

    const std::string& boundary() const { return boundary_; }
    std::string content_type() const { return "multipart/form-data; boundary=" + boundary_; }

    /**
     * @brief Append the closing delimiter and hand over the body
     */
    std::vector<std::uint8_t> finish();

private:
    void append(const std::string& text);
    static std::string quote(const std::string& value);

    std::string boundary_;
    std::vector<std::uint8_t> body_;
};

} // namespace rup::network
