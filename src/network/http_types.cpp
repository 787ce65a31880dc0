#include "rup/network/http_types.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rup::network {

Result<Url> parse_url(const std::string& text) {
    const std::string scheme = "http://";
    if (text.compare(0, scheme.size(), scheme) != 0) {
        if (text.compare(0, 8, "https://") == 0) {
            return Err<Url>(ErrorKind::InvalidInput, "https endpoints are not supported: " + text);
        }
        return Err<Url>(ErrorKind::InvalidInput, "endpoint must start with http:// : " + text);
    }

    Url url;
    const std::string rest = text.substr(scheme.size());
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        url.path = rest.substr(slash);
    }
    while (url.path.size() > 1 && url.path.back() == '/') {
        url.path.pop_back();
    }

    const auto colon = authority.rfind(':');
    url.host = authority.substr(0, colon);
    if (url.host.empty()) {
        return Err<Url>(ErrorKind::InvalidInput, "endpoint has no host: " + text);
    }
    if (colon != std::string::npos) {
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5
            || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Err<Url>(ErrorKind::InvalidInput, "invalid port in endpoint: " + text);
        }
        const int value = std::stoi(port);
        if (value == 0 || value > 65535) {
            return Err<Url>(ErrorKind::InvalidInput, "invalid port in endpoint: " + text);
        }
        url.port = static_cast<std::uint16_t>(value);
    }
    return Ok(url);
}

std::string url_encode(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

std::vector<std::uint8_t> HttpRequest::serialize(const std::string& host) const {
    std::ostringstream oss;

    // Request line
    oss << HttpMethodUtils::to_string(method) << " " << target << " HTTP/1.1\r\n";

    oss << "Host: " << host << "\r\n";
    for (const auto& [name, value] : headers) {
        if (header_name_equals(name, "Host") || header_name_equals(name, "Content-Length")
            || header_name_equals(name, "Connection")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (method == HttpMethod::POST || !body.empty()) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    oss << "Connection: close\r\n";

    // Empty line separates headers from body
    oss << "\r\n";

    std::string header_str = oss.str();
    std::vector<std::uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

std::string HttpResponse::get_header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    return it == headers.end() ? "" : it->second;
}

// ──────────────────────────────────────────────────────────
// MultipartForm
// ──────────────────────────────────────────────────────────

MultipartForm::MultipartForm()
    : MultipartForm("rup-" + boost::uuids::to_string(boost::uuids::random_generator()())) {}

MultipartForm::MultipartForm(std::string boundary)
    : boundary_(std::move(boundary)) {}

void MultipartForm::append(const std::string& text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

std::string MultipartForm::quote(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            quoted += "%22";
        } else if (c == '\r' || c == '\n') {
            quoted += ' ';
        } else {
            quoted.push_back(c);
        }
    }
    return quoted;
}

void MultipartForm::add_field(const std::string& name, const std::string& value) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + quote(name) + "\"\r\n\r\n");
    append(value);
    append("\r\n");
}

void MultipartForm::add_file(const std::string& name,
                             const std::string& file_name,
                             const std::vector<std::uint8_t>& data,
                             const std::string& content_type) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + quote(name) + "\"; filename=\"" + quote(file_name) + "\"\r\n");
    append("Content-Type: " + content_type + "\r\n\r\n");
    body_.insert(body_.end(), data.begin(), data.end());
    append("\r\n");
}

std::vector<std::uint8_t> MultipartForm::finish() {
    append("--" + boundary_ + "--\r\n");
    return std::move(body_);
}

} // namespace rup::network
