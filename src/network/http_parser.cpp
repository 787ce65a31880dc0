#include "rup/network/http_parser.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rup::network {
namespace {

constexpr std::size_t kMaxHeaderLine = 64 * 1024;

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

void HttpResponseParser::reset() {
    state_ = ResponseParseState::STATUS_LINE;
    response_ = HttpResponse();
    buffer_.clear();
    remaining_ = 0;
}

Result<bool> HttpResponseParser::fail(const std::string& message) {
    state_ = ResponseParseState::PARSE_ERROR;
    return Err<bool>(ErrorKind::TransientTransfer, message);
}

Result<bool> HttpResponseParser::parse(const char* data, std::size_t len) {
    if (state_ == ResponseParseState::COMPLETE) {
        return Ok(true);
    }
    buffer_.append(data, len);

    for (;;) {
        switch (state_) {
            case ResponseParseState::STATUS_LINE: {
                auto progressed = parse_status_line();
                if (progressed.is_error() || !progressed.value()) {
                    return progressed;
                }
                break;
            }

            case ResponseParseState::HEADERS: {
                auto progressed = parse_headers();
                if (progressed.is_error() || !progressed.value()) {
                    return progressed;
                }
                break;
            }

            case ResponseParseState::BODY_LENGTH:
                if (!consume_body_length()) {
                    return Ok(false);
                }
                break;

            case ResponseParseState::CHUNK_SIZE: {
                auto progressed = parse_chunk_size();
                if (progressed.is_error() || !progressed.value()) {
                    return progressed;
                }
                break;
            }

            case ResponseParseState::CHUNK_DATA:
                if (!consume_chunk_data()) {
                    return Ok(false);
                }
                break;

            case ResponseParseState::CHUNK_TRAILER:
                if (!consume_chunk_trailer()) {
                    return Ok(false);
                }
                break;

            case ResponseParseState::BODY_UNTIL_CLOSE:
                response_.body.insert(response_.body.end(), buffer_.begin(), buffer_.end());
                buffer_.clear();
                return Ok(false);

            case ResponseParseState::COMPLETE:
                return Ok(true);

            case ResponseParseState::PARSE_ERROR:
                return fail("Parser in error state");
        }
    }
}

Result<bool> HttpResponseParser::finish_on_close() {
    switch (state_) {
        case ResponseParseState::COMPLETE:
            return Ok(true);
        case ResponseParseState::BODY_UNTIL_CLOSE:
            response_.body.insert(response_.body.end(), buffer_.begin(), buffer_.end());
            buffer_.clear();
            state_ = ResponseParseState::COMPLETE;
            return Ok(true);
        default:
            return fail("Connection closed before the response was complete");
    }
}

bool HttpResponseParser::take_line(std::string& line) {
    const auto end = buffer_.find('\n');
    if (end == std::string::npos) {
        return false;
    }
    line = buffer_.substr(0, end);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    buffer_.erase(0, end + 1);
    return true;
}

Result<bool> HttpResponseParser::parse_status_line() {
    std::string line;
    if (!take_line(line)) {
        if (buffer_.size() > kMaxHeaderLine) {
            return fail("Status line too long");
        }
        return Ok(false);
    }

    // HTTP/1.1 404 Not Found
    if (line.compare(0, 5, "HTTP/") != 0) {
        return fail("Malformed status line: " + line);
    }
    const auto code_start = line.find(' ');
    if (code_start == std::string::npos || line.size() < code_start + 4) {
        return fail("Malformed status line: " + line);
    }
    const std::string code = line.substr(code_start + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return fail("Malformed status code: " + code);
    }
    response_.status_code = std::stoi(code);
    if (line.size() > code_start + 5) {
        response_.reason_phrase = line.substr(code_start + 5);
    }
    state_ = ResponseParseState::HEADERS;
    return Ok(true);
}

Result<bool> HttpResponseParser::parse_headers() {
    std::string line;
    while (take_line(line)) {
        if (line.empty()) {
            return begin_body();
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return fail("Malformed header: " + line);
        }
        const std::string name = to_lower(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));
        auto [it, inserted] = response_.headers.emplace(name, value);
        if (!inserted) {
            it->second += ", " + value;
        }
    }
    if (buffer_.size() > kMaxHeaderLine) {
        return fail("Header line too long");
    }
    return Ok(false);
}

Result<bool> HttpResponseParser::begin_body() {
    const int code = response_.status_code;
    if ((code >= 100 && code < 200) || code == 204 || code == 304) {
        state_ = ResponseParseState::COMPLETE;
        return Ok(true);
    }

    if (to_lower(response_.get_header("transfer-encoding")).find("chunked") != std::string::npos) {
        state_ = ResponseParseState::CHUNK_SIZE;
        return Ok(true);
    }

    const std::string length = response_.get_header("content-length");
    if (length.empty()) {
        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return Ok(true);
    }
    try {
        remaining_ = static_cast<std::size_t>(std::stoull(length));
    } catch (const std::exception&) {
        return fail("Invalid Content-Length: " + length);
    }
    response_.body.reserve(remaining_);
    state_ = remaining_ == 0 ? ResponseParseState::COMPLETE : ResponseParseState::BODY_LENGTH;
    return Ok(true);
}

bool HttpResponseParser::consume_body_length() {
    const std::size_t n = std::min(remaining_, buffer_.size());
    response_.body.insert(response_.body.end(), buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
    buffer_.erase(0, n);
    remaining_ -= n;
    if (remaining_ > 0) {
        return false;
    }
    state_ = ResponseParseState::COMPLETE;
    return true;
}

Result<bool> HttpResponseParser::parse_chunk_size() {
    std::string line;
    if (!take_line(line)) {
        return Ok(false);
    }
    const auto extension = line.find(';');
    if (extension != std::string::npos) {
        line.erase(extension);
    }
    line = trim(line);
    try {
        remaining_ = static_cast<std::size_t>(std::stoull(line, nullptr, 16));
    } catch (const std::exception&) {
        return fail("Invalid chunk size: " + line);
    }
    state_ = remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER : ResponseParseState::CHUNK_DATA;
    return Ok(true);
}

bool HttpResponseParser::consume_chunk_data() {
    if (remaining_ > 0) {
        const std::size_t n = std::min(remaining_, buffer_.size());
        response_.body.insert(response_.body.end(), buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
        buffer_.erase(0, n);
        remaining_ -= n;
        if (remaining_ > 0) {
            return false;
        }
    }
    // CRLF after the chunk data
    std::string line;
    if (!take_line(line)) {
        return false;
    }
    state_ = ResponseParseState::CHUNK_SIZE;
    return true;
}

bool HttpResponseParser::consume_chunk_trailer() {
    std::string line;
    while (take_line(line)) {
        if (line.empty()) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }
    }
    return false;
}

} // namespace rup::network
