#pragma once

#include "rup/core/result.hpp"
#include "rup/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace rup::network {

/**
 * @brief Where the response parser is in the message
 *
 * HTTP Response Format:
 * VERSION SP CODE SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                            <- Empty line
 * [Body]                          <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    STATUS_LINE,
    HEADERS,
    BODY_LENGTH,      // Content-Length known
    CHUNK_SIZE,       // Transfer-Encoding: chunked, reading "<hex>\r\n"
    CHUNK_DATA,
    CHUNK_TRAILER,    // After the last (zero) chunk
    BODY_UNTIL_CLOSE, // Neither header given; body ends with the connection
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Feed bytes as they arrive from the socket. parse() returns true once a
 * full response is available; for close-delimited bodies call
 * finish_on_close() when the peer closes the connection.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * auto done = parser.parse(buffer.data(), n);
 * if (done.is_ok() && done.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    Result<bool> parse(const char* data, std::size_t len);

    /**
     * @brief Peer closed the connection
     *
     * @return true if that completes the response (close-delimited body)
     */
    Result<bool> finish_on_close();

    const HttpResponse& get_response() const { return response_; }
    HttpResponse take_response() { return std::move(response_); }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    void reset();

private:
    Result<bool> fail(const std::string& message);

    // Each consumes from buffer_ and returns false when more input is needed
    Result<bool> parse_status_line();
    Result<bool> parse_headers();
    bool consume_body_length();
    Result<bool> parse_chunk_size();
    bool consume_chunk_data();
    bool consume_chunk_trailer();

    bool take_line(std::string& line);
    Result<bool> begin_body();

    ResponseParseState state_ = ResponseParseState::STATUS_LINE;
    HttpResponse response_;
    std::string buffer_;            // Bytes received but not yet consumed
    std::size_t remaining_ = 0;     // Body or chunk bytes still expected
};

} // namespace rup::network
