#include "rup/network/http_client.hpp"

#include "rup/network/http_parser.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <optional>

namespace rup::network {
namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

/**
 * @brief State of one request/response exchange
 *
 * Reading starts as soon as the connection is up, so a server that
 * answers before consuming the whole body (404 on an unsupported
 * endpoint) is still heard even if the write then fails.
 */
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    explicit Exchange(asio::io_context& io)
        : resolver_(io), socket_(io) {}

    void start(const Url& server, std::vector<std::uint8_t> payload) {
        payload_ = std::move(payload);
        auto self = shared_from_this();
        resolver_.async_resolve(server.host, std::to_string(server.port),
            [this, self](boost::system::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    fail("resolve failed: " + ec.message());
                    return;
                }
                asio::async_connect(socket_, results,
                    [this, self](boost::system::error_code ec, const tcp::endpoint&) {
                        if (ec) {
                            fail("connect failed: " + ec.message());
                            return;
                        }
                        do_write();
                        do_read();
                    });
            });
    }

    void abort() {
        resolver_.cancel();
        close();
    }

    bool done() const { return done_; }
    const std::optional<Error>& error() const { return error_; }
    HttpResponse take_response() { return parser_.take_response(); }

private:
    void do_write() {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(payload_),
            [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
                if (ec) {
                    // Wait for the reader: the server may already have answered
                    write_error_ = "write failed: " + ec.message();
                    return;
                }
                spdlog::trace("Sent {} bytes", bytes_transferred);
            });
    }

    void do_read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(buffer_),
            [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
                if (done_) {
                    return;
                }
                if (ec == asio::error::eof) {
                    auto closed = parser_.finish_on_close();
                    if (closed.is_error()) {
                        fail(write_error_.empty() ? closed.error().message : write_error_);
                    } else {
                        complete();
                    }
                    return;
                }
                if (ec) {
                    fail(write_error_.empty() ? "read failed: " + ec.message() : write_error_);
                    return;
                }

                auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
                if (parsed.is_error()) {
                    fail("invalid response: " + parsed.error().message);
                    return;
                }
                if (parsed.value()) {
                    complete();
                    return;
                }
                do_read();
            });
    }

    void fail(const std::string& message) {
        if (done_) {
            return;
        }
        done_ = true;
        error_ = Error(ErrorKind::TransientTransfer, message);
        close();
    }

    void complete() {
        done_ = true;
        close();
    }

    void close() {
        boost::system::error_code shutdown_ec;
        socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        boost::system::error_code close_ec;
        socket_.close(close_ec);
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    std::vector<std::uint8_t> payload_;
    std::array<char, 16 * 1024> buffer_{};
    HttpResponseParser parser_;
    std::string write_error_;
    bool done_ = false;
    std::optional<Error> error_;
};

} // namespace

HttpClient::HttpClient(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

Result<HttpResponse> HttpClient::send(const Url& server,
                                      const HttpRequest& request,
                                      const upload::CancellationToken& cancel) const {
    if (cancel.is_cancelled()) {
        return Err<HttpResponse>(ErrorKind::Cancelled, "request cancelled");
    }

    asio::io_context io;
    auto exchange = std::make_shared<Exchange>(io);
    exchange->start(server, request.serialize(server.authority()));

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::optional<Error> interrupted;

    while (!exchange->done()) {
        if (cancel.is_cancelled()) {
            interrupted = Error(ErrorKind::Cancelled, "request cancelled");
        } else if (std::chrono::steady_clock::now() >= deadline) {
            interrupted = Error(ErrorKind::TransientTransfer,
                                "request timed out after " + std::to_string(timeout_.count()) + "ms");
        }
        if (interrupted) {
            exchange->abort();
            // Let the aborted handlers run so the exchange is released
            io.restart();
            io.run();
            return Err<HttpResponse>(*interrupted);
        }

        io.run_for(kPollInterval);
        if (io.stopped() && !exchange->done()) {
            return Err<HttpResponse>(ErrorKind::TransientTransfer, "connection ended without a response");
        }
    }

    if (exchange->error()) {
        return Err<HttpResponse>(*exchange->error());
    }

    auto response = exchange->take_response();
    spdlog::debug("{} {} -> {}", HttpMethodUtils::to_string(request.method), request.target, response.status_code);
    return Ok(std::move(response));
}

} // namespace rup::network
