#pragma once

#include "rup/core/result.hpp"
#include "rup/network/http_types.hpp"
#include "rup/upload/cancellation.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>

namespace rup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking one-shot HTTP/1.1 client built on Asio's async API
 *
 * Each send() runs its own io_context on the calling thread, polling the
 * cancellation token between slices of run_for(). A cancelled request has
 * its socket closed immediately.
 *
 * ERRORS:
 * - Cancelled: the token fired
 * - TransientTransfer: DNS, connect, I/O or parse failure, or timeout
 *
 * Any HTTP status, 4xx and 5xx included, is a successful result.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::milliseconds timeout);

    Result<HttpResponse> send(const Url& server,
                              const HttpRequest& request,
                              const upload::CancellationToken& cancel) const;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace rup::network
