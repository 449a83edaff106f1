#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Redirect Server
// ═══════════════════════════════════════════════════════════════════════════
// HTTP/1.1 listener built on ASIO and C++20 coroutines.
//
// - One coroutine per connection, one request per connection
// - Request head bounded by size and by a read deadline
// - The handler is shared read-only by every session

#include "redirguard/http/redirect_handler.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace redirguard::server {

struct ServerError {
    enum class Code {
        InvalidAddress,   // bind_address is not an IP literal
        BindFailed,       // open/bind/listen failed (port in use, permissions)
        AlreadyRunning
    };

    Code code;
    std::string message;
};

template <typename T>
using ServerResult = tl::expected<T, ServerError>;

struct RedirectServerOptions {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{0};
    std::size_t max_header_bytes{16 * 1024};
    std::chrono::milliseconds read_timeout{10'000};
};

// Lifetime: the accept loop and stop() run on the executor and refer to the
// server. Destroy it only once the executor's io_context has stopped running
// (after stop(), run() returns when the accept loop and the open sessions
// have finished, or after io_context::stop() and joining its threads).
class RedirectServer {
public:
    RedirectServer(
        asio::any_io_executor executor,
        std::shared_ptr<const http::RedirectHandler> handler,
        RedirectServerOptions options = {}
    );

    ~RedirectServer();

    RedirectServer(const RedirectServer&) = delete;
    RedirectServer& operator=(const RedirectServer&) = delete;

    /// Bind, listen and start accepting on the executor.
    [[nodiscard]] ServerResult<void> start();

    /// Stop accepting. Sessions already running finish on their own.
    /// The close is posted to the acceptor's strand.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Bound port (useful when options.port was 0)
    [[nodiscard]] std::uint16_t local_port() const noexcept { return local_port_.load(); }

private:
    asio::awaitable<void> accept_loop();

    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;
    asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<const http::RedirectHandler> handler_;
    RedirectServerOptions options_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> local_port_{0};
};

namespace detail {

// Completion handler for detached coroutines: logs the failure and never
// rethrows into io_context::run().
void log_coroutine_failure(std::string_view what, std::exception_ptr error);

}  // namespace detail

// Serves exactly one request on `socket`, then closes it.
asio::awaitable<void> serve_connection(
    asio::ip::tcp::socket socket,
    std::shared_ptr<const http::RedirectHandler> handler,
    RedirectServerOptions options
);

}  // namespace redirguard::server
