#include "redirguard/server/redirect_server.hpp"

#include "redirguard/http/request_parser.hpp"
#include "redirguard/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <exception>
#include <stdexcept>
#include <variant>

namespace redirguard::server {

namespace detail {

void log_coroutine_failure(std::string_view what, std::exception_ptr error) {
    if (!error) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        REDIRGUARD_LOG_ERROR("{} failed: {}", what, e.what());
    } catch (...) {
        REDIRGUARD_LOG_ERROR("{} failed: unknown exception", what);
    }
}

}  // namespace detail

namespace {

constexpr auto use_nothrow_awaitable = asio::as_tuple(asio::use_awaitable);

asio::awaitable<void> write_and_close(
    asio::ip::tcp::socket& socket,
    const http::HttpResponse& response,
    bool head_only
) {
    const std::string wire = http::serialize_response(response, head_only);
    auto [write_ec, written] = co_await asio::async_write(socket, asio::buffer(wire), use_nothrow_awaitable);
    if (write_ec) {
        REDIRGUARD_LOG_DEBUG("write failed after {} bytes: {}", written, write_ec.message());
    }

    asio::error_code ignored;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> serve_connection(
    asio::ip::tcp::socket socket,
    std::shared_ptr<const http::RedirectHandler> handler,
    RedirectServerOptions options
) {
    using namespace asio::experimental::awaitable_operators;

    std::string buffer;
    asio::steady_timer deadline(socket.get_executor());
    deadline.expires_after(options.read_timeout);

    auto outcome = co_await (
        asio::async_read_until(
            socket,
            asio::dynamic_buffer(buffer, options.max_header_bytes),
            http::kHeadTerminator,
            use_nothrow_awaitable)
        || deadline.async_wait(use_nothrow_awaitable)
    );

    if (outcome.index() == 1) {
        REDIRGUARD_LOG_DEBUG("closing connection: no complete request within {} ms",
            options.read_timeout.count());
        asio::error_code ignored;
        socket.close(ignored);
        co_return;
    }

    auto [read_ec, head_size] = std::get<0>(outcome);
    if (read_ec == asio::error::not_found) {
        // dynamic_buffer reached max_header_bytes without a terminator
        co_await write_and_close(socket, http::make_text_response(431, "Request Header Fields Too Large"), false);
        co_return;
    }
    if (read_ec) {
        if (read_ec != asio::error::eof) {
            REDIRGUARD_LOG_DEBUG("read failed: {}", read_ec.message());
        }
        asio::error_code ignored;
        socket.close(ignored);
        co_return;
    }

    auto request = http::parse_request_head(std::string_view(buffer).substr(0, head_size));
    if (!request) {
        REDIRGUARD_LOG_INFO("rejecting malformed request: {}", request.error().message);
        co_await write_and_close(
            socket,
            http::make_text_response(request.error().status_code(),
                std::string(http::reason_phrase(request.error().status_code()))),
            false);
        co_return;
    }

    const http::HttpResponse response = handler->handle(*request);
    co_await write_and_close(socket, response, request->method == http::HttpMethod::Head);
}

// ═══════════════════════════════════════════════════════════════════════════
// RedirectServer
// ═══════════════════════════════════════════════════════════════════════════

RedirectServer::RedirectServer(
    asio::any_io_executor executor,
    std::shared_ptr<const http::RedirectHandler> handler,
    RedirectServerOptions options
)
    : executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
    , acceptor_(strand_)
    , handler_(std::move(handler))
    , options_(std::move(options))
{
    if (!handler_) {
        throw std::invalid_argument("RedirectServer: handler cannot be null");
    }
}

RedirectServer::~RedirectServer() {
    asio::error_code ignored;
    acceptor_.close(ignored);
}

ServerResult<void> RedirectServer::start() {
    if (running_.load()) {
        return tl::unexpected(ServerError{ServerError::Code::AlreadyRunning, "server is already running"});
    }

    asio::error_code ec;
    const auto address = asio::ip::make_address(options_.bind_address, ec);
    if (ec) {
        return tl::unexpected(ServerError{
            ServerError::Code::InvalidAddress,
            "invalid bind address '" + options_.bind_address + "': " + ec.message()});
    }

    const asio::ip::tcp::endpoint endpoint(address, options_.port);

    const auto fail = [&](const char* step) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        return tl::unexpected(ServerError{
            ServerError::Code::BindFailed,
            std::string(step) + " " + options_.bind_address + ":" + std::to_string(options_.port) +
                " failed: " + ec.message()});
    };

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return fail("open");

    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) return fail("setsockopt");

    acceptor_.bind(endpoint, ec);
    if (ec) return fail("bind");

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) return fail("listen");

    local_port_.store(acceptor_.local_endpoint(ec).port());
    running_.store(true);

    asio::co_spawn(strand_, accept_loop(),
        [](std::exception_ptr error) { detail::log_coroutine_failure("accept loop", error); });

    REDIRGUARD_LOG_INFO("listening on {}:{}", options_.bind_address, local_port_.load());
    return {};
}

void RedirectServer::stop() {
    if (running_.exchange(false) == false) {
        return;
    }
    asio::post(strand_, [this]() {
        asio::error_code ignored;
        acceptor_.close(ignored);
    });
}

asio::awaitable<void> RedirectServer::accept_loop() {
    while (acceptor_.is_open()) {
        auto [ec, socket] = co_await acceptor_.async_accept(
            asio::any_io_executor(asio::make_strand(executor_)), use_nothrow_awaitable);
        if (ec == asio::error::operation_aborted) {
            break;
        }
        if (ec) {
            REDIRGUARD_LOG_WARN("accept failed: {}", ec.message());
            continue;
        }

        auto session_executor = socket.get_executor();
        asio::co_spawn(session_executor,
            serve_connection(std::move(socket), handler_, options_),
            [](std::exception_ptr error) { detail::log_coroutine_failure("connection", error); });
    }
    REDIRGUARD_LOG_INFO("stopped accepting connections");
}

}  // namespace redirguard::server
