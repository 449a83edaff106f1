// ─────────────────────────────────────────────────────────────────────────────
// redirguard-server - allow-list enforcing redirect endpoint
// ─────────────────────────────────────────────────────────────────────────────
// Serves GET /redirect?url=<destination>. Destinations whose hostname is on
// the allow-list are redirected to; everything else gets 400.
//
// Usage:
//   redirguard-server                                  # port 4000, demo allow-list
//   redirguard-server --allow trusted.com --allow example.com --port 8080
//   redirguard-server --config /etc/redirguard.json --log-level debug
//   redirguard-server --unsafe --port 3000             # vulnerable behaviour, for demos

#include <cxxopts.hpp>

#include "redirguard/config/server_config.hpp"
#include "redirguard/http/redirect_handler.hpp"
#include "redirguard/log/spdlog_logger.hpp"
#include "redirguard/server/redirect_server.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace redirguard;

namespace {

void print_error(const std::string& message) {
    std::cerr << "redirguard-server: " << message << "\n";
}

// Command-line values override the file (or the defaults)
bool apply_overrides(const cxxopts::ParseResult& result, ServerConfig& config) {
    if (result.count("allow")) {
        config.with_allowed_hosts(result["allow"].as<std::vector<std::string>>());
    }
    if (result.count("scheme")) {
        config.allowed_schemes = result["scheme"].as<std::vector<std::string>>();
    }
    if (result.count("unsafe")) {
        config.with_enforcement(false);
    }
    if (result.count("host-matching")) {
        auto matching = parse_host_matching(result["host-matching"].as<std::string>());
        if (!matching) {
            print_error(matching.error().message);
            return false;
        }
        config.host_matching = *matching;
    }
    if (result.count("bind")) {
        config.with_bind_address(result["bind"].as<std::string>());
    }
    if (result.count("port")) {
        config.with_port(result["port"].as<std::uint16_t>());
    }
    if (result.count("status")) {
        config.redirect_status = result["status"].as<std::uint16_t>();
    }
    if (result.count("threads")) {
        config.worker_threads = result["threads"].as<std::size_t>();
    }
    if (result.count("log-level")) {
        const auto level = parse_log_level(result["log-level"].as<std::string>());
        if (!level) {
            print_error("unknown log level '" + result["log-level"].as<std::string>() + "'");
            return false;
        }
        config.log_level = *level;
    }
    if (result.count("log-file")) {
        config.log_file = result["log-file"].as<std::string>();
    }
    return true;
}

void install_logger(const ServerConfig& config) {
    if (config.log_file.empty()) {
        set_logger(make_spdlog_console_logger(config.log_level));
    } else {
        set_logger(make_spdlog_console_file_logger(config.log_file, config.log_level));
    }
}

void log_effective_policy(const ServerConfig& config) {
    auto& logger = get_logger();
    if (config.enforce_allow_list == false) {
        logger.warn("allow-list enforcement is DISABLED: any destination will be redirected to");
        return;
    }

    std::string hosts;
    for (const auto& host : security::AllowList(config.allowed_hosts).entries()) {
        hosts += hosts.empty() ? host : ", " + host;
    }
    logger.log_fmt(LogLevel::Info, "allow-list ({} hosts): {}", config.allowed_hosts.size(), hosts);

    if (config.allowed_hosts.empty()) {
        logger.warn("allow-list is empty: every redirect will be rejected");
    }
    for (const auto& host : config.unreachable_hosts()) {
        logger.log_fmt(LogLevel::Warn,
            "allow-list entry '{}' can never match an http(s) hostname under exact matching", host);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("redirguard-server", "Open-redirect safe redirect endpoint");

    options.add_options()
        ("c,config", "JSON configuration file", cxxopts::value<std::string>())
        ("a,allow", "Allowed redirect hostname (repeatable, replaces the configured list)",
            cxxopts::value<std::vector<std::string>>())
        ("scheme", "Allowed URL scheme (repeatable; default: any)", cxxopts::value<std::vector<std::string>>())
        ("host-matching", "Hostname comparison: exact or canonical", cxxopts::value<std::string>())
        ("unsafe", "Disable allow-list enforcement (demonstrates the vulnerability)")
        ("b,bind", "Bind address", cxxopts::value<std::string>())
        ("p,port", "Listen port (0 = ephemeral)", cxxopts::value<std::uint16_t>())
        ("status", "Redirect status code (301, 302, 303, 307, 308)", cxxopts::value<std::uint16_t>())
        ("t,threads", "Worker threads", cxxopts::value<std::size_t>())
        ("l,log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << "\n";
        return 0;
    }

    ServerConfig config;
    if (result.count("config")) {
        auto loaded = ServerConfig::from_file(result["config"].as<std::string>());
        if (!loaded) {
            print_error(loaded.error().message);
            return 1;
        }
        config = std::move(*loaded);
    }

    if (apply_overrides(result, config) == false) {
        return 1;
    }

    auto valid = config.validate();
    if (!valid) {
        print_error(valid.error().message);
        return 1;
    }

    install_logger(config);
    log_effective_policy(config);

    auto handler = std::make_shared<const http::RedirectHandler>(
        security::RedirectValidator(config.to_policy()),
        http::RedirectHandlerOptions{.redirect_status = config.redirect_status});

    asio::io_context io_context(static_cast<int>(config.worker_threads));

    server::RedirectServer server(
        io_context.get_executor(),
        handler,
        server::RedirectServerOptions{
            .bind_address = config.bind_address,
            .port = config.port,
            .max_header_bytes = config.max_header_bytes,
            .read_timeout = config.read_timeout});

    auto started = server.start();
    if (!started) {
        get_logger().error(started.error().message);
        return 1;
    }

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        get_logger().log_fmt(LogLevel::Info, "received signal {}, shutting down", signal_number);
        server.stop();
        io_context.stop();
    });

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();

    for (auto& worker : workers) {
        worker.join();
    }

    set_logger(nullptr);
    return 0;
}
