#ifndef REDIRGUARD_CONFIG_SERVER_CONFIG_HPP
#define REDIRGUARD_CONFIG_SERVER_CONFIG_HPP

#include "redirguard/log/logger.hpp"
#include "redirguard/security/redirect_validator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace redirguard {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Configuration Errors
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    enum class Code {
        FileNotFound,   // Config path does not exist or cannot be opened
        ParseError,     // Not valid JSON
        UnknownKey,     // Key the server does not understand
        InvalidValue    // Wrong type or out of range
    };

    Code code;
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything the process needs at startup. Read once, never reloaded.

struct ServerConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Redirect Policy
    // ─────────────────────────────────────────────────────────────────────────

    // Hostnames that may be redirected to. Compared against the parser's
    // hostname, which is lowercase for http(s), so list lowercase names.
    std::vector<std::string> allowed_hosts{"trusted.com", "example.com", "ygi.li"};

    // false serves the vulnerable behaviour (any destination is followed).
    bool enforce_allow_list{true};

    security::HostMatching host_matching{security::HostMatching::Exact};

    // Empty = any scheme
    std::vector<std::string> allowed_schemes;

    // 301, 302, 303, 307 or 308
    std::uint16_t redirect_status{302};

    // ─────────────────────────────────────────────────────────────────────────
    // Listener
    // ─────────────────────────────────────────────────────────────────────────

    std::string bind_address{"0.0.0.0"};

    // 0 = pick an ephemeral port
    std::uint16_t port{4000};

    // Threads running the io_context, 1 to kMaxWorkerThreads
    static constexpr std::size_t kMaxWorkerThreads = 256;
    std::size_t worker_threads{1};

    // Largest accepted request head, request line included
    std::size_t max_header_bytes{16 * 1024};

    // Time allowed for a client to send its complete request head
    std::chrono::milliseconds read_timeout{10'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    LogLevel log_level{LogLevel::Info};

    // Empty = console only
    std::string log_file;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    ServerConfig& with_allowed_host(const std::string& host);
    ServerConfig& with_allowed_hosts(std::vector<std::string> hosts);
    ServerConfig& with_enforcement(bool enforce);
    ServerConfig& with_port(std::uint16_t value);
    ServerConfig& with_bind_address(const std::string& address);
    ServerConfig& with_read_timeout(std::chrono::milliseconds timeout);

    // Policy handed to the validator
    [[nodiscard]] security::RedirectPolicy to_policy() const;

    // Range and consistency checks; the JSON loader runs these too
    [[nodiscard]] ConfigResult<void> validate() const;

    // Allow-list entries that can never match a parsed http(s) hostname under
    // exact matching (uppercase letters, trailing dot)
    [[nodiscard]] std::vector<std::string> unreachable_hosts() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Loading
    // ─────────────────────────────────────────────────────────────────────────

    // Keys absent from the document keep their defaults
    [[nodiscard]] static ConfigResult<ServerConfig> from_json(const Json& document);

    [[nodiscard]] static ConfigResult<ServerConfig> from_file(const std::filesystem::path& path);
};

[[nodiscard]] ConfigResult<security::HostMatching> parse_host_matching(std::string_view name);

}  // namespace redirguard

#endif  // REDIRGUARD_CONFIG_SERVER_CONFIG_HPP
