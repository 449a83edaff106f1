#include "redirguard/config/server_config.hpp"

#include "redirguard/http/redirect_handler.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

namespace redirguard {

namespace {

ConfigError invalid_value(const std::string& key, const std::string& expected) {
    return ConfigError{ConfigError::Code::InvalidValue, "'" + key + "' must be " + expected};
}

ConfigResult<std::vector<std::string>> read_string_array(const std::string& key, const Json& node) {
    if (node.is_array() == false) {
        return tl::unexpected(invalid_value(key, "an array of strings"));
    }
    std::vector<std::string> values;
    for (const Json& item : node) {
        if (item.is_string() == false) {
            return tl::unexpected(invalid_value(key, "an array of strings"));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

ConfigResult<std::uint64_t> read_unsigned(const std::string& key, const Json& node, std::uint64_t max) {
    // Literals built in code are signed; parsed documents yield unsigned
    const bool negative = node.is_number_integer() && !node.is_number_unsigned() && node.get<std::int64_t>() < 0;
    if (node.is_number_integer() == false || negative) {
        return tl::unexpected(invalid_value(key, "a non-negative integer"));
    }
    const auto value = node.get<std::uint64_t>();
    if (value > max) {
        return tl::unexpected(invalid_value(key, "at most " + std::to_string(max)));
    }
    return value;
}

ConfigResult<bool> read_bool(const std::string& key, const Json& node) {
    if (node.is_boolean() == false) {
        return tl::unexpected(invalid_value(key, "a boolean"));
    }
    return node.get<bool>();
}

ConfigResult<std::string> read_string(const std::string& key, const Json& node) {
    if (node.is_string() == false) {
        return tl::unexpected(invalid_value(key, "a string"));
    }
    return node.get<std::string>();
}

// Applies one document key to the config
ConfigResult<void> apply_key(ServerConfig& config, const std::string& key, const Json& node) {
    if (key == "allowed_hosts") {
        auto hosts = read_string_array(key, node);
        if (!hosts) return tl::unexpected(hosts.error());
        config.allowed_hosts = std::move(*hosts);
    } else if (key == "enforce_allow_list") {
        auto value = read_bool(key, node);
        if (!value) return tl::unexpected(value.error());
        config.enforce_allow_list = *value;
    } else if (key == "host_matching") {
        auto name = read_string(key, node);
        if (!name) return tl::unexpected(name.error());
        auto matching = parse_host_matching(*name);
        if (!matching) return tl::unexpected(matching.error());
        config.host_matching = *matching;
    } else if (key == "allowed_schemes") {
        auto schemes = read_string_array(key, node);
        if (!schemes) return tl::unexpected(schemes.error());
        config.allowed_schemes = std::move(*schemes);
    } else if (key == "redirect_status") {
        auto status = read_unsigned(key, node, 999);
        if (!status) return tl::unexpected(status.error());
        config.redirect_status = static_cast<std::uint16_t>(*status);
    } else if (key == "bind_address") {
        auto address = read_string(key, node);
        if (!address) return tl::unexpected(address.error());
        config.bind_address = std::move(*address);
    } else if (key == "port") {
        auto port = read_unsigned(key, node, std::numeric_limits<std::uint16_t>::max());
        if (!port) return tl::unexpected(port.error());
        config.port = static_cast<std::uint16_t>(*port);
    } else if (key == "worker_threads") {
        auto threads = read_unsigned(key, node, ServerConfig::kMaxWorkerThreads);
        if (!threads) return tl::unexpected(threads.error());
        config.worker_threads = static_cast<std::size_t>(*threads);
    } else if (key == "max_header_bytes") {
        auto bytes = read_unsigned(key, node, 1024 * 1024);
        if (!bytes) return tl::unexpected(bytes.error());
        config.max_header_bytes = static_cast<std::size_t>(*bytes);
    } else if (key == "read_timeout_ms") {
        auto ms = read_unsigned(key, node, 3'600'000);
        if (!ms) return tl::unexpected(ms.error());
        config.read_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(*ms));
    } else if (key == "log_level") {
        auto name = read_string(key, node);
        if (!name) return tl::unexpected(name.error());
        const auto level = parse_log_level(*name);
        if (!level) {
            return tl::unexpected(invalid_value(key, "one of trace, debug, info, warn, error, off"));
        }
        config.log_level = *level;
    } else if (key == "log_file") {
        auto path = read_string(key, node);
        if (!path) return tl::unexpected(path.error());
        config.log_file = std::move(*path);
    } else {
        return tl::unexpected(ConfigError{
            ConfigError::Code::UnknownKey,
            "unknown configuration key '" + key + "'"});
    }
    return {};
}

}  // namespace

ConfigResult<security::HostMatching> parse_host_matching(std::string_view name) {
    if (name == "exact") return security::HostMatching::Exact;
    if (name == "canonical") return security::HostMatching::Canonical;
    return tl::unexpected(invalid_value("host_matching", "\"exact\" or \"canonical\""));
}

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

ServerConfig& ServerConfig::with_allowed_host(const std::string& host) {
    allowed_hosts.push_back(host);
    return *this;
}

ServerConfig& ServerConfig::with_allowed_hosts(std::vector<std::string> hosts) {
    allowed_hosts = std::move(hosts);
    return *this;
}

ServerConfig& ServerConfig::with_enforcement(bool enforce) {
    enforce_allow_list = enforce;
    return *this;
}

ServerConfig& ServerConfig::with_port(std::uint16_t value) {
    port = value;
    return *this;
}

ServerConfig& ServerConfig::with_bind_address(const std::string& address) {
    bind_address = address;
    return *this;
}

ServerConfig& ServerConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Derived Values
// ─────────────────────────────────────────────────────────────────────────────

security::RedirectPolicy ServerConfig::to_policy() const {
    security::RedirectPolicy policy;
    policy.allowed_hosts = security::AllowList(allowed_hosts);
    policy.enforce_allow_list = enforce_allow_list;
    policy.host_matching = host_matching;
    policy.allowed_schemes = allowed_schemes;
    return policy;
}

ConfigResult<void> ServerConfig::validate() const {
    for (const auto& host : allowed_hosts) {
        if (host.empty()) {
            return tl::unexpected(invalid_value("allowed_hosts", "a list of non-empty hostnames"));
        }
    }
    for (const auto& scheme : allowed_schemes) {
        const bool lowercase = std::none_of(scheme.begin(), scheme.end(),
            [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; });
        if (scheme.empty() || scheme.back() == ':' || lowercase == false) {
            return tl::unexpected(invalid_value("allowed_schemes", "lowercase scheme names without ':'"));
        }
    }
    if (http::is_redirect_status(redirect_status) == false) {
        return tl::unexpected(invalid_value("redirect_status", "one of 301, 302, 303, 307, 308"));
    }
    if (bind_address.empty()) {
        return tl::unexpected(invalid_value("bind_address", "a non-empty address"));
    }
    if (worker_threads == 0 || worker_threads > kMaxWorkerThreads) {
        return tl::unexpected(invalid_value("worker_threads",
            "between 1 and " + std::to_string(kMaxWorkerThreads)));
    }
    if (max_header_bytes < 64) {
        return tl::unexpected(invalid_value("max_header_bytes", "at least 64"));
    }
    if (read_timeout.count() <= 0) {
        return tl::unexpected(invalid_value("read_timeout_ms", "positive"));
    }
    return {};
}

std::vector<std::string> ServerConfig::unreachable_hosts() const {
    std::vector<std::string> unreachable;
    if (host_matching == security::HostMatching::Canonical) {
        return unreachable;
    }
    for (const auto& host : allowed_hosts) {
        const bool has_upper = std::any_of(host.begin(), host.end(),
            [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; });
        const bool trailing_dot = !host.empty() && host.back() == '.';
        if (has_upper || trailing_dot) {
            unreachable.push_back(host);
        }
    }
    return unreachable;
}

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<ServerConfig> ServerConfig::from_json(const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "configuration must be a JSON object"});
    }

    ServerConfig config;
    for (const auto& [key, node] : document.items()) {
        auto applied = apply_key(config, key, node);
        if (!applied) {
            return tl::unexpected(applied.error());
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

ConfigResult<ServerConfig> ServerConfig::from_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            "cannot open configuration file " + path.string()});
    }

    // No exceptions: a parse failure yields a discarded value
    Json document = Json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            "configuration file " + path.string() + " is not valid JSON"});
    }

    return from_json(document);
}

}  // namespace redirguard
