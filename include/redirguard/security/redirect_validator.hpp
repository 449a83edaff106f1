#ifndef REDIRGUARD_SECURITY_REDIRECT_VALIDATOR_HPP
#define REDIRGUARD_SECURITY_REDIRECT_VALIDATOR_HPP

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace redirguard::security {

// ═══════════════════════════════════════════════════════════════════════════
// Verdict
// ═══════════════════════════════════════════════════════════════════════════

enum class Verdict : std::uint8_t {
    Deny,
    Allow
};

[[nodiscard]] constexpr std::string_view to_string(Verdict verdict) noexcept {
    return verdict == Verdict::Allow ? "ALLOW" : "DENY";
}

// Why a candidate was denied. Never sent to clients: every reason maps to
// the same 400 response so the allow-list cannot be probed.
enum class DenyReason : std::uint8_t {
    None,              // Allowed
    MissingInput,      // Absent or empty candidate
    MalformedUrl,      // Not an absolute URL (or ambiguous input)
    UnauthorizedHost,  // Parsed, hostname not on the allow-list
    DisallowedScheme   // Parsed, scheme excluded by policy
};

[[nodiscard]] constexpr std::string_view to_string(DenyReason reason) noexcept {
    switch (reason) {
        case DenyReason::None:             return "none";
        case DenyReason::MissingInput:     return "missing_input";
        case DenyReason::MalformedUrl:     return "malformed_url";
        case DenyReason::UnauthorizedHost: return "unauthorized_host";
        case DenyReason::DisallowedScheme: return "disallowed_scheme";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Allow-List
// ═══════════════════════════════════════════════════════════════════════════
// Immutable set of hostnames. Built once at startup and shared read-only by
// every request thread.

class AllowList {
public:
    AllowList() = default;
    explicit AllowList(const std::vector<std::string>& hosts);
    AllowList(std::initializer_list<std::string_view> hosts);

    [[nodiscard]] bool contains(std::string_view host) const;

    [[nodiscard]] bool empty() const noexcept { return hosts_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return hosts_.size(); }

    /// Sorted copy of the entries (for logging the effective configuration)
    [[nodiscard]] std::vector<std::string> entries() const;

private:
    std::set<std::string, std::less<>> hosts_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Policy
// ═══════════════════════════════════════════════════════════════════════════

enum class HostMatching : std::uint8_t {
    // Compare the hostname exactly as the URL parser returns it.
    Exact,
    // Additionally lowercase ASCII and drop one trailing dot. Only matters for
    // non-special schemes (the parser already lowercases http/https hosts) and
    // for "trusted.com." style hosts.
    Canonical
};

struct RedirectPolicy {
    AllowList allowed_hosts;

    // false reproduces the vulnerable behaviour: every non-empty candidate is
    // allowed. Exists so both behaviours run against the same harness.
    bool enforce_allow_list = true;

    HostMatching host_matching = HostMatching::Exact;

    // Schemes without the trailing colon, e.g. {"http", "https"}.
    // Empty = any scheme whose hostname is allowed.
    std::vector<std::string> allowed_schemes;
};

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

struct Classification {
    Verdict verdict{Verdict::Deny};
    DenyReason reason{DenyReason::MissingInput};
    std::string hostname;  // As extracted by the parser; empty if parsing failed

    [[nodiscard]] bool allowed() const noexcept { return verdict == Verdict::Allow; }
};

// ═══════════════════════════════════════════════════════════════════════════
// RedirectValidator
// ═══════════════════════════════════════════════════════════════════════════
// Decides whether a caller-supplied destination may be redirected to.
//
// Procedure:
//   1. Empty candidate                          -> DENY (missing_input)
//   2. Parse as absolute URL (WHATWG, ada)      -> DENY on failure (malformed_url)
//   3. Scheme not in allowed_schemes (if set)   -> DENY (disallowed_scheme)
//   4. Hostname exact member of allowed_hosts   -> ALLOW, else DENY (unauthorized_host)
//
// No I/O, no logging, no mutable state: safe to call concurrently from any
// number of threads. Malformed input never throws.
//
// ═══════════════════════════════════════════════════════════════════════════
// LIMITATIONS
// ═══════════════════════════════════════════════════════════════════════════
//
// Hostname comparison uses the parser's output. For special schemes the
// WHATWG parser lowercases and IDNA-encodes the host, so HTTP://TRUSTED.COM
// matches "trusted.com" and a unicode host matches only its punycode form.
// A trailing dot, ports and userinfo are not stripped under Exact matching:
// "trusted.com." is denied unless listed.

class RedirectValidator {
public:
    explicit RedirectValidator(RedirectPolicy policy);

    [[nodiscard]] Verdict classify(std::string_view candidate) const;

    /// Same decision as classify() plus the internal reason and hostname.
    [[nodiscard]] Classification inspect(std::string_view candidate) const;

    [[nodiscard]] const RedirectPolicy& policy() const noexcept { return policy_; }

private:
    [[nodiscard]] bool host_allowed(std::string_view hostname) const;
    [[nodiscard]] bool scheme_allowed(std::string_view scheme) const;

    RedirectPolicy policy_;
};

namespace detail {

// ASCII lowercase plus one trailing dot removed
[[nodiscard]] std::string canonical_host(std::string_view host);

}  // namespace detail

}  // namespace redirguard::security

#endif  // REDIRGUARD_SECURITY_REDIRECT_VALIDATOR_HPP
