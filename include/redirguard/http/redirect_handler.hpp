#ifndef REDIRGUARD_HTTP_REDIRECT_HANDLER_HPP
#define REDIRGUARD_HTTP_REDIRECT_HANDLER_HPP

#include "redirguard/http/http_types.hpp"
#include "redirguard/security/redirect_validator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace redirguard::http {

inline constexpr std::string_view kInvalidRedirectBody = "Invalid redirect URL";

struct RedirectHandlerOptions {
    std::string route = "/redirect";
    std::string parameter = "url";
    std::uint16_t redirect_status = 302;
};

// Result of the redirect decision for one candidate
struct RedirectDecision {
    security::Classification classification;
    std::string location;  // Set only when allowed

    [[nodiscard]] bool allowed() const noexcept { return classification.allowed(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// RedirectHandler
// ─────────────────────────────────────────────────────────────────────────────
// Maps requests for the redirect route onto the validator:
//
//   url missing/empty      -> 400, validator not consulted
//   url given twice        -> 400
//   validator DENY         -> 400 "Invalid redirect URL"
//   validator ALLOW        -> redirect_status with Location
//
// All deny causes produce byte-identical responses. Immutable after
// construction; one instance serves every connection.

class RedirectHandler {
public:
    explicit RedirectHandler(
        security::RedirectValidator validator,
        RedirectHandlerOptions options = {}
    );

    [[nodiscard]] HttpResponse handle(const HttpRequest& request) const;

    // The decision procedure without the HTTP framing
    [[nodiscard]] RedirectDecision decide(std::optional<std::string_view> candidate) const;

    [[nodiscard]] const security::RedirectValidator& validator() const noexcept { return validator_; }
    [[nodiscard]] const RedirectHandlerOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] HttpResponse handle_redirect(const HttpRequest& request) const;

    security::RedirectValidator validator_;
    RedirectHandlerOptions options_;
};

[[nodiscard]] bool is_redirect_status(std::uint16_t status) noexcept;

}  // namespace redirguard::http

#endif  // REDIRGUARD_HTTP_REDIRECT_HANDLER_HPP
