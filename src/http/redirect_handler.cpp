#include "redirguard/http/redirect_handler.hpp"

#include "redirguard/log/logger.hpp"
#include "redirguard/security/uri_encoding.hpp"

#include <stdexcept>

namespace redirguard::http {

using security::Classification;
using security::DenyReason;
using security::Verdict;

bool is_redirect_status(std::uint16_t status) noexcept {
    switch (status) {
        case 301: case 302: case 303: case 307: case 308:
            return true;
        default:
            return false;
    }
}

RedirectHandler::RedirectHandler(
    security::RedirectValidator validator,
    RedirectHandlerOptions options
)
    : validator_(std::move(validator))
    , options_(std::move(options))
{
    if (is_redirect_status(options_.redirect_status) == false) {
        throw std::invalid_argument(
            "RedirectHandler: unsupported redirect status " + std::to_string(options_.redirect_status));
    }
    if (options_.route.empty() || options_.route.front() != '/') {
        throw std::invalid_argument("RedirectHandler: route must start with '/'");
    }
}

RedirectDecision RedirectHandler::decide(std::optional<std::string_view> candidate) const {
    RedirectDecision decision;

    // Missing input never reaches the parser
    if (!candidate.has_value() || candidate->empty()) {
        decision.classification.reason = DenyReason::MissingInput;
        return decision;
    }

    decision.classification = validator_.inspect(*candidate);
    if (decision.classification.allowed() == false) {
        return decision;
    }

    // Transport normalization of the original string, only after ALLOW
    const std::string encoded = security::encode_uri_component(*candidate);
    auto decoded = security::decode_uri_component(encoded);
    if (!decoded) {
        REDIRGUARD_LOG_ERROR("round-trip of allowed destination failed: {}", decoded.error().message);
        decision.classification.verdict = Verdict::Deny;
        decision.classification.reason = DenyReason::MalformedUrl;
        return decision;
    }

    decision.location = std::move(*decoded);
    return decision;
}

HttpResponse RedirectHandler::handle(const HttpRequest& request) const {
    HttpResponse response;

    if (request.path != options_.route) {
        response = make_text_response(404, "Not Found");
    } else if (request.method != HttpMethod::Get && request.method != HttpMethod::Head) {
        response = make_text_response(405, "Method Not Allowed");
        response.with_header("Allow", "GET, HEAD");
    } else {
        response = handle_redirect(request);
    }

    REDIRGUARD_LOG_INFO("{} {} -> {}", request.method_name, request.path, response.status_code);
    return response;
}

HttpResponse RedirectHandler::handle_redirect(const HttpRequest& request) const {
    const auto values = query_values(request.query_params(), options_.parameter);

    RedirectDecision decision;
    if (values.size() > 1) {
        // Several destinations: none of them can be the one that is proven safe
        decision.classification.reason = DenyReason::MalformedUrl;
    } else if (values.empty()) {
        decision = decide(std::nullopt);
    } else {
        decision = decide(values.front());
    }

    std::string location;
    if (decision.allowed()) {
        location = security::encode_location(decision.location);

        // The emitted header must resolve to the host that was authorized
        const Classification emitted = validator_.inspect(location);
        if (emitted.allowed() == false || emitted.hostname != decision.classification.hostname) {
            REDIRGUARD_LOG_WARN("encoded Location resolves to host '{}', authorized host was '{}'",
                emitted.hostname, decision.classification.hostname);
            decision.classification.verdict = Verdict::Deny;
            decision.classification.reason = DenyReason::MalformedUrl;
        }
    }

    if (decision.allowed() == false) {
        REDIRGUARD_LOG_DEBUG("redirect denied: reason={} host='{}'",
            security::to_string(decision.classification.reason),
            decision.classification.hostname);
        return make_text_response(400, std::string(kInvalidRedirectBody));
    }

    HttpResponse response = make_text_response(
        options_.redirect_status,
        std::string(reason_phrase(options_.redirect_status)) + ". Redirecting to " + location);
    response.with_header("Location", location);
    return response;
}

}  // namespace redirguard::http
