#ifndef REDIRGUARD_HTTP_REQUEST_PARSER_HPP
#define REDIRGUARD_HTTP_REQUEST_PARSER_HPP

#include "redirguard/http/http_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace redirguard::http {

// ─────────────────────────────────────────────────────────────────────────────
// Parse Errors
// ─────────────────────────────────────────────────────────────────────────────

struct HttpParseError {
    enum class Code {
        MalformedRequestLine,  // Not "METHOD SP target SP version"
        InvalidTarget,         // Target not in origin-form
        UnsupportedVersion,    // Not HTTP/1.0 or HTTP/1.1
        MalformedHeader,       // Header line without ':' or with bad name
        HeadersTooLarge        // Head exceeds the configured limit
    };

    Code code;
    std::string message;

    // Status code the server answers with
    [[nodiscard]] std::uint16_t status_code() const noexcept {
        switch (code) {
            case Code::UnsupportedVersion: return 505;
            case Code::HeadersTooLarge:    return 431;
            default:                       return 400;
        }
    }
};

template <typename T>
using HttpParseResult = tl::expected<T, HttpParseError>;

inline constexpr std::string_view kHeadTerminator = "\r\n\r\n";

// Parse a request head: everything up to, but not including, the blank line.
// Bare LF line endings are accepted.
[[nodiscard]] HttpParseResult<HttpRequest> parse_request_head(std::string_view head);

// Status line, headers (plus Content-Length and Connection: close) and body.
// HEAD responses keep Content-Length but omit the body.
[[nodiscard]] std::string serialize_response(const HttpResponse& response, bool head_only = false);

}  // namespace redirguard::http

#endif  // REDIRGUARD_HTTP_REQUEST_PARSER_HPP
