#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace redirguard::http {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Kept in arrival order so responses serialize deterministically. Names are
// compared case-insensitively (RFC 9110).

using Header = std::pair<std::string, std::string>;
using HeaderList = std::vector<Header>;

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
               [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
}

[[nodiscard]] inline std::optional<std::string> get_header(
    const HeaderList& headers,
    std::string_view name
) {
    const auto it = std::find_if(headers.begin(), headers.end(),
        [&name](const Header& h) { return iequals(h.first, name); });
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Head,
    Post,
    Put,
    Delete,
    Patch,
    Options,
    Other
};

[[nodiscard]] HttpMethod parse_method(std::string_view token) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Query String
// ─────────────────────────────────────────────────────────────────────────────

// Decoded name/value pairs in order of appearance. A key without '=' has an
// empty value.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] QueryParams parse_query(std::string_view query);

// All values for `name`, in order
[[nodiscard]] std::vector<std::string> query_values(const QueryParams& params, std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// An inbound request head. The body is never read: GET /redirect has none.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string method_name;    // As sent, e.g. "GET"
    std::string target;         // Request-target, e.g. "/redirect?url=..."
    std::string path;           // Target up to '?'
    std::string query;          // After '?', still encoded, without the '?'
    std::string version;        // "HTTP/1.1"
    HeaderList headers;

    [[nodiscard]] QueryParams query_params() const {
        return parse_query(query);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────────────────────────────────────

struct HttpResponse {
    std::uint16_t status_code{200};
    HeaderList headers;
    std::string body;

    HttpResponse& with_header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    [[nodiscard]] std::optional<std::string> get_header(std::string_view name) const {
        return http::get_header(headers, name);
    }

    [[nodiscard]] bool is_redirect() const {
        return (status_code >= 300) && (status_code < 400);
    }

    [[nodiscard]] bool is_client_error() const {
        return (status_code >= 400) && (status_code < 500);
    }
};

[[nodiscard]] std::string_view reason_phrase(std::uint16_t status_code) noexcept;

// text/plain response with the given status and body
[[nodiscard]] HttpResponse make_text_response(std::uint16_t status_code, std::string body);

}  // namespace redirguard::http
