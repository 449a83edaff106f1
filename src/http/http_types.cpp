#include "redirguard/http/http_types.hpp"

#include "redirguard/security/uri_encoding.hpp"

namespace redirguard::http {

HttpMethod parse_method(std::string_view token) noexcept {
    // Methods are case-sensitive
    if (token == "GET")     return HttpMethod::Get;
    if (token == "HEAD")    return HttpMethod::Head;
    if (token == "POST")    return HttpMethod::Post;
    if (token == "PUT")     return HttpMethod::Put;
    if (token == "DELETE")  return HttpMethod::Delete;
    if (token == "PATCH")   return HttpMethod::Patch;
    if (token == "OPTIONS") return HttpMethod::Options;
    return HttpMethod::Other;
}

QueryParams parse_query(std::string_view query) {
    QueryParams params;

    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t end = query.find('&', start);
        if (end == std::string_view::npos) {
            end = query.size();
        }

        const std::string_view pair = query.substr(start, end - start);
        if (pair.empty() == false) {
            const std::size_t eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params.emplace_back(security::decode_query_component(pair), std::string{});
            } else {
                params.emplace_back(
                    security::decode_query_component(pair.substr(0, eq)),
                    security::decode_query_component(pair.substr(eq + 1)));
            }
        }

        start = end + 1;
    }

    return params;
}

std::vector<std::string> query_values(const QueryParams& params, std::string_view name) {
    std::vector<std::string> values;
    for (const auto& [key, value] : params) {
        if (key == name) {
            values.push_back(value);
        }
    }
    return values;
}

std::string_view reason_phrase(std::uint16_t status_code) noexcept {
    switch (status_code) {
        case 200: return "OK";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

HttpResponse make_text_response(std::uint16_t status_code, std::string body) {
    HttpResponse response;
    response.status_code = status_code;
    response.with_header("Content-Type", "text/plain; charset=utf-8");
    response.body = std::move(body);
    return response;
}

}  // namespace redirguard::http
