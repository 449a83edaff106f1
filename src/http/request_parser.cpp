#include "redirguard/http/request_parser.hpp"

#include <vector>

namespace redirguard::http {

namespace {

// RFC 9110 token characters
bool is_tchar(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    if ((u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9')) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_token(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (is_tchar(c) == false) {
            return false;
        }
    }
    return true;
}

std::string_view trim_ows(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split_lines(std::string_view head) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < head.size()) {
        std::size_t end = head.find('\n', start);
        if (end == std::string_view::npos) {
            end = head.size();
        }
        std::string_view line = head.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

HttpParseResult<void> parse_request_line(std::string_view line, HttpRequest& request) {
    const auto first_space = line.find(' ');
    const auto last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || first_space == last_space) {
        return tl::unexpected(HttpParseError{
            HttpParseError::Code::MalformedRequestLine,
            "request line must have three parts"});
    }

    const std::string_view method = line.substr(0, first_space);
    const std::string_view target = line.substr(first_space + 1, last_space - first_space - 1);
    const std::string_view version = line.substr(last_space + 1);

    if (is_token(method) == false) {
        return tl::unexpected(HttpParseError{
            HttpParseError::Code::MalformedRequestLine,
            "invalid method token"});
    }

    if (target.empty() || target.front() != '/') {
        return tl::unexpected(HttpParseError{
            HttpParseError::Code::InvalidTarget,
            "request target must be in origin-form"});
    }
    for (char c : target) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7F) {
            return tl::unexpected(HttpParseError{
                HttpParseError::Code::InvalidTarget,
                "request target contains whitespace or control characters"});
        }
    }

    if (version.size() != 8 || version.substr(0, 5) != "HTTP/") {
        return tl::unexpected(HttpParseError{
            HttpParseError::Code::MalformedRequestLine,
            "invalid HTTP version"});
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return tl::unexpected(HttpParseError{
            HttpParseError::Code::UnsupportedVersion,
            "only HTTP/1.0 and HTTP/1.1 are supported"});
    }

    request.method_name = std::string(method);
    request.method = parse_method(method);
    request.target = std::string(target);
    request.version = std::string(version);

    const auto question = target.find('?');
    if (question == std::string_view::npos) {
        request.path = std::string(target);
    } else {
        request.path = std::string(target.substr(0, question));
        request.query = std::string(target.substr(question + 1));
    }

    // Fragments are never sent by conforming clients; drop one if present
    const auto hash = request.query.find('#');
    if (hash != std::string::npos) {
        request.query.erase(hash);
    }

    return {};
}

void append_header(std::string& out, std::string_view name, std::string_view value) {
    out.append(name);
    out.append(": ");
    for (char c : value) {
        // Header values never carry line breaks onto the wire
        if (c != '\r' && c != '\n') {
            out.push_back(c);
        }
    }
    out.append("\r\n");
}

}  // namespace

HttpParseResult<HttpRequest> parse_request_head(std::string_view head) {
    const auto lines = split_lines(head);
    if (lines.empty() || lines.front().empty()) {
        return tl::unexpected(HttpParseError{
            HttpParseError::Code::MalformedRequestLine,
            "empty request"});
    }

    HttpRequest request;
    auto line_result = parse_request_line(lines.front(), request);
    if (!line_result) {
        return tl::unexpected(line_result.error());
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        if (line.empty()) {
            break;
        }
        if (line.front() == ' ' || line.front() == '\t') {
            return tl::unexpected(HttpParseError{
                HttpParseError::Code::MalformedHeader,
                "obsolete header line folding"});
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || is_token(line.substr(0, colon)) == false) {
            return tl::unexpected(HttpParseError{
                HttpParseError::Code::MalformedHeader,
                "malformed header line"});
        }

        request.headers.emplace_back(
            std::string(line.substr(0, colon)),
            std::string(trim_ows(line.substr(colon + 1))));
    }

    return request;
}

std::string serialize_response(const HttpResponse& response, bool head_only) {
    std::string out;
    out.reserve(256 + response.body.size());

    out.append("HTTP/1.1 ");
    out.append(std::to_string(response.status_code));
    out.push_back(' ');
    out.append(reason_phrase(response.status_code));
    out.append("\r\n");

    for (const auto& [name, value] : response.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Connection")) {
            continue;
        }
        append_header(out, name, value);
    }
    append_header(out, "Content-Length", std::to_string(response.body.size()));
    append_header(out, "Connection", "close");
    out.append("\r\n");

    if (head_only == false) {
        out.append(response.body);
    }
    return out;
}

}  // namespace redirguard::http
