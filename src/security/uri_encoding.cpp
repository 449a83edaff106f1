#include "redirguard/security/uri_encoding.hpp"

#include <array>

namespace redirguard::security {

namespace detail {

bool is_hex_digit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace detail

namespace {

constexpr std::array<char, 16> kHex = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'
};

void append_escape(std::string& out, unsigned char byte) {
    out.push_back('%');
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0F]);
}

bool is_alnum(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_component_safe(unsigned char c) noexcept {
    if (is_alnum(c)) return true;
    switch (c) {
        case '-': case '_': case '.': case '!':
        case '~': case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

// Printable ASCII allowed verbatim in a Location value. '\\' stays literal:
// special-scheme parsers read it as '/', and %5C would turn the host into
// userinfo.
bool is_location_safe(unsigned char c) noexcept {
    if (c <= 0x20 || c >= 0x7F) return false;
    switch (c) {
        case '"': case '<': case '>':
        case '`': case '{': case '}':
            return false;
        default:
            return true;
    }
}

bool escape_at(std::string_view input, std::size_t pos) noexcept {
    return pos + 2 < input.size() &&
           detail::is_hex_digit(input[pos + 1]) &&
           detail::is_hex_digit(input[pos + 2]);
}

}  // namespace

std::string encode_uri_component(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_component_safe(c)) {
            out.push_back(ch);
        } else {
            append_escape(out, c);
        }
    }
    return out;
}

UriResult<std::string> decode_uri_component(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            out.push_back(input[i]);
            continue;
        }
        if (i + 2 >= input.size()) {
            return tl::unexpected(UriError{
                UriError::Code::TruncatedEscape, i,
                "incomplete percent escape at offset " + std::to_string(i)});
        }
        const int high = detail::hex_value(input[i + 1]);
        const int low = detail::hex_value(input[i + 2]);
        if (high < 0 || low < 0) {
            return tl::unexpected(UriError{
                UriError::Code::InvalidHexDigit, i,
                "invalid percent escape at offset " + std::to_string(i)});
        }
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return out;
}

std::string encode_location(std::string_view url) {
    std::string out;
    out.reserve(url.size());

    for (std::size_t i = 0; i < url.size(); ++i) {
        const auto c = static_cast<unsigned char>(url[i]);
        if (c == '%') {
            if (escape_at(url, i)) {
                out.append(url.substr(i, 3));
                i += 2;
            } else {
                out.append("%25");
            }
            continue;
        }
        if (is_location_safe(c)) {
            out.push_back(url[i]);
        } else {
            append_escape(out, c);
        }
    }
    return out;
}

std::string decode_query_component(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && escape_at(input, i)) {
            out.push_back(static_cast<char>(
                (detail::hex_value(input[i + 1]) << 4) | detail::hex_value(input[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace redirguard::security
