#ifndef REDIRGUARD_SECURITY_URI_ENCODING_HPP
#define REDIRGUARD_SECURITY_URI_ENCODING_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace redirguard::security {

struct UriError {
    enum class Code {
        TruncatedEscape,  // '%' with fewer than two characters after it
        InvalidHexDigit   // '%' followed by a non-hex character
    };

    Code code;
    std::size_t offset;  // Position of the offending '%'
    std::string message;
};

template <typename T>
using UriResult = tl::expected<T, UriError>;

// Percent-encode every byte except A-Z a-z 0-9 - _ . ! ~ * ' ( )
// Operates on bytes, so it accepts any input and decode_uri_component()
// always restores the original.
[[nodiscard]] std::string encode_uri_component(std::string_view input);

// Decode every %XX escape. Fails on a malformed escape.
[[nodiscard]] UriResult<std::string> decode_uri_component(std::string_view input);

// Make a URL safe to place in a Location header: encode bytes that cannot
// appear in a URL (controls, space, non-ASCII, "<>`{}) and any '%' that
// does not start a valid escape. Existing escapes and reserved characters
// are kept, so a well-formed URL passes through unchanged.
[[nodiscard]] std::string encode_location(std::string_view url);

// application/x-www-form-urlencoded component: '+' is a space, invalid
// escapes are kept literally.
[[nodiscard]] std::string decode_query_component(std::string_view input);

namespace detail {

[[nodiscard]] bool is_hex_digit(char c) noexcept;
[[nodiscard]] int hex_value(char c) noexcept;

}  // namespace detail

}  // namespace redirguard::security

#endif  // REDIRGUARD_SECURITY_URI_ENCODING_HPP
