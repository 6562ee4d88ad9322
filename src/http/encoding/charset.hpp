#ifndef COURIER_CHARSET_HPP
#define COURIER_CHARSET_HPP

#include <optional>
#include <string>
#include <string_view>

namespace http::encoding {
    // "text/html; charset=\"ISO-8859-1\"" -> "ISO-8859-1"
    std::optional<std::string> charset_from_content_type(std::string_view content_type);

    bool is_utf8_charset(std::string_view charset);

    // Converts `bytes` from `charset` to UTF-8. Unknown charsets and undecodable input come back
    // unchanged, i.e. are treated as UTF-8.
    std::string decode_to_utf8(std::string_view bytes, std::string_view charset);

    std::string decode_body(std::string_view bytes, std::string_view content_type);
}  // namespace http::encoding

#endif
