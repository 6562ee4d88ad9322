#ifndef COURIER_STATUS_CODES_HPP
#define COURIER_STATUS_CODES_HPP

#include <string_view>

namespace http::model {
    // Standard phrase for `code`, empty when unknown. Used when the wire carries none (HTTP/2).
    std::string_view standard_reason_phrase(long code);
}  // namespace http::model

#endif
