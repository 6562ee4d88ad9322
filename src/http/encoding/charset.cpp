#include "charset.hpp"

#include <iconv.h>

#include <cerrno>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

namespace http::encoding {
    namespace {
        const size_t CONVERSION_CHUNK = 4096;
        constexpr std::string_view CHARSET_KEY = "charset=";

        class IconvHandle {
           public:
            explicit IconvHandle(const std::string& from) : handle_(iconv_open("UTF-8", from.c_str())) {}

            ~IconvHandle() {
                if (valid()) {
                    iconv_close(handle_);
                }
            }
            IconvHandle(const IconvHandle&) = delete;
            IconvHandle& operator=(const IconvHandle&) = delete;
            IconvHandle(IconvHandle&&) = delete;
            IconvHandle& operator=(IconvHandle&&) = delete;

            [[nodiscard]] bool valid() const { return handle_ != reinterpret_cast<iconv_t>(-1); }  // NOLINT(performance-no-int-to-ptr)
            [[nodiscard]] iconv_t get() const { return handle_; }

           private:
            iconv_t handle_;
        };
    }  // namespace

    std::optional<std::string> charset_from_content_type(std::string_view content_type) {
        for (const std::string& part : string_utils::split(content_type, ';')) {
            const std::string_view trimmed = string_utils::trim_view(part);
            if (!string_utils::istarts_with(trimmed, CHARSET_KEY)) {
                continue;
            }

            std::string_view charset = string_utils::trim_view(trimmed.substr(CHARSET_KEY.size()));
            while (!charset.empty() && charset.front() == '"') {
                charset.remove_prefix(1);
            }
            while (!charset.empty() && charset.back() == '"') {
                charset.remove_suffix(1);
            }
            if (charset.empty()) {
                return std::nullopt;
            }
            return std::string(charset);
        }

        return std::nullopt;
    }

    bool is_utf8_charset(std::string_view charset) { return string_utils::iequals(charset, constants::DEFAULT_CHARSET) || string_utils::iequals(charset, "utf8"); }

    std::string decode_to_utf8(std::string_view bytes, std::string_view charset) {
        if (bytes.empty() || charset.empty() || is_utf8_charset(charset)) {
            return std::string(bytes);
        }

        const IconvHandle converter{std::string(charset)};
        if (!converter.valid()) {
            logging::get_logger()->debug("Unrecognized charset '{}', reading body as UTF-8", charset);
            return std::string(bytes);
        }

        std::vector<char> input(bytes.begin(), bytes.end());
        char* in_ptr = input.data();
        size_t in_left = input.size();

        std::string out;
        std::vector<char> buffer(CONVERSION_CHUNK);

        while (in_left > 0) {
            char* out_ptr = buffer.data();
            size_t out_left = buffer.size();

            const size_t rc = iconv(converter.get(), &in_ptr, &in_left, &out_ptr, &out_left);
            out.append(buffer.data(), buffer.size() - out_left);

            if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
                logging::get_logger()->warn("Body is not valid {}, reading it as UTF-8", charset);
                return std::string(bytes);
            }
        }

        return out;
    }

    std::string decode_body(std::string_view bytes, std::string_view content_type) {
        const std::optional<std::string> charset = charset_from_content_type(content_type);
        if (!charset) {
            return std::string(bytes);
        }
        return decode_to_utf8(bytes, *charset);
    }
}  // namespace http::encoding
