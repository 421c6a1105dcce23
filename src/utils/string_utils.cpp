#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool extract_header_value(const char *buffer, size_t bytes, const char *key, std::string &out_property) {
        size_t key_len = std::char_traits<char>::length(key);
        if (bytes < key_len) {
            return false;
        }
        for (size_t i = 0; i < key_len; ++i) {
            const char a = buffer[i];
            const char b = key[i];
            if ((a | constants::ASCII_LOWERCASE_BIT) != (b | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        const char *start = buffer + key_len;
        const char *end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

    std::string to_lower(std::string_view sv) {
        std::string out(sv);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim_right_slash(std::string s) {
        while (!s.empty() && s.back() == '/') {
            s.pop_back();
        }
        return s;
    }

    bool is_path_segment_safe(std::string_view sv) {
        if (sv.empty()) {
            return false;
        }

        return std::ranges::none_of(sv, [](unsigned char c) {
            return c <= constants::ASCII_SPACE || c == constants::ASCII_DELETE || constants::URL_RESERVED_SEGMENT_CHARS.find(static_cast<char>(c)) != std::string_view::npos;
        });
    }
}  // namespace string_utils
