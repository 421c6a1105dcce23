#ifndef MANDRILL_CPP_UTILS_HPP
#define MANDRILL_CPP_UTILS_HPP

#include <string>
#include <string_view>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);

    std::string to_lower(std::string_view sv);

    std::string trim_right_slash(std::string s);

    // True for a non-empty string usable verbatim as one URL path segment.
    bool is_path_segment_safe(std::string_view sv);
}  // namespace string_utils

#endif
