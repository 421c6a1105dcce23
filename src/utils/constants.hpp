
#ifndef MANDRILL_CPP_CONSTANTS_HPP
#define MANDRILL_CPP_CONSTANTS_HPP

#include <string_view>

namespace constants {
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr unsigned char ASCII_SPACE = 0x20;
    inline constexpr unsigned char ASCII_DELETE = 0x7F;
    inline constexpr std::string_view URL_RESERVED_SEGMENT_CHARS = "/?#%\\";
    inline constexpr const char* DEFAULT_BASE_URL = "https://mandrillapp.com/api/1.0/";
    inline constexpr const char* API_KEY_FIELD = "key";
    inline constexpr const char* ENDPOINT_SUFFIX = ".json";
    inline constexpr const char* API_KEY_ENV = "MANDRILL_API_KEY";
    inline constexpr const char* BASE_URL_ENV = "MANDRILL_BASE_URL";

}  // namespace constants

#endif
