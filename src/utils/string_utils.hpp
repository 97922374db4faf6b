#ifndef HTTP_RELAY_STRING_UTILS_HPP
#define HTTP_RELAY_STRING_UTILS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool ieq(std::string_view a, std::string_view b);

    std::string to_lower(std::string s);

    std::string to_upper(std::string s);

    std::string trim(std::string s);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    std::string base64_encode(std::string_view bytes);

    std::optional<std::string> base64_decode(std::string_view encoded);

    bool is_valid_utf8(std::string_view bytes);
}  // namespace relay::string_utils

#endif
