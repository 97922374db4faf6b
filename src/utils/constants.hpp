#ifndef HTTP_RELAY_CONSTANTS_HPP
#define HTTP_RELAY_CONSTANTS_HPP

#include <cstddef>

namespace relay::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr long DEFAULT_TIMEOUT_MS = 30'000;
    inline constexpr long DEFAULT_CONNECT_TIMEOUT_MS = 10'000;
    inline constexpr long DEFAULT_READ_TIMEOUT_MS = 30'000;
    inline constexpr long DEFAULT_WRITE_TIMEOUT_MS = 30'000;
    inline constexpr long DEFAULT_MAX_REDIRECTS = 5;
    inline constexpr std::size_t DEFAULT_POOL_SIZE = 4;
    inline constexpr std::size_t DEFAULT_BATCH_CONCURRENCY = 8;
    inline constexpr std::size_t MAX_POOL_SIZE = 256;
    inline constexpr std::size_t BODY_PREVIEW_LENGTH = 512;
    inline constexpr const char* HEADER_VALUE_SEPARATOR = ", ";
    inline constexpr const char* DEFAULT_USER_AGENT = "http-relay/1.0";
}  // namespace relay::constants

#endif
