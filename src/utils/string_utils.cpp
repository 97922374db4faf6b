#include "string_utils.hpp"

#include <simdjson.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace relay::string_utils {
    namespace {
        constexpr const char* BASE64_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr std::uint32_t SEXTET_MASK = 0x3F;
        constexpr std::uint32_t OCTET_MASK = 0xFF;

        std::array<int, 256> make_decode_table() {
            std::array<int, 256> table{};
            table.fill(-1);
            for (int i = 0; i < 64; ++i) {
                table[static_cast<unsigned char>(BASE64_CHARS[i])] = i;
            }
            return table;
        }
    }  // namespace

    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool ieq(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string base64_encode(std::string_view bytes) {
        std::string result;
        result.reserve((bytes.size() + 2) / 3 * 4);

        size_t i = 0;
        while (i < bytes.size()) {
            const size_t chunk = std::min<size_t>(3, bytes.size() - i);
            std::uint32_t triple = 0;
            for (size_t k = 0; k < 3; ++k) {
                triple <<= 8;
                if (k < chunk) {
                    triple |= static_cast<unsigned char>(bytes[i + k]);
                }
            }
            i += chunk;

            result += BASE64_CHARS[(triple >> 18) & SEXTET_MASK];
            result += BASE64_CHARS[(triple >> 12) & SEXTET_MASK];
            result += chunk > 1 ? BASE64_CHARS[(triple >> 6) & SEXTET_MASK] : '=';
            result += chunk > 2 ? BASE64_CHARS[triple & SEXTET_MASK] : '=';
        }

        return result;
    }

    std::optional<std::string> base64_decode(std::string_view encoded) {
        static const std::array<int, 256> decode_table = make_decode_table();

        std::string result;
        result.reserve(encoded.size() * 3 / 4);

        std::uint32_t val = 0;
        int bits = 0;
        bool padding = false;

        for (char c : encoded) {
            if (c == '=') {
                padding = true;
                continue;
            }
            if (c == '\n' || c == '\r') {
                continue;
            }
            const int d = decode_table[static_cast<unsigned char>(c)];
            if (d < 0 || padding) {
                return std::nullopt;
            }
            val = (val << 6) | static_cast<std::uint32_t>(d);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                result += static_cast<char>((val >> bits) & OCTET_MASK);
            }
        }

        return result;
    }

    bool is_valid_utf8(std::string_view bytes) { return simdjson::validate_utf8(bytes.data(), bytes.size()); }
}  // namespace relay::string_utils
