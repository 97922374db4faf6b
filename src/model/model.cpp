#include "model.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <string>

#include "../utils/string_utils.hpp"

namespace relay::model {
    namespace {
        constexpr std::array<std::string_view, 9> STANDARD_METHODS = {"GET", "POST", "PUT", "DELETE", "HEAD", "PATCH", "OPTIONS", "TRACE", "CONNECT"};

        bool is_tchar(unsigned char c) {
            if (std::isalnum(c) != 0) {
                return true;
            }
            switch (c) {
                case '!':
                case '#':
                case '$':
                case '%':
                case '&':
                case '\'':
                case '*':
                case '+':
                case '-':
                case '.':
                case '^':
                case '_':
                case '`':
                case '|':
                case '~':
                    return true;
                default:
                    return false;
            }
        }

        bool is_token(std::string_view s) {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return is_tchar(static_cast<unsigned char>(c)); });
        }

        bool method_in(std::string_view method, std::initializer_list<std::string_view> set) {
            return std::any_of(set.begin(), set.end(), [method](std::string_view m) { return string_utils::ieq(method, m); });
        }
    }  // namespace

    bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
        });
    }

    const char* to_string(Priority priority) {
        switch (priority) {
            case Priority::HIGH:
                return "high";
            case Priority::LOW:
                return "low";
            case Priority::NORMAL:
                break;
        }
        return "normal";
    }

    std::optional<Priority> priority_from_string(std::string_view name) {
        if (string_utils::ieq(name, "high")) {
            return Priority::HIGH;
        }
        if (string_utils::ieq(name, "normal")) {
            return Priority::NORMAL;
        }
        if (string_utils::ieq(name, "low")) {
            return Priority::LOW;
        }
        return std::nullopt;
    }

    std::optional<std::string> Response::header(std::string_view name) const {
        auto it = headers_.find(name);
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool is_standard_method(std::string_view method) {
        return std::any_of(STANDARD_METHODS.begin(), STANDARD_METHODS.end(), [method](std::string_view m) { return string_utils::ieq(method, m); });
    }

    bool is_valid_method_token(std::string_view method) { return is_token(method); }

    std::string normalize_method(std::string_view method) {
        // Extension methods are case-sensitive and pass through untouched.
        if (is_standard_method(method)) {
            return string_utils::to_upper(std::string(method));
        }
        return std::string(method);
    }

    bool method_has_body(std::string_view method) { return method_in(method, {"POST", "PUT", "PATCH"}); }

    bool is_safe_method(std::string_view method) { return method_in(method, {"GET", "HEAD", "OPTIONS", "TRACE"}); }

    bool is_idempotent_method(std::string_view method) { return method_in(method, {"GET", "HEAD", "PUT", "DELETE", "OPTIONS", "TRACE"}); }

    std::optional<error::StructuredError> validate_url(std::string_view url) {
        if (url.empty()) {
            return error::make_error(error::ErrorCode::INVALID_REQUEST, "URL cannot be empty");
        }

        if (!string_utils::ieq_prefix(url.data(), url.size(), "http://") && !string_utils::ieq_prefix(url.data(), url.size(), "https://")) {
            return error::make_error(error::ErrorCode::INVALID_REQUEST, "URL must start with http:// or https://: " + std::string(url));
        }

        return std::nullopt;
    }

    std::optional<error::StructuredError> validate(const Request& request) {
        if (auto url_error = validate_url(request.url_)) {
            return url_error;
        }

        if (!is_valid_method_token(request.method_)) {
            return error::make_error(error::ErrorCode::INVALID_REQUEST, "Invalid HTTP method: '" + request.method_ + "'");
        }

        if (request.timeout_.count() < 0 || request.connect_timeout_.count() < 0 || request.read_timeout_.count() < 0 ||
            request.write_timeout_.count() < 0) {
            return error::make_error(error::ErrorCode::INVALID_REQUEST, "Timeouts must be non-negative");
        }

        if (request.max_redirects_ < 0) {
            return error::make_error(error::ErrorCode::INVALID_REQUEST, "max_redirects must be non-negative");
        }

        for (const auto& [name, value] : request.headers_) {
            if (!is_token(name)) {
                return error::make_error(error::ErrorCode::INVALID_REQUEST, "Invalid header name: '" + name + "'");
            }
            if (value.find_first_of("\r\n") != std::string::npos) {
                return error::make_error(error::ErrorCode::INVALID_REQUEST, "Header value for '" + name + "' contains a line break");
            }
        }

        return std::nullopt;
    }
}  // namespace relay::model
