#ifndef HTTP_RELAY_MODEL_HPP
#define HTTP_RELAY_MODEL_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../error/relay_error.hpp"
#include "../utils/constants.hpp"

namespace relay::model {
    struct CaseInsensitiveLess {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const;
    };

    // Header names compare case-insensitively, so a name can only appear once.
    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;
    using QueryParams = std::map<std::string, std::string>;

    enum class Priority { HIGH, NORMAL, LOW };

    [[nodiscard]] const char* to_string(Priority priority);
    [[nodiscard]] std::optional<Priority> priority_from_string(std::string_view name);

    struct Request {
        std::string url_;
        std::string method_ = "GET";
        HeaderMap headers_;
        std::optional<std::string> body_;
        QueryParams query_params_;

        std::chrono::milliseconds timeout_{constants::DEFAULT_TIMEOUT_MS};
        std::chrono::milliseconds connect_timeout_{constants::DEFAULT_CONNECT_TIMEOUT_MS};
        std::chrono::milliseconds read_timeout_{constants::DEFAULT_READ_TIMEOUT_MS};
        std::chrono::milliseconds write_timeout_{constants::DEFAULT_WRITE_TIMEOUT_MS};

        bool follow_redirects_ = true;
        long max_redirects_ = constants::DEFAULT_MAX_REDIRECTS;
        bool auto_referer_ = true;
        bool decompress_ = true;
        bool http3_only_ = false;
        bool parse_response_ = false;

        std::optional<std::string> response_type_schema_;
        std::optional<std::string> cache_key_;
        Priority priority_ = Priority::NORMAL;
    };

    struct Response {
        long status_code_ = 0;
        HeaderMap headers_;
        std::string body_;
        std::string version_;
        std::string url_;
        std::uint64_t elapsed_ms_ = 0;

        std::optional<std::string> parsed_data_;
        bool cache_hit_ = false;
        std::optional<std::uint64_t> compression_saved_;

        [[nodiscard]] bool is_success() const {
            return status_code_ >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && status_code_ < constants::HTTP_SUCCESS_UPPER_BOUNDARY;
        }
        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    };

    using ExecutionResult = std::variant<Response, error::StructuredError>;

    [[nodiscard]] inline bool is_response(const ExecutionResult& result) { return std::holds_alternative<Response>(result); }
    [[nodiscard]] inline bool is_error(const ExecutionResult& result) { return std::holds_alternative<error::StructuredError>(result); }

    //
    // Methods
    //

    [[nodiscard]] bool is_standard_method(std::string_view method);
    [[nodiscard]] bool is_valid_method_token(std::string_view method);
    [[nodiscard]] std::string normalize_method(std::string_view method);
    [[nodiscard]] bool method_has_body(std::string_view method);
    [[nodiscard]] bool is_safe_method(std::string_view method);
    [[nodiscard]] bool is_idempotent_method(std::string_view method);

    //
    // Validation
    //

    [[nodiscard]] std::optional<error::StructuredError> validate_url(std::string_view url);
    [[nodiscard]] std::optional<error::StructuredError> validate(const Request& request);
}  // namespace relay::model

#endif
