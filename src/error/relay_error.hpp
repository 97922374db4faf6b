#ifndef HTTP_RELAY_RELAY_ERROR_HPP
#define HTTP_RELAY_RELAY_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace relay::error {
    enum class ErrorCode {
        NETWORK_ERROR,
        TIMEOUT_ERROR,
        TOO_MANY_REDIRECTS,
        PROTOCOL_ERROR,
        ENGINE_NOT_INITIALIZED,
        ENGINE_SHUTDOWN,
        TRANSPORT_DECODE_ERROR,
        INVALID_REQUEST,
        UNKNOWN_ERROR,
    };

    // Stable wire identifier, e.g. "timeout_error".
    [[nodiscard]] const char* to_string(ErrorCode code);

    // Unknown identifiers map to UNKNOWN_ERROR.
    [[nodiscard]] ErrorCode error_code_from_string(std::string_view code);

    struct StructuredError {
        ErrorCode code_ = ErrorCode::UNKNOWN_ERROR;
        std::string message_;
        std::optional<std::string> details_;  // opaque JSON text
    };

    [[nodiscard]] StructuredError make_error(ErrorCode code, std::string message, std::optional<std::string> details = std::nullopt);

    struct RelayError : public std::runtime_error {
        ErrorCode code_;
        std::optional<std::string> details_;

        explicit RelayError(ErrorCode code, const std::string &message, std::optional<std::string> details = std::nullopt);
        explicit RelayError(const StructuredError &error);

        [[nodiscard]] StructuredError to_structured() const;
    };

    struct HttpStatusError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpStatusError(long s, std::string u, std::string preview, const std::string &msg);
    };
}  // namespace relay::error

#endif
