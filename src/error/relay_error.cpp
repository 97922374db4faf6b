#include "relay_error.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace relay::error {
    namespace {
        struct CodeName {
            ErrorCode code_;
            const char *name_;
        };

        constexpr std::array<CodeName, 9> CODE_NAMES = {{
            {ErrorCode::NETWORK_ERROR, "network_error"},
            {ErrorCode::TIMEOUT_ERROR, "timeout_error"},
            {ErrorCode::TOO_MANY_REDIRECTS, "too_many_redirects"},
            {ErrorCode::PROTOCOL_ERROR, "protocol_error"},
            {ErrorCode::ENGINE_NOT_INITIALIZED, "engine_not_initialized"},
            {ErrorCode::ENGINE_SHUTDOWN, "engine_shutdown"},
            {ErrorCode::TRANSPORT_DECODE_ERROR, "transport_decode_error"},
            {ErrorCode::INVALID_REQUEST, "invalid_request"},
            {ErrorCode::UNKNOWN_ERROR, "unknown_error"},
        }};
    }  // namespace

    const char *to_string(ErrorCode code) {
        for (const auto &entry : CODE_NAMES) {
            if (entry.code_ == code) {
                return entry.name_;
            }
        }
        return "unknown_error";
    }

    ErrorCode error_code_from_string(std::string_view code) {
        for (const auto &entry : CODE_NAMES) {
            if (code == entry.name_) {
                return entry.code_;
            }
        }
        return ErrorCode::UNKNOWN_ERROR;
    }

    StructuredError make_error(ErrorCode code, std::string message, std::optional<std::string> details) {
        return StructuredError{.code_ = code, .message_ = std::move(message), .details_ = std::move(details)};
    }

    RelayError::RelayError(ErrorCode code, const std::string &message, std::optional<std::string> details)
        : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code), details_(std::move(details)) {}

    RelayError::RelayError(const StructuredError &error) : RelayError(error.code_, error.message_, error.details_) {}

    StructuredError RelayError::to_structured() const {
        std::string message = what();
        const std::string prefix = std::string(to_string(code_)) + ": ";
        if (message.rfind(prefix, 0) == 0) {
            message.erase(0, prefix.size());
        }
        return StructuredError{.code_ = code_, .message_ = std::move(message), .details_ = details_};
    }

    HttpStatusError::HttpStatusError(long s, std::string u,
                                     std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                                     const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}
}  // namespace relay::error
