#ifndef HTTP_RELAY_CODEC_HPP
#define HTTP_RELAY_CODEC_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "../engine/engine_options.hpp"
#include "../error/relay_error.hpp"
#include "../model/model.hpp"

// JSON wire shapes shared by both sides of the native boundary. Decoding
// ignores unknown fields, applies defaults for missing ones and raises
// TRANSPORT_DECODE_ERROR for wrong types.
namespace relay::transport::codec {
    using json = nlohmann::json;

    struct WireKeys {
        static constexpr const char* URL = "url";
        static constexpr const char* METHOD = "method";
        static constexpr const char* HEADERS = "headers";
        static constexpr const char* BODY = "body";
        static constexpr const char* BODY_ENCODING = "body_encoding";
        static constexpr const char* QUERY_PARAMS = "query_params";
        static constexpr const char* TIMEOUT_MS = "timeout_ms";
        static constexpr const char* CONNECT_TIMEOUT_MS = "connect_timeout_ms";
        static constexpr const char* READ_TIMEOUT_MS = "read_timeout_ms";
        static constexpr const char* WRITE_TIMEOUT_MS = "write_timeout_ms";
        static constexpr const char* FOLLOW_REDIRECTS = "follow_redirects";
        static constexpr const char* MAX_REDIRECTS = "max_redirects";
        static constexpr const char* AUTO_REFERER = "auto_referer";
        static constexpr const char* DECOMPRESS = "decompress";
        static constexpr const char* HTTP3_ONLY = "http3_only";
        static constexpr const char* PARSE_RESPONSE = "parse_response";
        static constexpr const char* RESPONSE_TYPE_SCHEMA = "response_type_schema";
        static constexpr const char* CACHE_KEY = "cache_key";
        static constexpr const char* PRIORITY = "priority";

        static constexpr const char* STATUS_CODE = "status_code";
        static constexpr const char* VERSION = "version";
        static constexpr const char* ELAPSED_MS = "elapsed_ms";
        static constexpr const char* PARSED_DATA = "parsedData";
        static constexpr const char* CACHE_HIT = "cache_hit";
        static constexpr const char* COMPRESSION_SAVED = "compression_saved";

        static constexpr const char* ERROR = "error";
        static constexpr const char* CODE = "code";
        static constexpr const char* MESSAGE = "message";
        static constexpr const char* DETAILS = "details";
    };

    static constexpr const char* BASE64_ENCODING = "base64";

    struct DecodeError : public error::RelayError {
        explicit DecodeError(const std::string& message) : error::RelayError(error::ErrorCode::TRANSPORT_DECODE_ERROR, message) {}
    };

    [[nodiscard]] json request_to_json(const model::Request& request);
    [[nodiscard]] model::Request request_from_json(const json& j);
    [[nodiscard]] json batch_to_json(const std::vector<model::Request>& requests);
    [[nodiscard]] std::vector<model::Request> batch_from_json(const json& j);

    [[nodiscard]] json response_to_json(const model::Response& response);
    [[nodiscard]] model::Response response_from_json(const json& j);

    // {"error": {"code", "message", "details"}}
    [[nodiscard]] json error_to_json(const error::StructuredError& err);
    [[nodiscard]] error::StructuredError error_from_json(const json& j);
    [[nodiscard]] bool is_error_payload(const json& j);

    [[nodiscard]] json result_to_json(const model::ExecutionResult& result);
    [[nodiscard]] model::ExecutionResult result_from_json(const json& j);
    [[nodiscard]] json batch_results_to_json(const std::vector<model::ExecutionResult>& results);

    // A whole-batch error object is spread over every expected position.
    [[nodiscard]] std::vector<model::ExecutionResult> batch_results_from_json(const json& j, std::size_t expected);

    [[nodiscard]] json options_to_json(const engine::EngineOptions& options);
    [[nodiscard]] engine::EngineOptions options_from_json(const json& j);

    // Serializes for the wire; invalid UTF-8 in strings is replaced, never thrown.
    [[nodiscard]] std::string dump(const json& j);

    // Parses wire text, raising DecodeError on malformed input.
    [[nodiscard]] json parse(std::string_view text);
    [[nodiscard]] json parse(const char* data, std::size_t len);
}  // namespace relay::transport::codec

#endif
