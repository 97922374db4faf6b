#include "codec.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include "../utils/string_utils.hpp"

namespace relay::transport::codec {
    namespace {
        struct OptionKeys {
            static constexpr const char* PRESET = "preset";
            static constexpr const char* USER_AGENT = "user_agent";
            static constexpr const char* BATCH_CONCURRENCY = "batch_concurrency";
            static constexpr const char* MAX_CONNECTIONS = "max_connections";
            static constexpr const char* MAX_HOST_CONNECTIONS = "max_host_connections";
            static constexpr const char* MAX_CONNECTION_AGE_S = "max_connection_age_s";
            static constexpr const char* TCP_KEEPALIVE = "tcp_keepalive";
            static constexpr const char* TCP_KEEPIDLE_S = "tcp_keepidle_s";
            static constexpr const char* TCP_KEEPINTVL_S = "tcp_keepintvl_s";
            static constexpr const char* TCP_NODELAY = "tcp_nodelay";
            static constexpr const char* VERIFY_TLS = "verify_tls";
            static constexpr const char* RETRY = "retry";
            static constexpr const char* MAX_TRIES = "max_tries";
            static constexpr const char* BASE_DELAY_MS = "base_delay_ms";
            static constexpr const char* MAX_DELAY_MS = "max_delay_ms";
            static constexpr const char* CACHE = "cache";
            static constexpr const char* ENABLED = "enabled";
            static constexpr const char* CAPACITY = "capacity";
            static constexpr const char* TTL_S = "ttl_s";
        };

        const json* find_field(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return nullptr;
            }
            return &*it;
        }

        [[noreturn]] void wrong_type(const char* key, const char* expected) { throw DecodeError(std::string("Field '") + key + "' must be " + expected); }

        void require_object(const json& j, const char* what) {
            if (!j.is_object()) {
                throw DecodeError(std::string(what) + " must be a JSON object");
            }
        }

        void read_string(const json& j, const char* key, std::string& out) {
            if (const auto* v = find_field(j, key)) {
                if (!v->is_string()) {
                    wrong_type(key, "a string");
                }
                out = v->get<std::string>();
            }
        }

        void read_optional_string(const json& j, const char* key, std::optional<std::string>& out) {
            if (const auto* v = find_field(j, key)) {
                if (!v->is_string()) {
                    wrong_type(key, "a string");
                }
                out = v->get<std::string>();
            }
        }

        void read_bool(const json& j, const char* key, bool& out) {
            if (const auto* v = find_field(j, key)) {
                if (!v->is_boolean()) {
                    wrong_type(key, "a boolean");
                }
                out = v->get<bool>();
            }
        }

        template <typename Int>
        void read_integer(const json& j, const char* key, Int& out) {
            if (const auto* v = find_field(j, key)) {
                if (!v->is_number_integer()) {
                    wrong_type(key, "an integer");
                }
                if constexpr (std::is_unsigned_v<Int>) {
                    if (v->get<long long>() < 0) {
                        wrong_type(key, "a non-negative integer");
                    }
                }
                out = v->get<Int>();
            }
        }

        template <typename Duration>
        void read_duration(const json& j, const char* key, Duration& out) {
            typename Duration::rep count = out.count();
            read_integer(j, key, count);
            out = Duration{count};
        }

        template <typename Map>
        void read_string_map(const json& j, const char* key, Map& out) {
            if (const auto* v = find_field(j, key)) {
                if (!v->is_object()) {
                    wrong_type(key, "an object of strings");
                }
                for (const auto& [name, value] : v->items()) {
                    if (!value.is_string()) {
                        throw DecodeError(std::string("Field '") + key + "." + name + "' must be a string");
                    }
                    out[name] = value.template get<std::string>();
                }
            }
        }

        template <typename Map>
        json string_map_to_json(const Map& map) {
            json out = json::object();
            for (const auto& [name, value] : map) {
                out[name] = value;
            }
            return out;
        }

        // Bytes that are not valid UTF-8 travel base64 encoded.
        void write_body(json& j, const std::string& body) {
            if (string_utils::is_valid_utf8(body)) {
                j[WireKeys::BODY] = body;
            } else {
                j[WireKeys::BODY] = string_utils::base64_encode(body);
                j[WireKeys::BODY_ENCODING] = BASE64_ENCODING;
            }
        }

        std::optional<std::string> read_body(const json& j) {
            std::optional<std::string> body;
            read_optional_string(j, WireKeys::BODY, body);

            std::string encoding;
            read_string(j, WireKeys::BODY_ENCODING, encoding);

            if (!body.has_value() || encoding.empty()) {
                return body;
            }

            if (!string_utils::ieq(encoding, BASE64_ENCODING)) {
                throw DecodeError("Unsupported body_encoding '" + encoding + "'");
            }

            auto decoded = string_utils::base64_decode(*body);
            if (!decoded.has_value()) {
                throw DecodeError("Body is not valid base64");
            }
            return decoded;
        }
    }  // namespace

    json request_to_json(const model::Request& request) {
        json j = {
            {WireKeys::URL, request.url_},
            {WireKeys::METHOD, request.method_},
            {WireKeys::HEADERS, string_map_to_json(request.headers_)},
            {WireKeys::QUERY_PARAMS, string_map_to_json(request.query_params_)},
            {WireKeys::TIMEOUT_MS, request.timeout_.count()},
            {WireKeys::CONNECT_TIMEOUT_MS, request.connect_timeout_.count()},
            {WireKeys::READ_TIMEOUT_MS, request.read_timeout_.count()},
            {WireKeys::WRITE_TIMEOUT_MS, request.write_timeout_.count()},
            {WireKeys::FOLLOW_REDIRECTS, request.follow_redirects_},
            {WireKeys::MAX_REDIRECTS, request.max_redirects_},
            {WireKeys::AUTO_REFERER, request.auto_referer_},
            {WireKeys::DECOMPRESS, request.decompress_},
            {WireKeys::HTTP3_ONLY, request.http3_only_},
            {WireKeys::PARSE_RESPONSE, request.parse_response_},
            {WireKeys::PRIORITY, model::to_string(request.priority_)},
        };

        if (request.body_.has_value()) {
            write_body(j, *request.body_);
        } else {
            j[WireKeys::BODY] = nullptr;
        }

        if (request.response_type_schema_.has_value()) {
            j[WireKeys::RESPONSE_TYPE_SCHEMA] = *request.response_type_schema_;
        }

        if (request.cache_key_.has_value()) {
            j[WireKeys::CACHE_KEY] = *request.cache_key_;
        }

        return j;
    }

    model::Request request_from_json(const json& j) {
        require_object(j, "Request");

        model::Request request;
        read_string(j, WireKeys::URL, request.url_);
        read_string(j, WireKeys::METHOD, request.method_);
        read_string_map(j, WireKeys::HEADERS, request.headers_);
        request.body_ = read_body(j);
        read_string_map(j, WireKeys::QUERY_PARAMS, request.query_params_);

        read_duration(j, WireKeys::TIMEOUT_MS, request.timeout_);
        read_duration(j, WireKeys::CONNECT_TIMEOUT_MS, request.connect_timeout_);
        read_duration(j, WireKeys::READ_TIMEOUT_MS, request.read_timeout_);
        read_duration(j, WireKeys::WRITE_TIMEOUT_MS, request.write_timeout_);

        read_bool(j, WireKeys::FOLLOW_REDIRECTS, request.follow_redirects_);
        read_integer(j, WireKeys::MAX_REDIRECTS, request.max_redirects_);
        read_bool(j, WireKeys::AUTO_REFERER, request.auto_referer_);
        read_bool(j, WireKeys::DECOMPRESS, request.decompress_);
        read_bool(j, WireKeys::HTTP3_ONLY, request.http3_only_);
        read_bool(j, WireKeys::PARSE_RESPONSE, request.parse_response_);
        read_optional_string(j, WireKeys::RESPONSE_TYPE_SCHEMA, request.response_type_schema_);
        read_optional_string(j, WireKeys::CACHE_KEY, request.cache_key_);

        std::string priority;
        read_string(j, WireKeys::PRIORITY, priority);
        if (!priority.empty()) {
            auto parsed = model::priority_from_string(priority);
            if (!parsed.has_value()) {
                throw DecodeError("Unknown priority '" + priority + "'");
            }
            request.priority_ = *parsed;
        }

        return request;
    }

    json batch_to_json(const std::vector<model::Request>& requests) {
        json out = json::array();
        for (const auto& request : requests) {
            out.push_back(request_to_json(request));
        }
        return out;
    }

    std::vector<model::Request> batch_from_json(const json& j) {
        if (!j.is_array()) {
            throw DecodeError("Batch must be a JSON array");
        }

        std::vector<model::Request> requests;
        requests.reserve(j.size());
        for (const auto& element : j) {
            requests.push_back(request_from_json(element));
        }
        return requests;
    }

    json response_to_json(const model::Response& response) {
        json j = {
            {WireKeys::STATUS_CODE, response.status_code_},
            {WireKeys::HEADERS, string_map_to_json(response.headers_)},
            {WireKeys::VERSION, response.version_},
            {WireKeys::URL, response.url_},
            {WireKeys::ELAPSED_MS, response.elapsed_ms_},
            {WireKeys::CACHE_HIT, response.cache_hit_},
        };

        write_body(j, response.body_);

        if (response.parsed_data_.has_value()) {
            json parsed = json::parse(*response.parsed_data_, nullptr, false);
            if (!parsed.is_discarded()) {
                j[WireKeys::PARSED_DATA] = std::move(parsed);
            }
        }

        if (response.compression_saved_.has_value()) {
            j[WireKeys::COMPRESSION_SAVED] = *response.compression_saved_;
        }

        return j;
    }

    model::Response response_from_json(const json& j) {
        require_object(j, "Response");

        model::Response response;
        read_integer(j, WireKeys::STATUS_CODE, response.status_code_);
        read_string_map(j, WireKeys::HEADERS, response.headers_);
        response.body_ = read_body(j).value_or("");
        read_string(j, WireKeys::VERSION, response.version_);
        read_string(j, WireKeys::URL, response.url_);
        read_integer(j, WireKeys::ELAPSED_MS, response.elapsed_ms_);
        read_bool(j, WireKeys::CACHE_HIT, response.cache_hit_);

        if (const auto* parsed = find_field(j, WireKeys::PARSED_DATA)) {
            response.parsed_data_ = parsed->dump();
        }

        if (const auto* saved = find_field(j, WireKeys::COMPRESSION_SAVED)) {
            if (!saved->is_number_unsigned() && !saved->is_number_integer()) {
                wrong_type(WireKeys::COMPRESSION_SAVED, "an integer");
            }
            response.compression_saved_ = saved->get<std::uint64_t>();
        }

        return response;
    }

    json error_to_json(const error::StructuredError& err) {
        json body = {
            {WireKeys::CODE, error::to_string(err.code_)},
            {WireKeys::MESSAGE, err.message_},
        };

        if (err.details_.has_value()) {
            json details = json::parse(*err.details_, nullptr, false);
            body[WireKeys::DETAILS] = details.is_discarded() ? json(*err.details_) : std::move(details);
        }

        return json{{WireKeys::ERROR, std::move(body)}};
    }

    bool is_error_payload(const json& j) { return j.is_object() && j.contains(WireKeys::ERROR) && !j.at(WireKeys::ERROR).is_null(); }

    error::StructuredError error_from_json(const json& j) {
        const json& body = is_error_payload(j) ? j.at(WireKeys::ERROR) : j;
        require_object(body, "Error");

        std::string code;
        error::StructuredError err;
        read_string(body, WireKeys::CODE, code);
        read_string(body, WireKeys::MESSAGE, err.message_);
        err.code_ = error::error_code_from_string(code);

        if (const auto* details = find_field(body, WireKeys::DETAILS)) {
            err.details_ = details->is_string() ? details->get<std::string>() : details->dump();
        }

        return err;
    }

    json result_to_json(const model::ExecutionResult& result) {
        if (const auto* response = std::get_if<model::Response>(&result)) {
            return response_to_json(*response);
        }
        return error_to_json(std::get<error::StructuredError>(result));
    }

    model::ExecutionResult result_from_json(const json& j) {
        require_object(j, "Result");
        if (is_error_payload(j)) {
            return error_from_json(j);
        }
        return response_from_json(j);
    }

    json batch_results_to_json(const std::vector<model::ExecutionResult>& results) {
        json out = json::array();
        for (const auto& result : results) {
            out.push_back(result_to_json(result));
        }
        return out;
    }

    std::vector<model::ExecutionResult> batch_results_from_json(const json& j, std::size_t expected) {
        if (is_error_payload(j)) {
            return std::vector<model::ExecutionResult>(expected, error_from_json(j));
        }

        if (!j.is_array()) {
            throw DecodeError("Batch result must be a JSON array");
        }

        if (j.size() != expected) {
            throw DecodeError("Batch result has " + std::to_string(j.size()) + " elements, expected " + std::to_string(expected));
        }

        std::vector<model::ExecutionResult> results;
        results.reserve(j.size());
        for (const auto& element : j) {
            try {
                results.push_back(result_from_json(element));
            } catch (const DecodeError& e) {
                results.emplace_back(e.to_structured());
            }
        }
        return results;
    }

    json options_to_json(const engine::EngineOptions& options) {
        return json{
            {OptionKeys::USER_AGENT, options.user_agent_},
            {OptionKeys::BATCH_CONCURRENCY, options.batch_concurrency_},
            {OptionKeys::MAX_CONNECTIONS, options.max_connections_},
            {OptionKeys::MAX_HOST_CONNECTIONS, options.max_host_connections_},
            {OptionKeys::MAX_CONNECTION_AGE_S, options.max_connection_age_.count()},
            {OptionKeys::TCP_KEEPALIVE, options.tcp_keepalive_},
            {OptionKeys::TCP_KEEPIDLE_S, options.tcp_keepidle_.count()},
            {OptionKeys::TCP_KEEPINTVL_S, options.tcp_keepintvl_.count()},
            {OptionKeys::TCP_NODELAY, options.tcp_nodelay_},
            {OptionKeys::VERIFY_TLS, options.verify_tls_},
            {OptionKeys::RETRY,
             {
                 {OptionKeys::MAX_TRIES, options.retry_.max_tries_},
                 {OptionKeys::BASE_DELAY_MS, options.retry_.base_delay_.count()},
                 {OptionKeys::MAX_DELAY_MS, options.retry_.max_delay_.count()},
             }},
            {OptionKeys::CACHE,
             {
                 {OptionKeys::ENABLED, options.cache_.enable_caching_},
                 {OptionKeys::CAPACITY, options.cache_.capacity_},
                 {OptionKeys::TTL_S, options.cache_.ttl_s_},
             }},
        };
    }

    engine::EngineOptions options_from_json(const json& j) {
        require_object(j, "Engine options");

        engine::EngineOptions options;

        std::string preset;
        read_string(j, OptionKeys::PRESET, preset);
        if (preset == "mobile") {
            options = engine::EngineOptions::mobile();
        } else if (preset == "shared_mobile") {
            options = engine::EngineOptions::shared_mobile();
        } else if (!preset.empty()) {
            throw DecodeError("Unknown options preset '" + preset + "'");
        }

        read_string(j, OptionKeys::USER_AGENT, options.user_agent_);
        read_integer(j, OptionKeys::BATCH_CONCURRENCY, options.batch_concurrency_);
        read_integer(j, OptionKeys::MAX_CONNECTIONS, options.max_connections_);
        read_integer(j, OptionKeys::MAX_HOST_CONNECTIONS, options.max_host_connections_);
        read_duration(j, OptionKeys::MAX_CONNECTION_AGE_S, options.max_connection_age_);
        read_bool(j, OptionKeys::TCP_KEEPALIVE, options.tcp_keepalive_);
        read_duration(j, OptionKeys::TCP_KEEPIDLE_S, options.tcp_keepidle_);
        read_duration(j, OptionKeys::TCP_KEEPINTVL_S, options.tcp_keepintvl_);
        read_bool(j, OptionKeys::TCP_NODELAY, options.tcp_nodelay_);
        read_bool(j, OptionKeys::VERIFY_TLS, options.verify_tls_);

        if (const auto* retry = find_field(j, OptionKeys::RETRY)) {
            require_object(*retry, "Retry policy");
            read_integer(*retry, OptionKeys::MAX_TRIES, options.retry_.max_tries_);
            read_duration(*retry, OptionKeys::BASE_DELAY_MS, options.retry_.base_delay_);
            read_duration(*retry, OptionKeys::MAX_DELAY_MS, options.retry_.max_delay_);
        }

        if (const auto* cache = find_field(j, OptionKeys::CACHE)) {
            require_object(*cache, "Cache policy");
            read_bool(*cache, OptionKeys::ENABLED, options.cache_.enable_caching_);
            read_integer(*cache, OptionKeys::CAPACITY, options.cache_.capacity_);
            read_integer(*cache, OptionKeys::TTL_S, options.cache_.ttl_s_);
        }

        return options;
    }

    std::string dump(const json& j) { return j.dump(-1, ' ', false, json::error_handler_t::replace); }

    json parse(std::string_view text) { return parse(text.data(), text.size()); }

    json parse(const char* data, std::size_t len) {
        if (data == nullptr || len == 0) {
            throw DecodeError("Empty payload");
        }

        json j = json::parse(data, data + len, nullptr, false);
        if (j.is_discarded()) {
            throw DecodeError("Payload is not valid JSON");
        }
        return j;
    }
}  // namespace relay::transport::codec
