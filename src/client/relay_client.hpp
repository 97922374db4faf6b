#ifndef HTTP_RELAY_RELAY_CLIENT_HPP
#define HTTP_RELAY_RELAY_CLIENT_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../error/relay_error.hpp"
#include "../model/model.hpp"
#include "../pool/worker_pool.hpp"
#include "client_options.hpp"
#include "interface.hpp"

namespace relay::client {
    // Per-call settings; unset timeouts fall back to the client's defaults.
    struct RequestOptions {
        model::HeaderMap headers_;
        std::optional<std::string> body_;
        model::QueryParams query_params_;

        std::optional<std::chrono::milliseconds> timeout_;
        std::optional<std::chrono::milliseconds> connect_timeout_;
        std::optional<std::chrono::milliseconds> read_timeout_;
        std::optional<std::chrono::milliseconds> write_timeout_;

        bool follow_redirects_ = true;
        long max_redirects_ = constants::DEFAULT_MAX_REDIRECTS;
        bool auto_referer_ = true;
        bool decompress_ = true;
        bool http3_only_ = false;
        bool parse_response_ = false;

        std::optional<std::string> response_type_schema_;
        std::optional<std::string> cache_key_;
        model::Priority priority_ = model::Priority::NORMAL;

        // Sets the body to the serialized value and Content-Type to application/json.
        RequestOptions& json_body(const nlohmann::json& value);
    };

    // Receives parsedData when the engine produced it, the raw body otherwise.
    template <typename T>
    using Deserializer = std::function<T(std::string_view json)>;

    template <typename T>
    struct TypedResponse {
        model::Response response_;
        std::optional<T> data_;
    };

    class RelayClient {
       public:
        explicit RelayClient(std::unique_ptr<IHttpClient> backend, ClientOptions options = {});

        ~RelayClient();
        RelayClient(const RelayClient&) = delete;
        RelayClient& operator=(const RelayClient&) = delete;
        RelayClient(RelayClient&&) = delete;
        RelayClient& operator=(RelayClient&&) = delete;

        // Throws RelayError on failure. Non-2xx statuses are returned, not thrown.
        model::Response request(const std::string& url, const std::string& method, const RequestOptions& options = {});
        model::Response request(const model::Request& request);

        model::Response get(const std::string& url, const RequestOptions& options = {});
        model::Response post(const std::string& url, const RequestOptions& options = {});
        model::Response put(const std::string& url, const RequestOptions& options = {});
        model::Response del(const std::string& url, const RequestOptions& options = {});

        // Single dispatch, executed by one engine with its batch concurrency bound.
        std::vector<model::ExecutionResult> batch(const std::vector<model::Request>& requests);

        // Independent dispatches fanned out over the pool. No early abort.
        std::vector<model::ExecutionResult> batch_get(const std::vector<std::string>& urls, const RequestOptions& options = {});
        std::vector<model::ExecutionResult> execute_each(const std::vector<model::Request>& requests);

        template <typename T>
        TypedResponse<T> request_as(const std::string& url, const std::string& method, RequestOptions options = {}, Deserializer<T> deserializer = {});

        [[nodiscard]] model::Request build_request(const std::string& url, const std::string& method, const RequestOptions& options) const;
        [[nodiscard]] const ClientOptions& options() const { return options_; }
        [[nodiscard]] IHttpClient& backend() const { return *backend_; }

        void close();

        // Throws HttpStatusError for non-2xx responses.
        static void ensure_success(const model::Response& response);

       private:
        std::unique_ptr<IHttpClient> backend_;
        ClientOptions options_;
        std::atomic<bool> closed_ = false;
    };

    template <typename T>
    TypedResponse<T> RelayClient::request_as(const std::string& url, const std::string& method, RequestOptions options, Deserializer<T> deserializer) {
        options.parse_response_ = true;
        TypedResponse<T> typed{.response_ = request(url, method, options), .data_ = std::nullopt};

        if (!deserializer) {
            return typed;
        }

        const std::string& source = typed.response_.parsed_data_.has_value() ? *typed.response_.parsed_data_ : typed.response_.body_;
        try {
            typed.data_ = deserializer(source);
        } catch (const std::exception& e) {
            throw error::RelayError(error::ErrorCode::TRANSPORT_DECODE_ERROR, std::string("Failed to decode typed response: ") + e.what(),
                                    nlohmann::json{{"status_code", typed.response_.status_code_}, {"url", typed.response_.url_}}.dump());
        }
        return typed;
    }

    enum class Backend { POOLED, DIRECT };

    class RelayClientBuilder {
       public:
        RelayClientBuilder() = default;

        RelayClientBuilder& with_options(const ClientOptions& options);
        RelayClientBuilder& with_pool_size(std::size_t pool_size);
        RelayClientBuilder& with_engine_options(const engine::EngineOptions& engine_options);
        RelayClientBuilder& with_backend(Backend backend);
        RelayClientBuilder& with_framing(transport::Framing framing);
        RelayClientBuilder& with_default_timeout(std::chrono::milliseconds timeout);
        RelayClientBuilder& with_library(const std::string& path);
        RelayClientBuilder& with_transport_factory(pool::TransportFactory factory);
        RelayClientBuilder& validate();
        std::unique_ptr<RelayClient> build();

       private:
        ClientOptions options_;
        Backend backend_ = Backend::POOLED;
        pool::TransportFactory transport_factory_;
    };
}  // namespace relay::client

#endif
