#include "relay_client.hpp"

#include <string>
#include <utility>

#include "../utils/logger.hpp"
#include "direct_client.hpp"
#include "pooled_client.hpp"

namespace relay::client {
    namespace {
        constexpr std::string_view TAG = "client";

        model::Response unwrap(model::ExecutionResult result) {
            if (auto* response = std::get_if<model::Response>(&result)) {
                return std::move(*response);
            }
            throw error::RelayError(std::get<error::StructuredError>(result));
        }
    }  // namespace

    RequestOptions& RequestOptions::json_body(const nlohmann::json& value) {
        body_ = value.dump();
        headers_["Content-Type"] = "application/json";
        return *this;
    }

    //
    // RelayClient implementation
    //

    RelayClient::RelayClient(std::unique_ptr<IHttpClient> backend, ClientOptions options) : backend_(std::move(backend)), options_(std::move(options)) {
        if (backend_ == nullptr) {
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Client backend is required");
        }
    }

    RelayClient::~RelayClient() { close(); }

    model::Request RelayClient::build_request(const std::string& url, const std::string& method, const RequestOptions& options) const {
        return model::Request{
            .url_ = url,
            .method_ = model::normalize_method(method),
            .headers_ = options.headers_,
            .body_ = options.body_,
            .query_params_ = options.query_params_,
            .timeout_ = options.timeout_.value_or(options_.default_timeout_),
            .connect_timeout_ = options.connect_timeout_.value_or(std::chrono::milliseconds{constants::DEFAULT_CONNECT_TIMEOUT_MS}),
            .read_timeout_ = options.read_timeout_.value_or(std::chrono::milliseconds{constants::DEFAULT_READ_TIMEOUT_MS}),
            .write_timeout_ = options.write_timeout_.value_or(std::chrono::milliseconds{constants::DEFAULT_WRITE_TIMEOUT_MS}),
            .follow_redirects_ = options.follow_redirects_,
            .max_redirects_ = options.max_redirects_,
            .auto_referer_ = options.auto_referer_,
            .decompress_ = options.decompress_,
            .http3_only_ = options.http3_only_,
            .parse_response_ = options.parse_response_,
            .response_type_schema_ = options.response_type_schema_,
            .cache_key_ = options.cache_key_,
            .priority_ = options.priority_,
        };
    }

    model::Response RelayClient::request(const std::string& url, const std::string& method, const RequestOptions& options) {
        return request(build_request(url, method, options));
    }

    model::Response RelayClient::request(const model::Request& request) {
        if (closed_) {
            throw error::RelayError(error::ErrorCode::ENGINE_SHUTDOWN, "Client has been closed");
        }
        return unwrap(backend_->execute(request));
    }

    model::Response RelayClient::get(const std::string& url, const RequestOptions& options) { return request(url, "GET", options); }

    model::Response RelayClient::post(const std::string& url, const RequestOptions& options) { return request(url, "POST", options); }

    model::Response RelayClient::put(const std::string& url, const RequestOptions& options) { return request(url, "PUT", options); }

    model::Response RelayClient::del(const std::string& url, const RequestOptions& options) { return request(url, "DELETE", options); }

    std::vector<model::ExecutionResult> RelayClient::batch(const std::vector<model::Request>& requests) {
        if (closed_) {
            return std::vector<model::ExecutionResult>(requests.size(), error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "Client has been closed"));
        }
        return backend_->execute_batch(requests);
    }

    std::vector<model::ExecutionResult> RelayClient::batch_get(const std::vector<std::string>& urls, const RequestOptions& options) {
        std::vector<model::Request> requests;
        requests.reserve(urls.size());
        for (const auto& url : urls) {
            requests.push_back(build_request(url, "GET", options));
        }
        return execute_each(requests);
    }

    std::vector<model::ExecutionResult> RelayClient::execute_each(const std::vector<model::Request>& requests) {
        if (closed_) {
            return std::vector<model::ExecutionResult>(requests.size(), error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "Client has been closed"));
        }
        return backend_->execute_each(requests);
    }

    void RelayClient::close() {
        if (closed_.exchange(true)) {
            return;
        }
        backend_->close();
        log::debug(TAG, "client closed");
    }

    void RelayClient::ensure_success(const model::Response& response) {
        if (response.is_success()) {
            return;
        }
        throw error::HttpStatusError(response.status_code_, response.url_, response.body_.substr(0, constants::BODY_PREVIEW_LENGTH),
                                     "HTTP " + std::to_string(response.status_code_) + " from " + response.url_);
    }

    //
    // RelayClientBuilder implementation
    //

    RelayClientBuilder& RelayClientBuilder::with_options(const ClientOptions& options) {
        options_ = options;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_pool_size(std::size_t pool_size) {
        options_.pool_size_ = pool_size;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_engine_options(const engine::EngineOptions& engine_options) {
        options_.engine_options_ = engine_options;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_backend(Backend backend) {
        backend_ = backend;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_framing(transport::Framing framing) {
        options_.framing_ = framing;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_default_timeout(std::chrono::milliseconds timeout) {
        options_.default_timeout_ = timeout;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_library(const std::string& path) {
        options_.library_path_ = path;
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::with_transport_factory(pool::TransportFactory factory) {
        transport_factory_ = std::move(factory);
        return *this;
    }

    RelayClientBuilder& RelayClientBuilder::validate() {
        if (backend_ == Backend::POOLED && (options_.pool_size_ == 0 || options_.pool_size_ > constants::MAX_POOL_SIZE)) {
            throw error::RelayError(error::ErrorCode::INVALID_REQUEST, "Pool size must be between 1 and " + std::to_string(constants::MAX_POOL_SIZE));
        }
        if (options_.engine_options_.batch_concurrency_ == 0) {
            throw error::RelayError(error::ErrorCode::INVALID_REQUEST, "Batch concurrency must be at least 1");
        }
        if (options_.default_timeout_.count() < 0) {
            throw error::RelayError(error::ErrorCode::INVALID_REQUEST, "Default timeout must be non-negative");
        }
        if (options_.engine_options_.retry_.max_tries_ == 0) {
            throw error::RelayError(error::ErrorCode::INVALID_REQUEST, "Retry policy needs at least one attempt");
        }
        if (backend_ == Backend::DIRECT && (transport_factory_ != nullptr || options_.library_path_.has_value())) {
            throw error::RelayError(error::ErrorCode::INVALID_REQUEST, "Transport settings only apply to the pooled backend");
        }
        return *this;
    }

    std::unique_ptr<RelayClient> RelayClientBuilder::build() {
        validate();

        std::unique_ptr<IHttpClient> backend;
        if (backend_ == Backend::DIRECT) {
            backend = std::make_unique<DirectHttpClient>(options_.engine_options_);
        } else if (transport_factory_ != nullptr) {
            backend = std::make_unique<PooledHttpClient>(transport_factory_, options_.pool_size_, options_.framing_);
        } else {
            backend = std::make_unique<PooledHttpClient>(options_);
        }

        log::info(TAG, std::string("client ready, backend ") + (backend_ == Backend::DIRECT ? "direct" : "pooled") + ", framing " + transport::to_string(options_.framing_));
        return std::make_unique<RelayClient>(std::move(backend), options_);
    }
}  // namespace relay::client
