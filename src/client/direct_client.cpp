#include "direct_client.hpp"

#include <utility>

#include "../engine/curl_engine.hpp"

namespace relay::client {

    DirectHttpClient::DirectHttpClient(const engine::EngineOptions& options) : DirectHttpClient(std::make_unique<engine::CurlEngine>(options)) {}

    DirectHttpClient::DirectHttpClient(std::unique_ptr<engine::IHttpEngine> engine) : engine_(std::move(engine)) {
        if (engine_ == nullptr) {
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Engine is required");
        }
        if (auto failure = engine_->init()) {
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Engine failed to initialize: " + failure->message_, failure->details_);
        }
    }

    DirectHttpClient::~DirectHttpClient() { close(); }

    model::ExecutionResult DirectHttpClient::execute(const model::Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_->execute_one(request);
    }

    std::vector<model::ExecutionResult> DirectHttpClient::execute_batch(const std::vector<model::Request>& requests) {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_->execute_batch(requests);
    }

    // One engine, so independent dispatches share its multi loop.
    std::vector<model::ExecutionResult> DirectHttpClient::execute_each(const std::vector<model::Request>& requests) { return execute_batch(requests); }

    void DirectHttpClient::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        engine_->shutdown();
    }

}  // namespace relay::client
