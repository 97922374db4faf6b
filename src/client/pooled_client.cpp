#include "pooled_client.hpp"

#include <future>
#include <string>
#include <utility>

#include "../transport/codec.hpp"
#include "../transport/native_api.hpp"
#include "../transport/native_transport.hpp"

namespace relay::client {
    namespace {
        model::ExecutionResult decode_single(const nlohmann::json& payload) {
            try {
                return transport::codec::result_from_json(payload);
            } catch (const error::RelayError& e) {
                return e.to_structured();
            }
        }

        error::StructuredError failure_from(const std::exception& e) {
            if (const auto* relay_error = dynamic_cast<const error::RelayError*>(&e)) {
                return relay_error->to_structured();
            }
            return error::make_error(error::ErrorCode::UNKNOWN_ERROR, e.what());
        }
    }  // namespace

    PooledHttpClient::PooledHttpClient(const ClientOptions& options) : PooledHttpClient(native_factory(options), options.pool_size_, options.framing_) {}

    PooledHttpClient::PooledHttpClient(pool::TransportFactory factory, std::size_t pool_size, transport::Framing framing)
        : pool_(std::make_unique<pool::WorkerPool>(std::move(factory))), framing_(framing) {
        pool_->initialize(pool_size);
    }

    PooledHttpClient::~PooledHttpClient() { close(); }

    pool::TransportFactory PooledHttpClient::native_factory(const ClientOptions& options) {
        auto api = options.library_path_.has_value() ? transport::NativeApi::load(*options.library_path_) : transport::NativeApi::linked();
        return [api = std::move(api), engine_options = options.engine_options_]() -> std::unique_ptr<transport::ITransport> {
            return std::make_unique<transport::NativeTransport>(api, engine_options);
        };
    }

    model::ExecutionResult PooledHttpClient::execute(const model::Request& request) {
        try {
            return decode_single(pool_->run(transport::codec::request_to_json(request), false, framing_));
        } catch (const std::exception& e) {
            return failure_from(e);
        }
    }

    std::vector<model::ExecutionResult> PooledHttpClient::execute_batch(const std::vector<model::Request>& requests) {
        if (requests.empty()) {
            return {};
        }

        try {
            return transport::codec::batch_results_from_json(pool_->run(transport::codec::batch_to_json(requests), true, framing_), requests.size());
        } catch (const std::exception& e) {
            return std::vector<model::ExecutionResult>(requests.size(), failure_from(e));
        }
    }

    std::vector<model::ExecutionResult> PooledHttpClient::execute_each(const std::vector<model::Request>& requests) {
        std::vector<std::optional<std::future<nlohmann::json>>> futures;
        std::vector<model::ExecutionResult> results(requests.size());
        futures.reserve(requests.size());

        for (std::size_t i = 0; i < requests.size(); ++i) {
            try {
                futures.emplace_back(pool_->submit(transport::codec::request_to_json(requests[i]), false, framing_));
            } catch (const std::exception& e) {
                futures.emplace_back(std::nullopt);
                results[i] = failure_from(e);
            }
        }

        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (!futures[i].has_value()) {
                continue;
            }
            try {
                results[i] = decode_single(futures[i]->get());
            } catch (const std::exception& e) {
                results[i] = failure_from(e);
            }
        }

        return results;
    }

    void PooledHttpClient::close() { pool_->close(); }

}  // namespace relay::client
