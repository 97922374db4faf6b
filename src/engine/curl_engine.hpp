#ifndef HTTP_RELAY_CURL_ENGINE_HPP
#define HTTP_RELAY_CURL_ENGINE_HPP

#include <curl/curl.h>
#include <simdjson.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

#include "../cache/response_cache.hpp"
#include "../model/model.hpp"
#include "curl_global.hpp"
#include "engine_options.hpp"
#include "interface.hpp"

namespace relay::engine {
    const int MULTI_WAIT_MAX_MS = 100;

    // libcurl engine. Each instance owns one multi handle, and with it a private
    // connection pool and DNS cache. Calls are serialized per instance.
    class CurlEngine : public IHttpEngine {
       public:
        explicit CurlEngine(EngineOptions options = {});

        ~CurlEngine() override;
        CurlEngine(const CurlEngine&) = delete;
        CurlEngine& operator=(const CurlEngine&) = delete;
        CurlEngine(CurlEngine&&) = delete;
        CurlEngine& operator=(CurlEngine&&) = delete;

        std::optional<error::StructuredError> init() override;
        model::ExecutionResult execute_one(const model::Request& request) override;
        std::vector<model::ExecutionResult> execute_batch(const std::vector<model::Request>& requests) override;
        void shutdown() override;

        [[nodiscard]] const EngineOptions& options() const { return options_; }
        [[nodiscard]] CURLM* multi_handle() const { return multi_; }
        [[nodiscard]] std::chrono::milliseconds get_retry_delay(std::size_t attempt);

       private:
        enum class State { CREATED, READY, FAILED, SHUT_DOWN };

        struct Pending {
            std::size_t index_ = 0;
            std::size_t attempt_ = 1;
            std::chrono::steady_clock::time_point ready_at_;
        };

        EngineOptions options_;
        std::mutex mutex_;
        State state_ = State::CREATED;
        std::optional<error::StructuredError> init_error_;

        std::unique_ptr<CurlGlobal> global_;
        CURLM* multi_{};

        cache::ResponseCache cache_;
        simdjson::dom::parser parser_;
        std::minstd_rand rng_;

        [[nodiscard]] std::optional<error::StructuredError> check_ready() const;
        [[nodiscard]] bool should_retry(const model::Request& request, const model::ExecutionResult& result, std::size_t attempt) const;
        void attach_parsed_data(const model::Request& request, model::Response& response);
        void release_multi();
        std::vector<model::ExecutionResult> run_transfers(const std::vector<model::Request>& requests);
    };
}  // namespace relay::engine

#endif
