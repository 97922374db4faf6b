#ifndef HTTP_RELAY_DIRECT_CLIENT_HPP
#define HTTP_RELAY_DIRECT_CLIENT_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "../engine/engine_options.hpp"
#include "../engine/interface.hpp"
#include "interface.hpp"

namespace relay::client {

    // Runs one engine on the calling thread. Calls are serialized.
    class DirectHttpClient : public IHttpClient {
       public:
        explicit DirectHttpClient(const engine::EngineOptions& options);
        explicit DirectHttpClient(std::unique_ptr<engine::IHttpEngine> engine);

        ~DirectHttpClient() override;
        DirectHttpClient(const DirectHttpClient&) = delete;
        DirectHttpClient& operator=(const DirectHttpClient&) = delete;
        DirectHttpClient(DirectHttpClient&&) = delete;
        DirectHttpClient& operator=(DirectHttpClient&&) = delete;

        model::ExecutionResult execute(const model::Request& request) override;
        std::vector<model::ExecutionResult> execute_batch(const std::vector<model::Request>& requests) override;
        std::vector<model::ExecutionResult> execute_each(const std::vector<model::Request>& requests) override;
        void close() override;

       private:
        std::mutex mutex_;
        std::unique_ptr<engine::IHttpEngine> engine_;
    };

}  // namespace relay::client

#endif
