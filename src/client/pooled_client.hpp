#ifndef HTTP_RELAY_POOLED_CLIENT_HPP
#define HTTP_RELAY_POOLED_CLIENT_HPP

#include <memory>
#include <vector>

#include "../pool/worker_pool.hpp"
#include "../transport/interface.hpp"
#include "client_options.hpp"
#include "interface.hpp"

namespace relay::client {

    // Dispatches through a worker pool; every worker owns a native transport and engine.
    class PooledHttpClient : public IHttpClient {
       public:
        explicit PooledHttpClient(const ClientOptions& options);
        PooledHttpClient(pool::TransportFactory factory, std::size_t pool_size, transport::Framing framing);

        ~PooledHttpClient() override;
        PooledHttpClient(const PooledHttpClient&) = delete;
        PooledHttpClient& operator=(const PooledHttpClient&) = delete;
        PooledHttpClient(PooledHttpClient&&) = delete;
        PooledHttpClient& operator=(PooledHttpClient&&) = delete;

        model::ExecutionResult execute(const model::Request& request) override;
        std::vector<model::ExecutionResult> execute_batch(const std::vector<model::Request>& requests) override;
        std::vector<model::ExecutionResult> execute_each(const std::vector<model::Request>& requests) override;
        void close() override;

        [[nodiscard]] const pool::WorkerPool& pool() const { return *pool_; }

        // Builds native transports from the linked library or options.library_path_.
        static pool::TransportFactory native_factory(const ClientOptions& options);

       private:
        std::unique_ptr<pool::WorkerPool> pool_;
        transport::Framing framing_;
    };

}  // namespace relay::client

#endif
