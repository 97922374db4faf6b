#ifndef HTTP_RELAY_CLIENT_INTERFACE_HPP
#define HTTP_RELAY_CLIENT_INTERFACE_HPP

#include <vector>

#include "../model/model.hpp"

namespace relay::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual model::ExecutionResult execute(const model::Request& request) = 0;

        // One dispatch; the engine bounds concurrency inside it.
        virtual std::vector<model::ExecutionResult> execute_batch(const std::vector<model::Request>& requests) = 0;

        // N independent dispatches, positional results.
        virtual std::vector<model::ExecutionResult> execute_each(const std::vector<model::Request>& requests) = 0;

        virtual void close() = 0;
    };
}  // namespace relay::client

#endif
