#ifndef HTTP_RELAY_ENGINE_INTERFACE_HPP
#define HTTP_RELAY_ENGINE_INTERFACE_HPP

#include <optional>
#include <vector>

#include "../model/model.hpp"

namespace relay::engine {
    class IHttpEngine {
       public:
        IHttpEngine() = default;
        virtual ~IHttpEngine() = default;
        IHttpEngine(const IHttpEngine&) = delete;
        virtual IHttpEngine& operator=(const IHttpEngine&) = delete;
        IHttpEngine(IHttpEngine&&) = delete;
        virtual IHttpEngine& operator=(IHttpEngine&&) = delete;

        // Idempotent. Returns an error when the HTTP stack cannot be brought up.
        virtual std::optional<error::StructuredError> init() = 0;

        // Never throws for transport failures; those come back as the error alternative.
        virtual model::ExecutionResult execute_one(const model::Request& request) = 0;

        // One result per request, in request order.
        virtual std::vector<model::ExecutionResult> execute_batch(const std::vector<model::Request>& requests) = 0;

        // Idempotent. Subsequent executions fail with ENGINE_SHUTDOWN.
        virtual void shutdown() = 0;
    };
}  // namespace relay::engine

#endif
