#ifndef HTTP_RELAY_TRANSPORT_INTERFACE_HPP
#define HTTP_RELAY_TRANSPORT_INTERFACE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

#include "../error/relay_error.hpp"

namespace relay::transport {
    enum class Framing {
        ENCODED,     // owned C string per call
        RAW_BUFFER,  // engine-allocated buffer, parsed in place
    };

    [[nodiscard]] const char* to_string(Framing framing);
    [[nodiscard]] std::optional<Framing> framing_from_string(std::string_view name);

    // Carries encoded payloads to one engine instance and returns owned results.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        virtual ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        virtual ITransport& operator=(ITransport&&) = delete;

        virtual std::optional<error::StructuredError> init() = 0;

        // Returns a result object, a result array for batches, or {"error": ...}.
        virtual nlohmann::json execute(const nlohmann::json& payload, bool is_batch, Framing framing) = 0;

        virtual void shutdown() = 0;
    };
}  // namespace relay::transport

#endif
