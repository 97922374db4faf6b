#ifndef HTTP_RELAY_NATIVE_TRANSPORT_HPP
#define HTTP_RELAY_NATIVE_TRANSPORT_HPP

#include <nlohmann/json.hpp>
#include <optional>

#include "../engine/engine_options.hpp"
#include "interface.hpp"
#include "native_api.hpp"

namespace relay::transport {

    class NativeTransport : public ITransport {
       public:
        // Creates a fresh engine through the ABI. Throws RelayError when the library refuses.
        NativeTransport(NativeApi api, const engine::EngineOptions& options);

        // Takes ownership of an existing engine handle.
        NativeTransport(NativeApi api, RelayEngine* handle);

        ~NativeTransport() override;
        NativeTransport(const NativeTransport&) = delete;
        NativeTransport& operator=(const NativeTransport&) = delete;
        NativeTransport(NativeTransport&&) = delete;
        NativeTransport& operator=(NativeTransport&&) = delete;

        std::optional<error::StructuredError> init() override;
        nlohmann::json execute(const nlohmann::json& payload, bool is_batch, Framing framing) override;
        void shutdown() override;

        [[nodiscard]] const NativeApi& api() const { return api_; }

       private:
        NativeApi api_;
        RelayEngine* handle_{};

        nlohmann::json execute_encoded(const std::string& payload, bool is_batch);
        nlohmann::json execute_raw_buffer(const std::string& payload, bool is_batch);
    };

}  // namespace relay::transport

#endif
