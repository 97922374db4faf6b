#include "native_transport.hpp"

#include <string>
#include <utility>

#include "../utils/logger.hpp"
#include "../utils/string_utils.hpp"
#include "codec.hpp"
#include "leases.hpp"

namespace relay::transport {
    namespace {
        constexpr std::string_view TAG = "transport";
    }

    const char* to_string(Framing framing) { return framing == Framing::RAW_BUFFER ? "raw_buffer" : "encoded"; }

    std::optional<Framing> framing_from_string(std::string_view name) {
        if (string_utils::ieq(name, "encoded") || string_utils::ieq(name, "string")) {
            return Framing::ENCODED;
        }
        if (string_utils::ieq(name, "raw_buffer") || string_utils::ieq(name, "raw") || string_utils::ieq(name, "direct")) {
            return Framing::RAW_BUFFER;
        }
        return std::nullopt;
    }

    NativeTransport::NativeTransport(NativeApi api, const engine::EngineOptions& options) : api_(std::move(api)) {
        const std::string options_json = codec::dump(codec::options_to_json(options));
        handle_ = api_.create_engine_(options_json.c_str());
        if (handle_ == nullptr) {
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "relay_create_engine returned NULL");
        }
    }

    NativeTransport::NativeTransport(NativeApi api, RelayEngine* handle) : api_(std::move(api)), handle_(handle) {
        if (handle_ == nullptr) {
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Engine handle is NULL");
        }
    }

    NativeTransport::~NativeTransport() { shutdown(); }

    std::optional<error::StructuredError> NativeTransport::init() {
        if (handle_ == nullptr) {
            return error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "Transport has been shut down");
        }

        StringLease failure(api_.init_(handle_), api_.free_string_);
        if (failure.released()) {
            return std::nullopt;
        }

        try {
            return codec::error_from_json(codec::parse(failure.view()));
        } catch (const codec::DecodeError& e) {
            return e.to_structured();
        }
    }

    nlohmann::json NativeTransport::execute(const nlohmann::json& payload, bool is_batch, Framing framing) {
        if (handle_ == nullptr) {
            return codec::error_to_json(error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "Transport has been shut down"));
        }

        const std::string encoded = codec::dump(payload);
        try {
            return framing == Framing::RAW_BUFFER ? execute_raw_buffer(encoded, is_batch) : execute_encoded(encoded, is_batch);
        } catch (const codec::DecodeError& e) {
            log::warn(TAG, std::string("framing failure: ") + e.what());
            return codec::error_to_json(e.to_structured());
        }
    }

    nlohmann::json NativeTransport::execute_encoded(const std::string& payload, bool is_batch) {
        auto fn = is_batch ? api_.execute_batch_ : api_.execute_request_;
        StringLease result(fn(handle_, payload.c_str()), api_.free_string_);

        // Parsed straight out of the engine's memory, released on every exit path.
        nlohmann::json out = codec::parse(result.view());
        result.release();
        return out;
    }

    nlohmann::json NativeTransport::execute_raw_buffer(const std::string& payload, bool is_batch) {
        auto fn = is_batch ? api_.execute_batch_direct_ : api_.execute_request_direct_;
        RelayBuffer* raw = nullptr;
        const int32_t status = fn(handle_, payload.c_str(), &raw);
        BufferLease buffer(raw, api_.free_buffer_);

        if (status != RELAY_OK) {
            throw codec::DecodeError("Raw-buffer framing failed with status " + std::to_string(status));
        }

        nlohmann::json out = codec::parse(buffer.view());
        buffer.release();
        return out;
    }

    void NativeTransport::shutdown() {
        if (handle_ == nullptr) {
            return;
        }
        api_.destroy_engine_(handle_);
        handle_ = nullptr;
    }

}  // namespace relay::transport
