#include "native_abi.h"

#include <cstring>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <unordered_set>
#include <utility>

#include "../engine/curl_engine.hpp"
#include "../engine/interface.hpp"
#include "../utils/logger.hpp"
#include "codec.hpp"
#include "native_api.hpp"

struct RelayEngine {
    std::unique_ptr<relay::engine::IHttpEngine> engine_;
};

namespace {
    constexpr std::string_view TAG = "abi";

    namespace codec = relay::transport::codec;
    using relay::error::ErrorCode;

    struct BufferRegistry {
        std::mutex mutex_;
        std::unordered_set<RelayBuffer*> live_;
    };

    BufferRegistry& registry() {
        static BufferRegistry instance;
        return instance;
    }

    char* copy_string(const std::string& s) {
        auto* out = new (std::nothrow) char[s.size() + 1];
        if (out == nullptr) {
            return nullptr;
        }
        std::memcpy(out, s.data(), s.size());
        out[s.size()] = '\0';
        return out;
    }

    std::string error_payload(ErrorCode code, const std::string& message) {
        return codec::dump(codec::error_to_json(relay::error::make_error(code, message)));
    }

    // Runs one encoded dispatch. Every failure is folded into the payload.
    template <typename Fn>
    std::string guarded(Fn&& fn) {
        try {
            return fn();
        } catch (const relay::error::RelayError& e) {
            return codec::dump(codec::error_to_json(e.to_structured()));
        } catch (const std::exception& e) {
            relay::log::error(TAG, std::string("unexpected failure: ") + e.what());
            return error_payload(ErrorCode::UNKNOWN_ERROR, e.what());
        } catch (...) {
            relay::log::error(TAG, "unexpected non-standard exception");
            return error_payload(ErrorCode::UNKNOWN_ERROR, "Unexpected non-standard exception in engine");
        }
    }

    std::string execute_single(RelayEngine* engine, const char* request_json) {
        return guarded([&] {
            if (engine == nullptr || engine->engine_ == nullptr) {
                return error_payload(ErrorCode::ENGINE_NOT_INITIALIZED, "Engine handle is NULL");
            }
            if (request_json == nullptr) {
                return error_payload(ErrorCode::TRANSPORT_DECODE_ERROR, "Request payload is NULL");
            }

            const auto request = codec::request_from_json(codec::parse(request_json));
            return codec::dump(codec::result_to_json(engine->engine_->execute_one(request)));
        });
    }

    std::string execute_batch(RelayEngine* engine, const char* requests_json) {
        return guarded([&] {
            if (engine == nullptr || engine->engine_ == nullptr) {
                return error_payload(ErrorCode::ENGINE_NOT_INITIALIZED, "Engine handle is NULL");
            }
            if (requests_json == nullptr) {
                return error_payload(ErrorCode::TRANSPORT_DECODE_ERROR, "Batch payload is NULL");
            }

            const auto requests = codec::batch_from_json(codec::parse(requests_json));
            return codec::dump(codec::batch_results_to_json(engine->engine_->execute_batch(requests)));
        });
    }

    int32_t write_buffer(const std::string& payload, RelayBuffer** out) {
        RelayBuffer* buffer = relay_allocate_buffer(payload.size());
        if (buffer == nullptr) {
            return RELAY_ERR_ALLOCATION;
        }
        std::memcpy(buffer->data_, payload.data(), payload.size());
        buffer->len_ = payload.size();
        *out = buffer;
        return RELAY_OK;
    }
}  // namespace

namespace relay::transport {
    RelayEngine* adopt_engine(std::unique_ptr<engine::IHttpEngine> engine) {
        if (engine == nullptr) {
            return nullptr;
        }
        return new (std::nothrow) RelayEngine{std::move(engine)};
    }
}  // namespace relay::transport

extern "C" {

RelayEngine* relay_create_engine(const char* options_json) {
    try {
        relay::engine::EngineOptions options;
        if (options_json != nullptr && *options_json != '\0') {
            options = codec::options_from_json(codec::parse(options_json));
        }
        return relay::transport::adopt_engine(std::make_unique<relay::engine::CurlEngine>(std::move(options)));
    } catch (const relay::error::RelayError& e) {
        relay::log::error(TAG, std::string("relay_create_engine: ") + e.what());
        return nullptr;
    } catch (const std::exception& e) {
        relay::log::error(TAG, std::string("relay_create_engine: ") + e.what());
        return nullptr;
    } catch (...) {
        relay::log::error(TAG, "relay_create_engine: unexpected non-standard exception");
        return nullptr;
    }
}

char* relay_init(RelayEngine* engine) {
    if (engine == nullptr || engine->engine_ == nullptr) {
        return copy_string(error_payload(ErrorCode::ENGINE_NOT_INITIALIZED, "Engine handle is NULL"));
    }

    const std::string failure = guarded([&]() -> std::string {
        auto err = engine->engine_->init();
        return err.has_value() ? codec::dump(codec::error_to_json(*err)) : std::string{};
    });

    return failure.empty() ? nullptr : copy_string(failure);
}

char* relay_execute_request(RelayEngine* engine, const char* request_json) { return copy_string(execute_single(engine, request_json)); }

char* relay_execute_batch(RelayEngine* engine, const char* requests_json) { return copy_string(execute_batch(engine, requests_json)); }

void relay_free_string(char* str) { delete[] str; }

int32_t relay_execute_request_direct(RelayEngine* engine, const char* request_json, RelayBuffer** out) {
    if (out == nullptr || engine == nullptr || request_json == nullptr) {
        return RELAY_ERR_NULL_ARGUMENT;
    }
    *out = nullptr;
    return write_buffer(execute_single(engine, request_json), out);
}

int32_t relay_execute_batch_direct(RelayEngine* engine, const char* requests_json, RelayBuffer** out) {
    if (out == nullptr || engine == nullptr || requests_json == nullptr) {
        return RELAY_ERR_NULL_ARGUMENT;
    }
    *out = nullptr;
    return write_buffer(execute_batch(engine, requests_json), out);
}

RelayBuffer* relay_allocate_buffer(size_t size) {
    auto* buffer = new (std::nothrow) RelayBuffer{};
    if (buffer == nullptr) {
        return nullptr;
    }

    if (size > 0) {
        buffer->data_ = new (std::nothrow) uint8_t[size];
        if (buffer->data_ == nullptr) {
            delete buffer;
            return nullptr;
        }
    }
    buffer->len_ = 0;
    buffer->capacity_ = size;

    // An untracked buffer could never be freed, so a failed insert drops the allocation.
    try {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex_);
        reg.live_.insert(buffer);
    } catch (const std::exception&) {
        delete[] buffer->data_;
        delete buffer;
        return nullptr;
    }
    return buffer;
}

void relay_free_buffer(RelayBuffer* buffer) {
    if (buffer == nullptr) {
        return;
    }

    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex_);
        if (reg.live_.erase(buffer) == 0) {
            relay::log::warn(TAG, "relay_free_buffer called with an unknown or already released buffer");
            return;
        }
    }

    delete[] buffer->data_;
    delete buffer;
}

size_t relay_live_buffer_count(void) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex_);
    return reg.live_.size();
}

void relay_shutdown(RelayEngine* engine) {
    if (engine != nullptr && engine->engine_ != nullptr) {
        engine->engine_->shutdown();
    }
}

void relay_destroy_engine(RelayEngine* engine) {
    if (engine == nullptr) {
        return;
    }
    if (engine->engine_ != nullptr) {
        engine->engine_->shutdown();
    }
    delete engine;
}

}  // extern "C"
