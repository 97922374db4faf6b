#include "native_api.hpp"

#include <string>
#include <utility>

#include "../error/relay_error.hpp"
#include "../utils/logger.hpp"

namespace relay::transport {
    namespace {
        template <typename Fn>
        void resolve(const SharedLibrary& lib, const char* name, Fn& out, const std::string& path) {
            std::string err;
            out = lib.sym<Fn>(name, err);
            if (out == nullptr) {
                throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Missing symbol '" + std::string(name) + "' in " + path + ": " + err);
            }
        }
    }  // namespace

    NativeApi NativeApi::linked() {
        return NativeApi{
            .create_engine_ = &relay_create_engine,
            .init_ = &relay_init,
            .execute_request_ = &relay_execute_request,
            .execute_batch_ = &relay_execute_batch,
            .execute_request_direct_ = &relay_execute_request_direct,
            .execute_batch_direct_ = &relay_execute_batch_direct,
            .allocate_buffer_ = &relay_allocate_buffer,
            .free_buffer_ = &relay_free_buffer,
            .free_string_ = &relay_free_string,
            .live_buffer_count_ = &relay_live_buffer_count,
            .shutdown_ = &relay_shutdown,
            .destroy_engine_ = &relay_destroy_engine,
            .library_ = nullptr,
        };
    }

    NativeApi NativeApi::load(const std::string& path) {
        std::string err;
        auto lib = std::make_shared<SharedLibrary>(SharedLibrary::open(path, err));
        if (!lib->is_open()) {
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Failed to load engine library " + path + ": " + err);
        }

        NativeApi api;
        resolve(*lib, "relay_create_engine", api.create_engine_, path);
        resolve(*lib, "relay_init", api.init_, path);
        resolve(*lib, "relay_execute_request", api.execute_request_, path);
        resolve(*lib, "relay_execute_batch", api.execute_batch_, path);
        resolve(*lib, "relay_execute_request_direct", api.execute_request_direct_, path);
        resolve(*lib, "relay_execute_batch_direct", api.execute_batch_direct_, path);
        resolve(*lib, "relay_allocate_buffer", api.allocate_buffer_, path);
        resolve(*lib, "relay_free_buffer", api.free_buffer_, path);
        resolve(*lib, "relay_free_string", api.free_string_, path);
        resolve(*lib, "relay_live_buffer_count", api.live_buffer_count_, path);
        resolve(*lib, "relay_shutdown", api.shutdown_, path);
        resolve(*lib, "relay_destroy_engine", api.destroy_engine_, path);
        api.library_ = std::move(lib);

        log::info("abi", "loaded engine library " + path);
        return api;
    }

}  // namespace relay::transport
