#ifndef HTTP_RELAY_NATIVE_API_HPP
#define HTTP_RELAY_NATIVE_API_HPP

#include <memory>
#include <string>

#include "../engine/interface.hpp"
#include "native_abi.h"
#include "shared_library.hpp"

namespace relay::transport {

    // Caller-side view of the engine library's C ABI.
    struct NativeApi {
        RelayCreateEngineFn create_engine_ = nullptr;
        RelayInitFn init_ = nullptr;
        RelayExecuteFn execute_request_ = nullptr;
        RelayExecuteFn execute_batch_ = nullptr;
        RelayExecuteDirectFn execute_request_direct_ = nullptr;
        RelayExecuteDirectFn execute_batch_direct_ = nullptr;
        RelayAllocateBufferFn allocate_buffer_ = nullptr;
        RelayFreeBufferFn free_buffer_ = nullptr;
        RelayFreeStringFn free_string_ = nullptr;
        RelayLiveBufferCountFn live_buffer_count_ = nullptr;
        RelayEngineFn shutdown_ = nullptr;
        RelayEngineFn destroy_engine_ = nullptr;

        // Keeps a dlopen'ed library alive for as long as any copy of the table exists.
        std::shared_ptr<SharedLibrary> library_;

        // The engine library linked into this binary.
        static NativeApi linked();

        // Resolves every symbol from a shared library. Throws RelayError naming the missing symbol.
        static NativeApi load(const std::string& path);
    };

    // Wraps an in-process engine in an ABI handle; released with relay_destroy_engine.
    RelayEngine* adopt_engine(std::unique_ptr<engine::IHttpEngine> engine);

}  // namespace relay::transport

#endif
