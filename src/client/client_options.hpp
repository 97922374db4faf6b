#ifndef HTTP_RELAY_CLIENT_OPTIONS_HPP
#define HTTP_RELAY_CLIENT_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "../engine/engine_options.hpp"
#include "../transport/interface.hpp"
#include "../utils/constants.hpp"

namespace relay::client {
    struct EnvKeys {
        static constexpr const char* POOL_SIZE = "RELAY_POOL_SIZE";
        static constexpr const char* BATCH_CONCURRENCY = "RELAY_BATCH_CONCURRENCY";
        static constexpr const char* TIMEOUT_MS = "RELAY_TIMEOUT_MS";
        static constexpr const char* FRAMING = "RELAY_FRAMING";
    };

    struct ClientOptions {
        std::size_t pool_size_ = constants::DEFAULT_POOL_SIZE;
        transport::Framing framing_ = transport::Framing::RAW_BUFFER;
        std::chrono::milliseconds default_timeout_{constants::DEFAULT_TIMEOUT_MS};

        // Engine library to dlopen; empty uses the copy linked into this binary.
        std::optional<std::string> library_path_;

        engine::EngineOptions engine_options_;

        // Defaults overridden by RELAY_* variables; out-of-range values are logged and ignored.
        static ClientOptions from_env();
        static ClientOptions mobile();
        static ClientOptions shared_mobile();
    };
}  // namespace relay::client

#endif
