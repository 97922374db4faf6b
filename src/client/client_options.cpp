#include "client_options.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include "../utils/logger.hpp"

namespace relay::client {
    namespace {
        constexpr std::string_view TAG = "config";

        std::optional<long long> read_env_integer(const char* key, long long min, long long max) {
            const char* raw = std::getenv(key);
            if (raw == nullptr || *raw == '\0') {
                return std::nullopt;
            }

            char* end = nullptr;
            const long long value = std::strtoll(raw, &end, constants::BASE_10);
            if (end == raw || *end != '\0' || value < min || value > max) {
                log::warn(TAG, std::string("ignoring ") + key + "='" + raw + "', expected an integer in [" + std::to_string(min) + ", " + std::to_string(max) + "]");
                return std::nullopt;
            }
            return value;
        }
    }  // namespace

    ClientOptions ClientOptions::from_env() {
        ClientOptions options;

        if (auto pool_size = read_env_integer(EnvKeys::POOL_SIZE, 1, static_cast<long long>(constants::MAX_POOL_SIZE))) {
            options.pool_size_ = static_cast<std::size_t>(*pool_size);
        }

        if (auto concurrency = read_env_integer(EnvKeys::BATCH_CONCURRENCY, 1, 1024)) {
            options.engine_options_.batch_concurrency_ = static_cast<std::size_t>(*concurrency);
        }

        if (auto timeout = read_env_integer(EnvKeys::TIMEOUT_MS, 0, 3'600'000)) {
            options.default_timeout_ = std::chrono::milliseconds{*timeout};
        }

        if (const char* framing = std::getenv(EnvKeys::FRAMING); framing != nullptr && *framing != '\0') {
            if (auto parsed = transport::framing_from_string(framing)) {
                options.framing_ = *parsed;
            } else {
                log::warn(TAG, std::string("ignoring ") + EnvKeys::FRAMING + "='" + framing + "', expected encoded or raw_buffer");
            }
        }

        return options;
    }

    ClientOptions ClientOptions::mobile() {
        ClientOptions options;
        options.engine_options_ = engine::EngineOptions::mobile();
        return options;
    }

    ClientOptions ClientOptions::shared_mobile() {
        ClientOptions options;
        options.pool_size_ = 1;
        options.engine_options_ = engine::EngineOptions::shared_mobile();
        return options;
    }
}  // namespace relay::client
