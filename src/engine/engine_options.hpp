#ifndef HTTP_RELAY_ENGINE_OPTIONS_HPP
#define HTTP_RELAY_ENGINE_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <string>

#include "../utils/constants.hpp"

namespace relay::engine {
    const long BASE_DELAY_MS = 300;
    const long MAX_DELAY_MS = 1500;
    const long ONE_DAY_S = 60L * 60L * 24L;

    struct RetryPolicy {
        std::size_t max_tries_ = 1;
        std::chrono::milliseconds base_delay_{BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{MAX_DELAY_MS};
    };

    struct CachePolicy {
        bool enable_caching_ = false;
        std::size_t capacity_ = 500;
        long ttl_s_ = ONE_DAY_S;
    };

    struct EngineOptions {
        std::string user_agent_ = constants::DEFAULT_USER_AGENT;
        std::size_t batch_concurrency_ = constants::DEFAULT_BATCH_CONCURRENCY;

        // Connection pool, private to one engine instance.
        long max_connections_ = 10;
        long max_host_connections_ = 0;
        std::chrono::seconds max_connection_age_{30};

        bool tcp_keepalive_ = true;
        std::chrono::seconds tcp_keepidle_{30};
        std::chrono::seconds tcp_keepintvl_{15};
        bool tcp_nodelay_ = true;

        bool verify_tls_ = true;

        RetryPolicy retry_;
        CachePolicy cache_;

        // Tuned for an isolated per-worker client.
        static EngineOptions mobile();
        // Tuned for a single client shared by the whole app.
        static EngineOptions shared_mobile();
    };

    inline EngineOptions EngineOptions::mobile() {
        EngineOptions o;
        o.max_connections_ = 50;
        o.max_connection_age_ = std::chrono::seconds{300};
        o.tcp_keepidle_ = std::chrono::seconds{15};
        o.tcp_keepintvl_ = std::chrono::seconds{15};
        return o;
    }

    inline EngineOptions EngineOptions::shared_mobile() {
        EngineOptions o;
        o.max_connections_ = 100;
        o.max_connection_age_ = std::chrono::seconds{600};
        o.tcp_keepidle_ = std::chrono::seconds{15};
        o.tcp_keepintvl_ = std::chrono::seconds{15};
        o.batch_concurrency_ = 16;
        return o;
    }
}  // namespace relay::engine

#endif
