#ifndef HTTP_RELAY_RESPONSE_CACHE_HPP
#define HTTP_RELAY_RESPONSE_CACHE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

#include "../engine/engine_options.hpp"
#include "../model/model.hpp"

namespace relay::cache {
    struct CacheControlKeys {
        static constexpr const char *MAX_AGE_KEY = "max-age";
        static constexpr const char *NO_CACHE_KEY = "no-cache";
        static constexpr const char *NO_STORE_KEY = "no-store";
    };

    // In-memory LRU of successful GET responses. Owned by a single engine and
    // never touched by two threads at once.
    class ResponseCache {
       public:
        using Clock = std::chrono::system_clock;

        struct Meta {
            std::int64_t unix_ts_s_ = 0;
            std::string cache_control_;
        };

        explicit ResponseCache(engine::CachePolicy policy);

        ~ResponseCache() = default;
        ResponseCache(const ResponseCache &) = delete;
        ResponseCache &operator=(const ResponseCache &) = delete;
        ResponseCache(ResponseCache &&) = delete;
        ResponseCache &operator=(ResponseCache &&) = delete;

        [[nodiscard]] bool enabled() const { return policy_.enable_caching_ && policy_.capacity_ > 0; }
        [[nodiscard]] static bool is_cacheable(const model::Request &req);
        [[nodiscard]] static std::string cache_key(const model::Request &req);

        // Returns a fresh entry marked as a cache hit; stale entries are evicted.
        [[nodiscard]] std::optional<model::Response> probe(const model::Request &req);
        void cache_response(const model::Request &req, const model::Response &resp);
        [[nodiscard]] bool fresh_enough(const Meta &meta) const;
        [[nodiscard]] std::size_t size() const { return entries_.size(); }
        void clear();

        // Test seam for freshness checks.
        void set_clock(std::function<Clock::time_point()> now) { now_ = std::move(now); }

       private:
        struct Entry {
            std::string key_;
            model::Response response_;
            Meta meta_;
        };

        engine::CachePolicy policy_;
        std::list<Entry> entries_;  // most recently used first
        std::unordered_map<std::string, std::list<Entry>::iterator> index_;
        std::function<Clock::time_point()> now_;

        [[nodiscard]] std::int64_t now_s() const;
        void evict_overflow();
    };
}  // namespace relay::cache

#endif
