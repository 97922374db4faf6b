#include "response_cache.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../utils/constants.hpp"
#include "../utils/logger.hpp"
#include "../utils/string_utils.hpp"

namespace relay::cache {
    namespace {
        constexpr std::string_view TAG = "cache";
    }

    ResponseCache::ResponseCache(engine::CachePolicy policy) : policy_(policy), now_([] { return Clock::now(); }) {}

    bool ResponseCache::is_cacheable(const model::Request &req) { return string_utils::ieq(req.method_, "GET"); }

    std::string ResponseCache::cache_key(const model::Request &req) {
        if (req.cache_key_.has_value() && !req.cache_key_->empty()) {
            return *req.cache_key_;
        }
        // IMPROVEMENT: Include Vary request headers in the key.
        std::string key = string_utils::to_upper(req.method_) + " " + req.url_;
        for (const auto &[name, value] : req.query_params_) {
            key += (key.find('?') == std::string::npos) ? '?' : '&';
            key += name + "=" + value;
        }
        return key;
    }

    std::optional<model::Response> ResponseCache::probe(const model::Request &req) {
        if (!enabled() || !is_cacheable(req)) {
            return std::nullopt;
        }

        auto it = index_.find(cache_key(req));
        if (it == index_.end()) {
            return std::nullopt;
        }

        if (!fresh_enough(it->second->meta_)) {
            log::debug(TAG, "evicting stale entry " + it->first);
            entries_.erase(it->second);
            index_.erase(it);
            return std::nullopt;
        }

        entries_.splice(entries_.begin(), entries_, it->second);
        model::Response response = it->second->response_;
        response.cache_hit_ = true;
        response.elapsed_ms_ = 0;
        return response;
    }

    void ResponseCache::cache_response(const model::Request &req, const model::Response &resp) {
        if (!enabled() || !is_cacheable(req) || resp.status_code_ != 200) {
            return;
        }

        Meta meta{.unix_ts_s_ = now_s(), .cache_control_ = resp.header("cache-control").value_or("")};
        for (const auto &directive : string_utils::split_comma_delimited_string(meta.cache_control_)) {
            std::string trimmed = string_utils::trim(directive);
            if (string_utils::ieq_prefix(trimmed.c_str(), trimmed.size(), CacheControlKeys::NO_STORE_KEY)) {
                return;
            }
        }

        std::string key = cache_key(req);
        if (auto it = index_.find(key); it != index_.end()) {
            entries_.erase(it->second);
            index_.erase(it);
        }

        model::Response stored = resp;
        stored.cache_hit_ = false;
        entries_.push_front(Entry{.key_ = key, .response_ = std::move(stored), .meta_ = std::move(meta)});
        index_[key] = entries_.begin();
        evict_overflow();
    }

    bool ResponseCache::fresh_enough(const Meta &m) const {
        const std::int64_t age = std::max<std::int64_t>(now_s() - m.unix_ts_s_, 0);

        for (const auto &pair : string_utils::split_comma_delimited_string(m.cache_control_)) {
            std::string trimmed_pair = string_utils::trim(pair);

            if (string_utils::ieq_prefix(trimmed_pair.c_str(), trimmed_pair.size(), CacheControlKeys::NO_STORE_KEY)) {
                return false;
            }

            if (string_utils::ieq_prefix(trimmed_pair.c_str(), trimmed_pair.size(), CacheControlKeys::NO_CACHE_KEY)) {
                return age <= 0;
            }

            if (string_utils::ieq_prefix(trimmed_pair.c_str(), trimmed_pair.size(), CacheControlKeys::MAX_AGE_KEY)) {
                auto pos = trimmed_pair.find('=');
                if (pos != std::string::npos) {
                    std::string value_str = string_utils::trim(trimmed_pair.substr(pos + 1));
                    char *end = nullptr;
                    long max_age = std::strtol(value_str.c_str(), &end, constants::BASE_10);
                    if (*end == '\0' && max_age >= 0) {
                        return age <= std::min(policy_.ttl_s_, max_age);
                    }
                }
            }
        }

        return age <= policy_.ttl_s_;
    }

    void ResponseCache::clear() {
        entries_.clear();
        index_.clear();
    }

    std::int64_t ResponseCache::now_s() const {
        return std::chrono::duration_cast<std::chrono::seconds>(now_().time_since_epoch()).count();
    }

    void ResponseCache::evict_overflow() {
        while (entries_.size() > policy_.capacity_) {
            index_.erase(entries_.back().key_);
            entries_.pop_back();
        }
    }
}  // namespace relay::cache
