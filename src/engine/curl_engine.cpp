#include "curl_engine.hpp"

#include <curl/curl.h>
#include <simdjson.h>

#include <algorithm>
#include <deque>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "../utils/logger.hpp"
#include "curl_transfer.hpp"

using namespace std::chrono;

namespace relay::engine {
    namespace {
        constexpr std::string_view TAG = "engine";

        struct Active {
            std::unique_ptr<CurlTransfer> transfer_;
            std::size_t index_ = 0;
            std::size_t attempt_ = 1;
        };

        // Detaches every in-flight easy handle before the transfers are destroyed.
        struct ActiveTransfers {
            CURLM* multi_;
            std::unordered_map<CURL*, Active> map_;

            explicit ActiveTransfers(CURLM* multi) : multi_(multi) {}
            ~ActiveTransfers() {
                for (auto& [easy, active] : map_) {
                    curl_multi_remove_handle(multi_, easy);
                }
            }
            ActiveTransfers(const ActiveTransfers&) = delete;
            ActiveTransfers& operator=(const ActiveTransfers&) = delete;
            ActiveTransfers(ActiveTransfers&&) = delete;
            ActiveTransfers& operator=(ActiveTransfers&&) = delete;
        };
    }  // namespace

    CurlEngine::CurlEngine(EngineOptions options) : options_(std::move(options)), cache_(options_.cache_), rng_(std::random_device{}()) {}

    CurlEngine::~CurlEngine() { shutdown(); }

    std::optional<error::StructuredError> CurlEngine::init() {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (state_) {
            case State::READY:
                return std::nullopt;
            case State::FAILED:
                return init_error_;
            case State::SHUT_DOWN:
                return error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "Engine has been shut down");
            case State::CREATED:
                break;
        }

        try {
            global_ = std::make_unique<CurlGlobal>();
        } catch (const error::RelayError& e) {
            init_error_ = e.to_structured();
            state_ = State::FAILED;
            log::error(TAG, e.what());
            return init_error_;
        }

        multi_ = curl_multi_init();
        if (multi_ == nullptr) {
            global_.reset();
            init_error_ = error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Failed to create CURL multi handle");
            state_ = State::FAILED;
            log::error(TAG, init_error_->message_);
            return init_error_;
        }

        curl_multi_setopt(multi_, CURLMOPT_MAXCONNECTS, options_.max_connections_);
        curl_multi_setopt(multi_, CURLMOPT_MAX_HOST_CONNECTIONS, options_.max_host_connections_);
        curl_multi_setopt(multi_, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);

        state_ = State::READY;
        log::debug(TAG, "engine initialized, batch concurrency " + std::to_string(options_.batch_concurrency_));
        return std::nullopt;
    }

    void CurlEngine::shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == State::SHUT_DOWN) {
            return;
        }

        release_multi();
        cache_.clear();
        state_ = State::SHUT_DOWN;
        log::debug(TAG, "engine shut down");
    }

    void CurlEngine::release_multi() {
        if (multi_ != nullptr) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        global_.reset();
    }

    std::optional<error::StructuredError> CurlEngine::check_ready() const {
        switch (state_) {
            case State::READY:
                return std::nullopt;
            case State::SHUT_DOWN:
                return error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "Engine has been shut down");
            case State::CREATED:
            case State::FAILED:
                break;
        }
        return error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Engine is not initialized");
    }

    model::ExecutionResult CurlEngine::execute_one(const model::Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto not_ready = check_ready()) {
            return *not_ready;
        }

        auto results = run_transfers({request});
        return std::move(results.front());
    }

    std::vector<model::ExecutionResult> CurlEngine::execute_batch(const std::vector<model::Request>& requests) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto not_ready = check_ready()) {
            return std::vector<model::ExecutionResult>(requests.size(), *not_ready);
        }

        return run_transfers(requests);
    }

    bool CurlEngine::should_retry(const model::Request& request, const model::ExecutionResult& result, std::size_t attempt) const {
        if (attempt >= options_.retry_.max_tries_ || !model::is_idempotent_method(request.method_)) {
            return false;
        }

        if (const auto* response = std::get_if<model::Response>(&result)) {
            return is_retryable_http(response->status_code_);
        }

        const auto& err = std::get<error::StructuredError>(result);
        return err.code_ == error::ErrorCode::NETWORK_ERROR || err.code_ == error::ErrorCode::TIMEOUT_ERROR;
    }

    milliseconds CurlEngine::get_retry_delay(std::size_t attempt) {
        const auto& p = options_.retry_;
        milliseconds delay = p.base_delay_;
        for (std::size_t i = 1; i < attempt && delay < p.max_delay_; ++i) {
            delay *= 2;
        }
        delay = std::min(delay, p.max_delay_);

        std::uniform_int_distribution<long> jitter(0, static_cast<long>(p.base_delay_.count()));
        return delay + milliseconds{jitter(rng_)};
    }

    void CurlEngine::attach_parsed_data(const model::Request& request, model::Response& response) {
        if (!request.parse_response_) {
            return;
        }

        simdjson::dom::element doc;
        auto err = parser_.parse(response.body_).get(doc);
        if (err != simdjson::SUCCESS) {
            log::debug(TAG, std::string("body is not JSON, parsedData omitted: ") + simdjson::error_message(err));
            return;
        }

        response.parsed_data_ = simdjson::minify(doc);
    }

    std::vector<model::ExecutionResult> CurlEngine::run_transfers(const std::vector<model::Request>& requests) {
        std::vector<std::optional<model::ExecutionResult>> results(requests.size());
        std::deque<Pending> queue;
        const auto started = steady_clock::now();

        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (auto invalid = model::validate(requests[i])) {
                results[i] = std::move(*invalid);
                continue;
            }
            if (auto hit = cache_.probe(requests[i])) {
                log::debug(TAG, "cache hit " + requests[i].url_);
                results[i] = std::move(*hit);
                continue;
            }
            queue.push_back(Pending{.index_ = i, .attempt_ = 1, .ready_at_ = started});
        }

        const std::size_t limit = std::max<std::size_t>(options_.batch_concurrency_, 1);
        ActiveTransfers active(multi_);

        auto launch = [&](const Pending& slot) {
            const auto& request = requests[slot.index_];
            try {
                auto transfer = std::make_unique<CurlTransfer>(request, options_);
                transfer->start();
                const CURLMcode mc = curl_multi_add_handle(multi_, transfer->handle());
                if (mc != CURLM_OK) {
                    results[slot.index_] = error::make_error(error::ErrorCode::UNKNOWN_ERROR, std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
                    return;
                }
                CURL* easy = transfer->handle();
                active.map_.emplace(easy, Active{.transfer_ = std::move(transfer), .index_ = slot.index_, .attempt_ = slot.attempt_});
            } catch (const error::RelayError& e) {
                results[slot.index_] = e.to_structured();
            }
        };

        auto complete = [&](CURL* easy, CURLcode rc) {
            auto it = active.map_.find(easy);
            if (it == active.map_.end()) {
                return;
            }

            curl_multi_remove_handle(multi_, easy);
            Active done = std::move(it->second);
            active.map_.erase(it);

            const auto& request = requests[done.index_];
            model::ExecutionResult result = done.transfer_->finish(rc);

            if (should_retry(request, result, done.attempt_)) {
                const auto delay = get_retry_delay(done.attempt_);
                log::warn(TAG, "retrying " + request.url_ + " (attempt " + std::to_string(done.attempt_ + 1) + ") in " + std::to_string(delay.count()) + "ms");
                queue.push_back(Pending{.index_ = done.index_, .attempt_ = done.attempt_ + 1, .ready_at_ = steady_clock::now() + delay});
                return;
            }

            if (auto* response = std::get_if<model::Response>(&result)) {
                attach_parsed_data(request, *response);
                cache_.cache_response(request, *response);
            } else {
                log::debug(TAG, request.url_ + " failed: " + std::get<error::StructuredError>(result).message_);
            }

            results[done.index_] = std::move(result);
        };

        while (!queue.empty() || !active.map_.empty()) {
            const auto now = steady_clock::now();

            for (auto it = queue.begin(); it != queue.end() && active.map_.size() < limit;) {
                if (it->ready_at_ > now) {
                    ++it;
                    continue;
                }
                Pending slot = *it;
                it = queue.erase(it);
                launch(slot);
            }

            auto earliest_ready = steady_clock::time_point::max();
            for (const auto& slot : queue) {
                earliest_ready = std::min(earliest_ready, slot.ready_at_);
            }

            if (active.map_.empty()) {
                if (!queue.empty()) {
                    // Only backoff delays remain; nothing else is in flight.
                    std::this_thread::sleep_until(earliest_ready);
                }
                continue;
            }

            int running = 0;
            const CURLMcode mc = curl_multi_perform(multi_, &running);
            if (mc != CURLM_OK) {
                const auto failure = error::make_error(error::ErrorCode::UNKNOWN_ERROR, std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc));
                log::error(TAG, failure.message_);
                for (auto& [easy, transfer] : active.map_) {
                    curl_multi_remove_handle(multi_, easy);
                    results[transfer.index_] = failure;
                }
                active.map_.clear();
                continue;
            }

            CURLMsg* msg = nullptr;
            int msgs_left = 0;
            while ((msg = curl_multi_info_read(multi_, &msgs_left)) != nullptr) {
                if (msg->msg == CURLMSG_DONE) {
                    complete(msg->easy_handle, msg->data.result);
                }
            }

            if (running > 0) {
                int wait_ms = MULTI_WAIT_MAX_MS;
                if (!queue.empty() && active.map_.size() < limit) {
                    const auto until_ready = duration_cast<milliseconds>(earliest_ready - steady_clock::now()).count();
                    wait_ms = static_cast<int>(std::clamp<long long>(until_ready, 0, MULTI_WAIT_MAX_MS));
                }
                curl_multi_wait(multi_, nullptr, 0, wait_ms, nullptr);
            }
        }

        std::vector<model::ExecutionResult> out;
        out.reserve(results.size());
        for (auto& result : results) {
            if (result.has_value()) {
                out.push_back(std::move(*result));
            } else {
                out.emplace_back(error::make_error(error::ErrorCode::UNKNOWN_ERROR, "Transfer produced no result"));
            }
        }
        return out;
    }
}  // namespace relay::engine
