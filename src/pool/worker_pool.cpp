#include "worker_pool.hpp"

#include <condition_variable>
#include <exception>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../utils/constants.hpp"
#include "../utils/logger.hpp"

namespace relay::pool {
    namespace {
        constexpr std::string_view TAG = "pool";
    }

    WorkerPool::WorkerPool(TransportFactory factory) : factory_(std::move(factory)) {}

    WorkerPool::~WorkerPool() { close(); }

    void WorkerPool::initialize(std::size_t pool_size) {
        if (pool_size == 0 || pool_size > constants::MAX_POOL_SIZE) {
            throw error::RelayError(error::ErrorCode::INVALID_REQUEST,
                                    "Pool size must be between 1 and " + std::to_string(constants::MAX_POOL_SIZE) + ", got " + std::to_string(pool_size));
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            // Waits out a concurrent startup.
            startup_cv_.wait(lock, [this]() { return !starting_; });
            if (closed_) {
                throw error::RelayError(error::ErrorCode::ENGINE_SHUTDOWN, "Worker pool has been closed");
            }
            if (running_) {
                return;
            }
            starting_ = true;
            reported_ = 0;
            startup_error_.reset();
            stop_ = false;
        }

        std::size_t spawned = 0;
        std::optional<error::StructuredError> failure;
        try {
            threads_.reserve(pool_size);
            for (; spawned < pool_size; ++spawned) {
                threads_.emplace_back([this, spawned] { worker_loop(spawned); });
            }
        } catch (const std::exception& e) {
            failure = error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, std::string("Could not start worker threads: ") + e.what());
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            startup_cv_.wait(lock, [this, spawned]() { return reported_ == spawned; });
            if (!failure) {
                failure = startup_error_;
            }
            if (!failure) {
                size_ = pool_size;
                running_ = true;
                starting_ = false;
            } else {
                stop_ = true;
            }
        }

        if (failure) {
            condition_variable_.notify_all();
            join_all();
            threads_.clear();
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                starting_ = false;
            }
            startup_cv_.notify_all();
            log::error(TAG, "worker initialization failed: " + failure->message_);
            throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Worker failed to initialize: " + failure->message_, failure->details_);
        }

        startup_cv_.notify_all();
        log::info(TAG, "started " + std::to_string(pool_size) + " workers");
    }

    void WorkerPool::worker_loop(std::size_t id) {
        std::unique_ptr<transport::ITransport> transport;
        std::optional<error::StructuredError> failure;

        try {
            transport = factory_();
            if (transport == nullptr) {
                failure = error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Transport factory returned null");
            } else {
                failure = transport->init();
            }
        } catch (const error::RelayError& e) {
            failure = e.to_structured();
        } catch (const std::exception& e) {
            failure = error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, e.what());
        } catch (...) {
            failure = error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Transport setup threw a non-standard exception");
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            ++reported_;
            if (failure && !startup_error_) {
                startup_error_ = failure;
            }
        }
        startup_cv_.notify_all();

        if (failure) {
            if (transport != nullptr) {
                transport->shutdown();
            }
            return;
        }

        while (true) {
            Job job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                condition_variable_.wait(lock, [this]() { return !jobs_.empty() || stop_; });

                if (stop_ && jobs_.empty()) {
                    break;
                }

                job = std::move(jobs_.front());
                jobs_.pop();

                ++active_tasks_;
            }

            try {
                job.promise_.set_value(transport->execute(job.payload_, job.is_batch_, job.framing_));
            } catch (const std::exception& e) {
                log::warn(TAG, "worker " + std::to_string(id) + " job failed: " + e.what());
                job.promise_.set_exception(std::current_exception());
            } catch (...) {
                log::warn(TAG, "worker " + std::to_string(id) + " job failed with a non-standard exception");
                job.promise_.set_exception(std::current_exception());
            }

            --active_tasks_;
        }

        transport->shutdown();
        log::debug(TAG, "worker " + std::to_string(id) + " stopped");
    }

    std::future<nlohmann::json> WorkerPool::submit(nlohmann::json payload, bool is_batch, transport::Framing framing) {
        std::future<nlohmann::json> future;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (closed_) {
                throw error::RelayError(error::ErrorCode::ENGINE_SHUTDOWN, "Worker pool has been closed");
            }
            if (!running_) {
                throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, "Worker pool is not initialized");
            }

            Job job{.payload_ = std::move(payload), .is_batch_ = is_batch, .framing_ = framing, .promise_ = {}};
            future = job.promise_.get_future();
            jobs_.emplace(std::move(job));
        }

        condition_variable_.notify_one();
        return future;
    }

    nlohmann::json WorkerPool::run(nlohmann::json payload, bool is_batch, transport::Framing framing) {
        return submit(std::move(payload), is_batch, framing).get();
    }

    std::size_t WorkerPool::pending() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return jobs_.size();
    }

    void WorkerPool::close() {
        std::queue<Job> abandoned;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            startup_cv_.wait(lock, [this]() { return !starting_; });
            if (closed_) {
                return;
            }
            closed_ = true;
            running_ = false;
            stop_ = true;
            std::swap(abandoned, jobs_);
        }

        condition_variable_.notify_all();

        while (!abandoned.empty()) {
            abandoned.front().promise_.set_exception(
                std::make_exception_ptr(error::RelayError(error::ErrorCode::ENGINE_SHUTDOWN, "Worker pool closed before the request was dispatched")));
            abandoned.pop();
        }

        join_all();
        size_ = 0;
        log::info(TAG, "worker pool closed");
    }

    void WorkerPool::join_all() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }
}  // namespace relay::pool
