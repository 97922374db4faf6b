#ifndef HTTP_RELAY_WORKER_POOL_HPP
#define HTTP_RELAY_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

#include "../error/relay_error.hpp"
#include "../transport/interface.hpp"

namespace relay::pool {
    // Called once on each worker thread; the transport never leaves that thread.
    using TransportFactory = std::function<std::unique_ptr<transport::ITransport>()>;

    class WorkerPool {
       public:
        explicit WorkerPool(TransportFactory factory);

        ~WorkerPool();
        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        // Blocks until every worker has built and initialized its transport.
        // Throws RelayError(ENGINE_NOT_INITIALIZED) if any of them fails.
        void initialize(std::size_t pool_size);

        // FIFO: the next free worker takes the oldest job.
        std::future<nlohmann::json> submit(nlohmann::json payload, bool is_batch, transport::Framing framing);
        nlohmann::json run(nlohmann::json payload, bool is_batch, transport::Framing framing);

        // Fails queued jobs with ENGINE_SHUTDOWN, lets in-flight jobs finish and joins the workers.
        void close();

        [[nodiscard]] std::size_t size() const { return size_; }
        [[nodiscard]] std::size_t busy_workers() const { return active_tasks_; }
        [[nodiscard]] std::size_t pending() const;
        [[nodiscard]] bool is_running() const { return running_; }

       private:
        struct Job {
            nlohmann::json payload_;
            bool is_batch_ = false;
            transport::Framing framing_ = transport::Framing::ENCODED;
            std::promise<nlohmann::json> promise_;
        };

        TransportFactory factory_;

        std::vector<std::thread> threads_;
        std::queue<Job> jobs_;
        mutable std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::atomic<bool> stop_ = false;
        std::atomic<bool> running_ = false;
        bool closed_ = false;
        std::atomic<size_t> active_tasks_ = 0;
        std::atomic<size_t> size_ = 0;

        std::condition_variable startup_cv_;
        std::size_t reported_ = 0;
        bool starting_ = false;
        std::optional<error::StructuredError> startup_error_;

        void worker_loop(std::size_t id);
        void join_all();
    };
}  // namespace relay::pool

#endif
