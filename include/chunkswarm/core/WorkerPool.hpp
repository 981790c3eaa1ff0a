#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkswarm {

// Fixed set of threads draining a FIFO job queue. max_pending == 0 leaves the queue unbounded.
class WorkerPool {
public:
    using Job = std::function<void()>;

    WorkerPool(std::size_t thread_count, std::size_t max_pending = 0, std::string name = "pool");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false when the pool is shutting down or the queue is full.
    [[nodiscard]] bool submit(Job job);

    // Runs already-queued jobs, then joins the threads. Idempotent.
    void shutdown();

    std::size_t pending() const;
    std::size_t thread_count() const noexcept { return workers_.size(); }

private:
    void worker_loop();

    std::string name_;
    std::size_t max_pending_{0};
    std::vector<std::thread> workers_;
    std::deque<Job> queue_;
    bool stopping_{false};
    mutable std::mutex mutex_;
    std::condition_variable work_available_;
};

}  // namespace chunkswarm
