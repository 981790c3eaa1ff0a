#include "chunkswarm/core/WorkerPool.hpp"

#include "chunkswarm/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace chunkswarm {

WorkerPool::WorkerPool(std::size_t thread_count, std::size_t max_pending, std::string name)
    : name_(std::move(name)),
      max_pending_(max_pending) {
    const auto count = std::max<std::size_t>(thread_count, 1);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (max_pending_ > 0 && queue_.size() >= max_pending_) {
            return false;
        }
        queue_.push_back(std::move(job));
    }
    work_available_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    work_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t WorkerPool::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& ex) {
            daemon::log_event(daemon::StructuredLogger::Level::Error,
                              "worker.job.failed",
                              {{"pool", name_}, {"error", ex.what()}});
        }
    }
}

}  // namespace chunkswarm
