#include "chunkswarm/core/WorkerPool.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    {
        WorkerPool pool(4);
        assert(pool.thread_count() == 4);
        std::atomic<int> counter{0};
        for (int i = 0; i < 100; ++i) {
            const bool queued = pool.submit([&counter]() { counter.fetch_add(1); });
            assert(queued);
        }

        // A throwing job does not take its worker down.
        assert(pool.submit([]() { throw std::runtime_error("boom"); }));
        assert(pool.submit([&counter]() { counter.fetch_add(1); }));

        // Shutdown runs everything already queued before joining.
        pool.shutdown();
        assert(counter.load() == 101);
        pool.shutdown();
    }

    {
        // One worker blocked on a gate, a backlog of one: the third job is refused.
        WorkerPool pool(1, 1, "bounded");
        std::mutex mutex;
        std::condition_variable cv;
        bool started = false;
        bool release = false;
        std::atomic<int> ran{0};

        assert(pool.submit([&]() {
            std::unique_lock lock(mutex);
            started = true;
            cv.notify_all();
            cv.wait(lock, [&]() { return release; });
            ran.fetch_add(1);
        }));
        {
            std::unique_lock lock(mutex);
            cv.wait(lock, [&]() { return started; });
        }
        assert(pool.submit([&]() { ran.fetch_add(1); }));
        assert(!pool.submit([&]() { ran.fetch_add(1); }));
        assert(pool.pending() == 1);

        {
            std::scoped_lock lock(mutex);
            release = true;
        }
        cv.notify_all();
        pool.shutdown();
        assert(ran.load() == 2);
        assert(!pool.submit([]() {}));
    }

    return 0;
}
