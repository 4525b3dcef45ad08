// src/worker.hpp
// Background worker threads: job queue with future-based completion.

#pragma once

#include "spamc/error.hpp"
#include "spamc/message.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace spamc {

// Fixed set of threads draining one FIFO queue. Each job's result, or the
// exception it threw, lands in the future returned by submit().
class Worker {
public:
    using Job = std::function<Response()>;

    explicit Worker(size_t threads);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Queue a job. Throws SpamcError (Closed) after shutdown().
    std::future<Response> submit(Job job);

    // Stop accepting jobs, run what is already queued, join the threads.
    // Called from a job, the calling thread is left for the destructor to
    // join, so the Worker must then be destroyed from another thread.
    void shutdown();

    size_t threads() const noexcept { return thread_count_; }
    size_t pending() const;

private:
    void run();

    std::vector<std::thread> threads_;
    size_t thread_count_ = 0;

    // Channel
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::packaged_task<Response()>> queue_;
    bool running_ = true;
};

} // namespace spamc
