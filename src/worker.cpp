// src/worker.cpp
// Background worker threads implementation.

#include "worker.hpp"

#include <spdlog/spdlog.h>

namespace spamc {

Worker::Worker(size_t threads) {
    if (threads == 0) threads = 1;
    thread_count_ = threads;
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        threads_.emplace_back(&Worker::run, this);
    }
}

Worker::~Worker() {
    shutdown();
}

std::future<Response> Worker::submit(Job job) {
    std::packaged_task<Response()> task(std::move(job));
    auto f = task.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) throw SpamcError::closed();
        queue_.push(std::move(task));
    }
    cv_.notify_one();
    return f;
}

void Worker::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        std::swap(threads, threads_);
    }
    if (threads.empty()) return;
    cv_.notify_all();

    size_t joined = 0;
    std::vector<std::thread> remaining;
    for (auto& t : threads) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            // Called from inside a job. This thread leaves run() once the
            // queue drains; a later shutdown() or the destructor joins it.
            remaining.push_back(std::move(t));
            continue;
        }
        t.join();
        joined++;
    }
    if (!remaining.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& t : remaining) threads_.push_back(std::move(t));
    }
    spdlog::debug("spamc: worker stopped, {} threads joined", joined);
}

size_t Worker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Worker::run() {
    for (;;) {
        std::packaged_task<Response()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            // Queued work still runs after shutdown; exit once drained.
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores the job's exception in its future.
        task();
    }
}

} // namespace spamc
