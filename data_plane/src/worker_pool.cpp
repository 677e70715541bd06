#include "cloudmover/worker_pool.hpp"

#include <stdexcept>
#include <utility>

namespace cloudmover {

WorkerPool::WorkerPool(std::size_t concurrency) : concurrency_(concurrency) {
    if (concurrency_ == 0) {
        throw std::invalid_argument("concurrency must be > 0");
    }
    threads_.reserve(concurrency_);
    for (std::size_t i = 0; i < concurrency_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_thread, this);
    }
}

WorkerPool::~WorkerPool() { wait_for_completion(); }

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::logic_error("worker pool is already stopping");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::wait_for_completion() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::size_t WorkerPool::concurrency() const noexcept { return concurrency_; }

void WorkerPool::worker_thread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace cloudmover
