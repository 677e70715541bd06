#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace cloudmover {

// Fixed-size pool of threads draining a FIFO task queue. Tasks must not throw.
class WorkerPool {
  public:
    explicit WorkerPool(std::size_t concurrency);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void submit(std::function<void()> task);

    // Runs every queued task, then joins the threads. No submits afterwards.
    void wait_for_completion();

    std::size_t concurrency() const noexcept;

  private:
    void worker_thread();

    std::size_t concurrency_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> tasks_;
    bool stop_{false};
    std::vector<std::thread> threads_;
};

} // namespace cloudmover
