#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace cloudmover {

class ProgressObserver {
  public:
    virtual ~ProgressObserver() = default;

    // Called from worker threads after each completed part.
    virtual void on_progress(std::uint64_t transferred_bytes, std::uint64_t total_bytes) = 0;

    // Called once by the orchestrator after the workers have joined.
    virtual void on_finished(bool succeeded) { (void)succeeded; }
};

// Shared byte counter for one transfer.
class ProgressCounter {
  public:
    explicit ProgressCounter(std::uint64_t total_bytes, ProgressObserver *observer = nullptr);

    std::uint64_t add(std::uint64_t bytes);

    std::uint64_t transferred() const noexcept;

    std::uint64_t total() const noexcept;

  private:
    std::uint64_t total_;
    std::atomic<std::uint64_t> transferred_{0};
    ProgressObserver *observer_;
};

// Single-line progress bar, redrawn with '\r'.
class ConsoleProgress : public ProgressObserver {
  public:
    explicit ConsoleProgress(std::ostream &out, std::string label = "Moving");

    void on_progress(std::uint64_t transferred_bytes, std::uint64_t total_bytes) override;

    void on_finished(bool succeeded) override;

  private:
    void render(std::uint64_t transferred_bytes, std::uint64_t total_bytes);

    std::ostream &out_;
    std::string label_;
    std::mutex mutex_;
    std::uint64_t last_rendered_{0};
    bool drawn_{false};
    std::chrono::steady_clock::time_point started_;
};

} // namespace cloudmover
