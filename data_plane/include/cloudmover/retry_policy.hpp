#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace cloudmover {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Per-part retry limits with linear backoff.
class RetryPolicy {
  public:
    explicit RetryPolicy(std::uint32_t max_attempts = 3,
                         std::chrono::milliseconds base_delay = std::chrono::seconds(1));

    std::uint32_t max_attempts() const noexcept;

    std::chrono::milliseconds base_delay() const noexcept;

    // Delay after the given (1-based) failed attempt: failed_attempt * base_delay.
    std::chrono::milliseconds backoff(std::uint32_t failed_attempt) const noexcept;

    bool should_retry(std::uint32_t failed_attempt) const noexcept;

  private:
    std::uint32_t max_attempts_;
    std::chrono::milliseconds base_delay_;
};

// Blocks the calling thread; used unless a test injects its own sleeper.
void sleep_for(std::chrono::milliseconds delay);

} // namespace cloudmover
