#include "cloudmover/retry_policy.hpp"

#include <stdexcept>
#include <thread>

namespace cloudmover {

RetryPolicy::RetryPolicy(std::uint32_t max_attempts, std::chrono::milliseconds base_delay)
    : max_attempts_(max_attempts), base_delay_(base_delay) {
    if (max_attempts_ == 0) {
        throw std::invalid_argument("max attempts must be > 0");
    }
    if (base_delay_.count() < 0) {
        throw std::invalid_argument("base delay must not be negative");
    }
}

std::uint32_t RetryPolicy::max_attempts() const noexcept { return max_attempts_; }

std::chrono::milliseconds RetryPolicy::base_delay() const noexcept { return base_delay_; }

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t failed_attempt) const noexcept {
    return base_delay_ * failed_attempt;
}

bool RetryPolicy::should_retry(std::uint32_t failed_attempt) const noexcept {
    return failed_attempt < max_attempts_;
}

void sleep_for(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

} // namespace cloudmover
