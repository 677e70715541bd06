#include "cloudmover/progress.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace cloudmover {

namespace {

constexpr std::size_t bar_width = 30;

std::string human_bytes(double bytes) {
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        bytes /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << bytes << units[unit];
    return oss.str();
}

} // namespace

ProgressCounter::ProgressCounter(std::uint64_t total_bytes, ProgressObserver *observer)
    : total_(total_bytes), observer_(observer) {}

std::uint64_t ProgressCounter::add(std::uint64_t bytes) {
    const auto now = transferred_.fetch_add(bytes, std::memory_order_relaxed) + bytes;
    if (observer_ != nullptr) {
        observer_->on_progress(now, total_);
    }
    return now;
}

std::uint64_t ProgressCounter::transferred() const noexcept {
    return transferred_.load(std::memory_order_relaxed);
}

std::uint64_t ProgressCounter::total() const noexcept { return total_; }

ConsoleProgress::ConsoleProgress(std::ostream &out, std::string label)
    : out_(out), label_(std::move(label)), started_(std::chrono::steady_clock::now()) {}

void ConsoleProgress::on_progress(std::uint64_t transferred_bytes, std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Parts finish out of order; never move the bar backwards.
    if (transferred_bytes < last_rendered_) {
        return;
    }
    last_rendered_ = transferred_bytes;
    render(transferred_bytes, total_bytes);
}

void ConsoleProgress::on_finished(bool succeeded) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
        out_ << (succeeded ? "" : " (failed)") << std::endl;
        drawn_ = false;
    }
}

void ConsoleProgress::render(std::uint64_t transferred_bytes, std::uint64_t total_bytes) {
    const double fraction = total_bytes == 0
                                ? 1.0
                                : std::min(1.0, static_cast<double>(transferred_bytes) /
                                                    static_cast<double>(total_bytes));
    const auto filled = static_cast<std::size_t>(fraction * bar_width);
    const auto elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    const double rate = elapsed > 0.0 ? static_cast<double>(transferred_bytes) / elapsed : 0.0;

    out_ << '\r' << label_ << ": " << std::setw(3) << static_cast<int>(fraction * 100.0) << "% |"
         << std::string(filled, '#') << std::string(bar_width - filled, ' ') << "| "
         << human_bytes(static_cast<double>(transferred_bytes)) << '/'
         << human_bytes(static_cast<double>(total_bytes)) << " [" << human_bytes(rate) << "/s]"
         << std::flush;
    drawn_ = true;
}

} // namespace cloudmover
