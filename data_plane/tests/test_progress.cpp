#include "cloudmover/progress.hpp"

#include <cassert>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

class RecordingObserver : public cloudmover::ProgressObserver {
  public:
    void on_progress(std::uint64_t transferred, std::uint64_t total) override {
        std::lock_guard<std::mutex> lock(mutex_);
        updates_.push_back(transferred);
        total_ = total;
    }

    void on_finished(bool succeeded) override {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        succeeded_ = succeeded;
    }

    std::vector<std::uint64_t> updates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return updates_;
    }

    std::uint64_t total() const { return total_; }

  private:
    mutable std::mutex mutex_;
    std::vector<std::uint64_t> updates_;
    std::uint64_t total_{0};
    bool finished_{false};
    bool succeeded_{false};
};

} // namespace

int main() {
    RecordingObserver observer;
    cloudmover::ProgressCounter counter(8000, &observer);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                counter.add(10);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    assert(counter.transferred() == 8000);
    assert(counter.total() == 8000);
    assert(observer.updates().size() == 800);
    assert(observer.total() == 8000);

    cloudmover::ProgressCounter silent(10);
    assert(silent.add(4) == 4);
    assert(silent.add(6) == 10);

    std::ostringstream out;
    cloudmover::ConsoleProgress console(out, "Moving");
    console.on_progress(50, 100);
    console.on_progress(25, 100); // stale update from a slower part
    console.on_progress(100, 100);
    console.on_finished(true);
    const auto rendered = out.str();
    assert(rendered.find("Moving:  50%") != std::string::npos);
    assert(rendered.find("Moving:  25%") == std::string::npos);
    assert(rendered.find("100%") != std::string::npos);
    assert(rendered.back() == '\n');

    return 0;
}
