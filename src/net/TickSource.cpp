#include "TickSource.h"
#include <thread>

namespace sock_scan {

IntervalTicker::IntervalTicker(std::chrono::steady_clock::duration interval)
    : interval_(interval), next_(std::chrono::steady_clock::now() + interval) {}

void IntervalTicker::wait() {
    auto now = std::chrono::steady_clock::now();
    if (now < next_) {
        std::this_thread::sleep_until(next_);
        next_ += interval_;
    } else if (interval_.count() > 0) {
        // Late: consume the pending tick and realign to the grid.
        auto missed = (now - next_) / interval_;
        next_ += interval_ * (missed + 1);
    }
    ++ticks_;
}

BoundedTicker::BoundedTicker(TickSource& inner, std::chrono::steady_clock::time_point deadline)
    : inner_(inner), deadline_(deadline) {}

void BoundedTicker::wait() {
    if (std::chrono::steady_clock::now() >= deadline_) {
        throw TickBudgetExceeded("scan exceeded its time budget");
    }
    inner_.wait();
}

}
