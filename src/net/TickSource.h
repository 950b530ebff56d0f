#pragma once
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sock_scan {

// Periodic signal pacing filesystem syscalls. wait() is the only point at
// which a scan blocks.
class TickSource {
public:
    virtual ~TickSource() = default;
    virtual void wait() = 0;
};

// Ticks on fixed boundaries of the steady clock, starting one interval after
// construction. A tick missed because the caller was busy is dropped rather
// than delivered late, so a slow consumer never receives a burst.
class IntervalTicker : public TickSource {
public:
    explicit IntervalTicker(std::chrono::steady_clock::duration interval);

    void wait() override;
    size_t ticks() const { return ticks_; }

private:
    std::chrono::steady_clock::duration interval_;
    std::chrono::steady_clock::time_point next_;
    size_t ticks_ = 0;
};

class TickBudgetExceeded : public std::runtime_error {
public:
    explicit TickBudgetExceeded(const std::string& what) : std::runtime_error(what) {}
};

// Imposes a deadline on a scan from the outside: once the deadline has
// passed, wait() throws TickBudgetExceeded instead of ticking.
class BoundedTicker : public TickSource {
public:
    BoundedTicker(TickSource& inner, std::chrono::steady_clock::time_point deadline);

    void wait() override;

private:
    TickSource& inner_;
    std::chrono::steady_clock::time_point deadline_;
};

}
