// CaveGen Platform Layer
// timer.hpp - Stage stopwatch and scoped trace timing

#pragma once

#include <chrono>

namespace cavegen::platform {

// Steady-clock stopwatch for stage timings and the connectivity fallback budget
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer();

    void reset();

    [[nodiscard]] double elapsed_milliseconds() const;

    // True once at least budget_ms has elapsed
    [[nodiscard]] bool has_exceeded(double budget_ms) const;

private:
    Clock::time_point start_;
};

// Logs the lifetime of a scope at trace level under the given log category
class ScopedTimer {
public:
    ScopedTimer(const char* category, const char* name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* category_;
    const char* name_;
    Timer timer_;
};

#define CAVEGEN_CONCAT_IMPL(a, b) a##b
#define CAVEGEN_CONCAT(a, b) CAVEGEN_CONCAT_IMPL(a, b)

#define CAVEGEN_SCOPED_TIMER(category, name) \
    ::cavegen::platform::ScopedTimer CAVEGEN_CONCAT(scoped_timer_, __LINE__)(category, name)

}  // namespace cavegen::platform
