// CaveGen Platform Layer
// timer.cpp - Timer implementation

#include <cavegen/core/logger.hpp>
#include <cavegen/platform/timer.hpp>

namespace cavegen::platform {

Timer::Timer() : start_(Clock::now()) {}

void Timer::reset() {
    start_ = Clock::now();
}

double Timer::elapsed_milliseconds() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
}

bool Timer::has_exceeded(double budget_ms) const {
    return elapsed_milliseconds() >= budget_ms;
}

ScopedTimer::ScopedTimer(const char* category, const char* name) : category_(category), name_(name) {}

ScopedTimer::~ScopedTimer() {
    CAVEGEN_LOG_TRACE(category_, "{} took {:.3f} ms", name_, timer_.elapsed_milliseconds());
}

}  // namespace cavegen::platform
