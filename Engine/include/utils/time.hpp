#pragma once

#include <chrono>

namespace Lexigraph {

/**
 * @brief Steady-clock stopwatch used for load reports.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Fractional milliseconds since construction or the last reset().
     */
    double elapsed_ms() const {
        return ms_since(start_);
    }

    static double ms_since(TimePoint start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

private:
    TimePoint start_;
};

} // namespace Lexigraph
