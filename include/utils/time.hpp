#pragma once

#include <chrono>

namespace Twinscan {

/**
 * @brief High-resolution timer used for per-stage timings of a detection run.
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
     * @brief Elapsed milliseconds since last reset or construction (fractional).
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

} // namespace Twinscan
