#pragma once

#include <chrono>
#include <sstream>
#include <iomanip>
#include <string>

namespace Roster {

/**
 * @brief Steady-clock stopwatch used to time statements and pipeline steps.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Elapsed milliseconds since construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Elapsed time for log lines, e.g. "12.4 ms".
     */
    std::string elapsed_str() const {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << elapsed_ms() << " ms";
        return ss.str();
    }

private:
    TimePoint start_;
};

} // namespace Roster
