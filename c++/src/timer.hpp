#pragma once

#include <chrono>
#include <string>

#include <fmt/core.h>

// Stopwatch for log lines and throughput.
class Timer {

  public:
    using clock = std::chrono::steady_clock;
    using duration = typename std::chrono::milliseconds::rep;

    /**
     * Returns the number of milliseconds elapsed since the creation
     * of the timer, or since the last lap_seconds()
     */
    duration get_millis() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   clock::now() - t0)
            .count();
    }

    // Returns the elapsed time in [s] and restarts the timer.
    double lap_seconds()
    {
        auto now = clock::now();
        auto seconds = std::chrono::duration<double>(now - t0).count();
        t0 = now;
        return seconds;
    }

    std::string get_fmt() const { return format(get_millis()); }

    static std::string format(duration millis)
    {
        if (millis < 1000)
        {
            return fmt::format("{} [ms]", millis);
        }
        return fmt::format("{:.2f} [s]", millis / 1000.f);
    }

  private:
    clock::time_point t0{clock::now()};
};
