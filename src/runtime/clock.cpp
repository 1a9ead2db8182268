#include "clock.h"

namespace OrbitView
{
    SteadyClock::SteadyClock()
    {
        _start_time = Clock::now();
    }

    double SteadyClock::elapsed_seconds() const
    {
        auto elapsed = std::chrono::duration<double>(Clock::now() - _start_time);
        return elapsed.count();
    }

    void SteadyClock::reset()
    {
        _start_time = Clock::now();
    }
} // namespace OrbitView
