#pragma once

// Real-time sources for the render loop.

#include <chrono>

namespace OrbitView
{
    class IClock
    {
    public:
        virtual ~IClock() = default;

        // Seconds since the clock started. Monotonic.
        virtual double elapsed_seconds() const = 0;
    };

    class SteadyClock : public IClock
    {
    public:
        SteadyClock();

        double elapsed_seconds() const override;

        // Restart counting from zero.
        void reset();

    private:
        using Clock = std::chrono::steady_clock;
        using TimePoint = std::chrono::time_point<Clock>;

        TimePoint _start_time;
    };

    // Time advanced by hand; used by tests and offline playback.
    class ManualClock : public IClock
    {
    public:
        double elapsed_seconds() const override { return _now; }

        void set(double seconds) { _now = seconds; }
        void advance(double seconds) { _now += seconds; }

    private:
        double _now{0.0};
    };
} // namespace OrbitView
