#pragma once

// SimulationClock: two cadences gated against one real-time input.
//
// Physics: at most one stepper step per check, once `physics_interval_s` of real
// time has passed since the last step. Stalls are not backfilled.
// Trails: a frame counter; every `trail_every_n_frames`-th frame samples trails.

#include <core/config.h>

#include <cstdint>

namespace OrbitView
{
    class IPhysicsStepper;

    class SimulationClock
    {
    public:
        struct Config
        {
            double physics_interval_s{kDefaultPhysicsIntervalSeconds};
            uint32_t trail_every_n_frames{kDefaultTrailEveryNFrames};
        };

        // Throws std::invalid_argument for a non-positive interval or a zero frame count.
        SimulationClock();
        explicit SimulationClock(const Config &config);

        // True when the physics cadence is due at `current_time` (real seconds).
        bool should_step_physics(double current_time) const;

        // Steps `stepper` once if due and records the step. Returns whether it stepped.
        bool try_step_physics(double current_time, IPhysicsStepper &stepper);

        // Bookkeeping after an external step of `dt_s` simulated seconds.
        void record_physics_step(double current_time, double dt_s);

        // Counts one rendered frame. Returns true on frames that sample trails.
        bool tick_trail_counter();

        double last_physics_update() const { return _last_physics_update; }
        double simulation_time() const { return _simulation_time; }
        uint64_t trail_sample_counter() const { return _trail_sample_counter; }
        uint64_t physics_steps() const { return _physics_steps; }
        const Config &config() const { return _config; }

    private:
        Config _config{};

        double _last_physics_update{0.0};
        double _simulation_time{0.0};
        uint64_t _trail_sample_counter{0};
        uint64_t _physics_steps{0};
    };
} // namespace OrbitView
