#include "simulation_clock.h"
#include "physics/physics_stepper.h"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>

namespace OrbitView
{
    SimulationClock::SimulationClock()
        : SimulationClock(Config{})
    {
    }

    SimulationClock::SimulationClock(const Config &config)
        : _config(config)
    {
        if (!std::isfinite(config.physics_interval_s) || !(config.physics_interval_s > 0.0))
        {
            throw std::invalid_argument(fmt::format("physics interval must be positive, got {}",
                                                    config.physics_interval_s));
        }
        if (config.trail_every_n_frames == 0)
        {
            throw std::invalid_argument("trail cadence must be at least one frame");
        }
    }

    bool SimulationClock::should_step_physics(double current_time) const
    {
        return current_time - _last_physics_update >= _config.physics_interval_s;
    }

    bool SimulationClock::try_step_physics(double current_time, IPhysicsStepper &stepper)
    {
        if (!should_step_physics(current_time))
        {
            return false;
        }

        stepper.step();
        record_physics_step(current_time, stepper.dt());
        return true;
    }

    void SimulationClock::record_physics_step(double current_time, double dt_s)
    {
        _simulation_time += dt_s;
        _last_physics_update = current_time;
        ++_physics_steps;
    }

    bool SimulationClock::tick_trail_counter()
    {
        ++_trail_sample_counter;
        return _trail_sample_counter % _config.trail_every_n_frames == 0;
    }
} // namespace OrbitView
