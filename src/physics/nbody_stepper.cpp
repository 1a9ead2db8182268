#include "nbody_stepper.h"
#include "core/util/logger.h"

#include <cmath>
#include <stdexcept>

namespace OrbitView
{
    NBodyStepper::NBodyStepper(std::vector<Body> bodies)
        : NBodyStepper(std::move(bodies), Config{})
    {
    }

    NBodyStepper::NBodyStepper(std::vector<Body> bodies, const Config &config)
        : _bodies(std::move(bodies))
        , _config(config)
    {
        if (_bodies.empty())
        {
            throw std::invalid_argument("NBodyStepper requires at least one body");
        }
        if (!(_config.dt_s > 0.0))
        {
            throw std::invalid_argument("NBodyStepper dt must be positive");
        }

        _accelerations.resize(_bodies.size(), PhysicsVec2(0.0));
        compute_accelerations(_accelerations);

        Logger::debug("NBodyStepper: {} bodies, dt={}s", _bodies.size(), _config.dt_s);
    }

    void NBodyStepper::set_dt(double dt_s)
    {
        if (!(dt_s > 0.0) || !std::isfinite(dt_s))
        {
            Logger::warn("NBodyStepper: ignoring invalid dt {}", dt_s);
            return;
        }
        _config.dt_s = dt_s;
    }

    void NBodyStepper::compute_accelerations(std::vector<PhysicsVec2> &out) const
    {
        const size_t n = _bodies.size();
        for (size_t i = 0; i < n; ++i)
        {
            out[i] = PhysicsVec2(0.0);
        }

        // a_i += G * m_j * r_ij / |r_ij|^3, symmetric pairs
        for (size_t i = 0; i < n; ++i)
        {
            for (size_t j = i + 1; j < n; ++j)
            {
                const PhysicsVec2 r = _bodies[j].position_m - _bodies[i].position_m;
                const double r_sq = r.x * r.x + r.y * r.y + _config.softening_length_sq;
                const double r_len = std::sqrt(r_sq);
                const double inv_r3 = 1.0 / (r_sq * r_len);

                out[i] += r * (_config.gravitational_constant * _bodies[j].mass_kg * inv_r3);
                out[j] -= r * (_config.gravitational_constant * _bodies[i].mass_kg * inv_r3);
            }
        }
    }

    void NBodyStepper::step()
    {
        const double dt = _config.dt_s;
        const double half_dt = dt * 0.5;

        // v(t + dt/2), x(t + dt)
        for (size_t i = 0; i < _bodies.size(); ++i)
        {
            Body &b = _bodies[i];
            b.velocity_mps += _accelerations[i] * half_dt;
            b.position_m += b.velocity_mps * dt;
        }

        compute_accelerations(_accelerations);

        // v(t + dt)
        for (size_t i = 0; i < _bodies.size(); ++i)
        {
            _bodies[i].velocity_mps += _accelerations[i] * half_dt;
        }

        ++_step_count;
    }

    double NBodyStepper::total_energy() const
    {
        double kinetic = 0.0;
        double potential = 0.0;
        for (size_t i = 0; i < _bodies.size(); ++i)
        {
            const Body &a = _bodies[i];
            const double v = magnitude(a.velocity_mps);
            kinetic += 0.5 * a.mass_kg * v * v;

            for (size_t j = i + 1; j < _bodies.size(); ++j)
            {
                const Body &b = _bodies[j];
                const PhysicsVec2 r = b.position_m - a.position_m;
                const double r_len = std::sqrt(r.x * r.x + r.y * r.y + _config.softening_length_sq);
                potential -= _config.gravitational_constant * a.mass_kg * b.mass_kg / r_len;
            }
        }
        return kinetic + potential;
    }
} // namespace OrbitView
