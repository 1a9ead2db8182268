#pragma once

#include "physics_stepper.h"
#include <core/config.h>

#include <cstdint>
#include <vector>

namespace OrbitView
{
    // ============================================================================
    // NBodyStepper: pairwise Newtonian gravity, velocity Verlet integration.
    //
    // The body set is fixed at construction. Accelerations are cached between
    // steps so each step costs one force evaluation.
    // ============================================================================

    class NBodyStepper : public IPhysicsStepper
    {
    public:
        struct Config
        {
            double dt_s{kDefaultPhysicsDtSeconds};
            double gravitational_constant{kGravitationalConstant};
            double softening_length_sq{kSofteningLengthSquared};
        };

        // Throws std::invalid_argument for an empty body list or a non-positive dt.
        explicit NBodyStepper(std::vector<Body> bodies);
        NBodyStepper(std::vector<Body> bodies, const Config &config);

        void step() override;

        double dt() const override { return _config.dt_s; }
        void set_dt(double dt_s) override;

        std::vector<Body> &bodies() override { return _bodies; }
        const std::vector<Body> &bodies() const override { return _bodies; }

        uint64_t step_count() const { return _step_count; }
        double gravitational_constant() const { return _config.gravitational_constant; }

        // Total kinetic + potential energy, for drift checks.
        double total_energy() const;

    private:
        void compute_accelerations(std::vector<PhysicsVec2> &out) const;

        std::vector<Body> _bodies;
        std::vector<PhysicsVec2> _accelerations;
        Config _config{};
        uint64_t _step_count{0};
    };
} // namespace OrbitView
