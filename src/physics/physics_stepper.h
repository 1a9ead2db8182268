#pragma once

#include "body.h"

#include <string_view>
#include <vector>

namespace OrbitView
{
    // ============================================================================
    // IPhysicsStepper: black-box fixed-timestep integrator over a set of bodies
    // ============================================================================

    class IPhysicsStepper
    {
    public:
        virtual ~IPhysicsStepper() = default;

        // Advance every body by one fixed timestep of dt() simulated seconds.
        virtual void step() = 0;

        virtual double dt() const = 0;
        virtual void set_dt(double dt_s) = 0;

        // Bodies keep stable addresses for the stepper's lifetime.
        virtual std::vector<Body> &bodies() = 0;
        virtual const std::vector<Body> &bodies() const = 0;

        Body *find_body(std::string_view id)
        {
            for (Body &b : bodies())
            {
                if (b.id == id)
                {
                    return &b;
                }
            }
            return nullptr;
        }

        const Body *find_body(std::string_view id) const
        {
            for (const Body &b : bodies())
            {
                if (b.id == id)
                {
                    return &b;
                }
            }
            return nullptr;
        }
    };
} // namespace OrbitView
