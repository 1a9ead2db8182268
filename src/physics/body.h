#pragma once

#include <core/world.h>

#include <string>

namespace OrbitView
{
    // ============================================================================
    // Body: one massive body advanced by a physics stepper.
    // Owned by the stepper; the render loop only reads position/velocity.
    // ============================================================================

    struct Body
    {
        std::string id;
        std::string name;
        double mass_kg{0.0};
        PhysicsVec2 position_m{0.0, 0.0};
        PhysicsVec2 velocity_mps{0.0, 0.0};
        double radius_m{0.0};
        std::string color{"#FFFFFF"};
    };
} // namespace OrbitView
