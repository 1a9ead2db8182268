#pragma once

#include "body.h"

namespace OrbitView
{
    struct BodySpec
    {
        std::string id;
        std::string name;
        double mass_kg{0.0};
        PhysicsVec2 position_m{0.0, 0.0};
        PhysicsVec2 velocity_mps{0.0, 0.0};
        double radius_m{0.0};
        std::string color{"#FFFFFF"};
    };

    // Name defaults to id when empty.
    Body make_body(const BodySpec &spec);

    // Sun at rest at the origin.
    Body make_sun();

    // Earth on a near-circular orbit at 1 AU.
    Body make_earth();

    // Mars at its mean distance, prograde circular velocity.
    Body make_mars();
} // namespace OrbitView
