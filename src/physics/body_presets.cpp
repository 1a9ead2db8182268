#include "body_presets.h"

namespace OrbitView
{
    Body make_body(const BodySpec &spec)
    {
        Body b{};
        b.id = spec.id;
        b.name = spec.name.empty() ? spec.id : spec.name;
        b.mass_kg = spec.mass_kg;
        b.position_m = spec.position_m;
        b.velocity_mps = spec.velocity_mps;
        b.radius_m = spec.radius_m;
        b.color = spec.color;
        return b;
    }

    Body make_sun()
    {
        return make_body({
                .id = "sun",
                .name = "Sun",
                .mass_kg = 1.989e30,
                .position_m = {0.0, 0.0},
                .velocity_mps = {0.0, 0.0},
                .radius_m = 6.96e8,
                .color = "#FDB813",
        });
    }

    Body make_earth()
    {
        return make_body({
                .id = "earth",
                .name = "Earth",
                .mass_kg = 5.972e24,
                .position_m = {1.496e11, 0.0},
                .velocity_mps = {0.0, 29'780.0},
                .radius_m = 6.371e6,
                .color = "#4169E1",
        });
    }

    Body make_mars()
    {
        return make_body({
                .id = "mars",
                .name = "Mars",
                .mass_kg = 6.39e23,
                .position_m = {2.28e11, 0.0},
                .velocity_mps = {0.0, 24'100.0},
                .radius_m = 3.39e6,
                .color = "#CD5C5C",
        });
    }
} // namespace OrbitView
