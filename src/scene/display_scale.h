#pragma once

#include <core/config.h>

namespace OrbitView
{
    // Uniform mesh scale for a body sphere of unit diameter.
    //
    // Sizes are relative to a reference planet: a planet of the reference radius gets
    // reference_scale. Stars keep the same ratio but compressed by star_compression,
    // otherwise the sun would swallow the inner orbits.
    struct DisplayScalePolicy
    {
        float reference_scale{kDefaultReferenceScale};
        double reference_radius_m{3.39e6};
        double star_compression{kDefaultStarCompression};

        float scale_for(double radius_m, bool is_star) const;
    };
} // namespace OrbitView
