#include "display_scale.h"

namespace OrbitView
{
    float DisplayScalePolicy::scale_for(double radius_m, bool is_star) const
    {
        if (!(reference_radius_m > 0.0) || !(radius_m > 0.0))
        {
            return reference_scale;
        }

        double ratio = radius_m / reference_radius_m;
        if (is_star)
        {
            ratio *= star_compression;
        }
        return static_cast<float>(static_cast<double>(reference_scale) * ratio);
    }
} // namespace OrbitView
