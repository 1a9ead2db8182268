#pragma once

#include <core/config.h>
#include <core/world.h>

namespace OrbitView
{
    // Maps physics space (meters, XY plane) onto scene space (display units, z = 0).
    // Linear: to_scene(a + b) == to_scene(a) + to_scene(b), to_scene(k * a) == k * to_scene(a).
    class UnitConverter
    {
    public:
        // Throws std::invalid_argument unless scale_factor is finite and positive.
        explicit UnitConverter(double scale_factor = kDefaultSceneScaleFactor);

        SceneVec3 to_scene(const PhysicsVec2 &p) const
        {
            return SceneVec3(static_cast<float>(p.x * _scale_factor),
                             static_cast<float>(p.y * _scale_factor),
                             0.0f);
        }

        double to_scene_length(double meters) const { return meters * _scale_factor; }

        double scale_factor() const { return _scale_factor; }

    private:
        double _scale_factor;
    };
} // namespace OrbitView
