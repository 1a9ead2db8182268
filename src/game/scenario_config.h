#pragma once

#include "physics/body.h"
#include "runtime/loop_config.h"
#include "scene/display_scale.h"
#include <core/config.h>

#include <string>
#include <vector>

namespace OrbitView
{
    struct ScenarioConfig
    {
        struct BodyDef
        {
            Body body;
            float rotation_speed{0.0f};    // idle spin, radians per real second
            bool trail{true};
            std::string trail_color{"#FFFFFF"};
            float trail_opacity{0.6f};
            bool is_star{false};           // unlit mesh, compressed display scale
        };

        int schema_version{kScenarioSchemaVersion};
        LoopConfig loop{};
        double physics_dt_s{kDefaultPhysicsDtSeconds};

        // Display sizes are relative to this body's radius.
        std::string display_reference_body{"mars"};
        float display_reference_scale{kDefaultReferenceScale};
        double display_star_compression{kDefaultStarCompression};

        std::vector<BodyDef> bodies;

        const BodyDef *find_body(const std::string &id) const
        {
            for (const auto &b : bodies)
            {
                if (b.body.id == id)
                {
                    return &b;
                }
            }
            return nullptr;
        }
    };

    // Sun, Earth and Mars with trails on the planets; metrics follow Mars.
    ScenarioConfig default_solar_config();
} // namespace OrbitView
