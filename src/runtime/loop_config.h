#pragma once

#include <core/config.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace OrbitView
{
    struct LoopConfig
    {
        double scale_factor{kDefaultSceneScaleFactor};
        double physics_interval_s{kDefaultPhysicsIntervalSeconds};
        uint32_t trail_every_n_frames{kDefaultTrailEveryNFrames};
        size_t trail_capacity{kDefaultTrailCapacity};
        std::string tracked_body{"mars"}; // info panel source; empty disables the panel
        std::string light_body{"sun"};    // point light follows this body; empty leaves it fixed
    };
} // namespace OrbitView
