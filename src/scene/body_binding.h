#pragma once

#include "scene_interfaces.h"
#include "trail_buffer.h"
#include "physics/body.h"

#include <optional>

namespace OrbitView
{
    // ============================================================================
    // BodyBinding: one physics body, the scene node that displays it, and its trail.
    //
    // Created once at setup and never re-pointed. The body is owned by the stepper,
    // the node and line by the scene; the trail ring is owned here.
    // ============================================================================

    struct BodyBinding
    {
        const Body *body{nullptr};
        ISceneNode *node{nullptr};
        std::optional<TrailBuffer> trail;  // bodies without a trail leave this empty
        IRenderableLine *trail_line{nullptr};
        float rotation_speed{0.0f};        // radians per real second, cosmetic

        bool has_trail() const { return trail.has_value(); }
    };
} // namespace OrbitView
