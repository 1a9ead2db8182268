#pragma once

// RenderLoop: per-frame driver of the orbit view.
//
// Each frame, in order:
//   1. read real time, derive the (cosmetic) frame delta
//   2. step physics when the physics cadence is due, then refresh the info panel
//   3. push every body's scene-space position into its node
//   4. when the trail cadence is due, record those positions into the trails
//   5. move the point light onto the light body, spin the nodes
//   6. render
// Physics always advances before nodes are positioned in the same frame.

#include "loop_config.h"
#include "info_metrics.h"
#include "simulation_clock.h"
#include "scene/body_binding.h"
#include "scene/unit_converter.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace OrbitView
{
    class IClock;
    class IFrameHost;
    class IPhysicsStepper;
    class IPointLight;
    class IRenderer;
    class TextTargets;

    struct RenderLoopContext
    {
        IPhysicsStepper *stepper{nullptr};
        IClock *clock{nullptr};
        IRenderer *renderer{nullptr};
        IPointLight *light{nullptr};               // optional
        const TextTargets *text_targets{nullptr};  // optional
    };

    class RenderLoop
    {
    public:
        // Throws std::invalid_argument for a missing stepper/clock/renderer, a binding
        // without body or node, or an invalid cadence/scale configuration.
        RenderLoop(const LoopConfig &config, const RenderLoopContext &ctx, std::vector<BodyBinding> bindings);

        // Non-copyable
        RenderLoop(const RenderLoop &) = delete;
        RenderLoop &operator=(const RenderLoop &) = delete;

        // One frame; called by the frame host.
        void frame();

        // Drives frame() from `host` until it is stopped. Blocks.
        void run(IFrameHost &host);

        // Stops the host currently running this loop, effective after the current frame.
        void request_stop();

        const SimulationClock &simulation_clock() const { return _sim_clock; }
        const UnitConverter &converter() const { return _converter; }
        const std::vector<BodyBinding> &bindings() const { return _bindings; }
        const LoopConfig &config() const { return _config; }
        uint64_t frame_count() const { return _frame_count; }
        const std::optional<InfoMetrics> &last_metrics() const { return _last_metrics; }

    private:
        void step_physics(double current_time);
        void publish_metrics();
        void sync_nodes();
        void sample_trails();
        void update_auxiliary(float delta_time);

        LoopConfig _config;
        RenderLoopContext _ctx;
        UnitConverter _converter;
        SimulationClock _sim_clock;
        std::vector<BodyBinding> _bindings;

        // Scene positions computed this frame, parallel to _bindings.
        std::vector<SceneVec3> _scene_positions;

        const Body *_tracked_body{nullptr};
        std::optional<size_t> _light_binding;

        IFrameHost *_host{nullptr};
        double _last_frame_time{0.0};
        uint64_t _frame_count{0};
        std::optional<InfoMetrics> _last_metrics;
    };
} // namespace OrbitView
