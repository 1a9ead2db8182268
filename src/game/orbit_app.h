#pragma once

#include "scenario_config.h"
#include "core/text/text_targets.h"
#include "physics/nbody_stepper.h"
#include "runtime/clock.h"
#include "runtime/render_loop.h"
#include "scene/headless_scene.h"

#include <memory>

namespace OrbitView
{
    class IFrameHost;

    // ============================================================================
    // OrbitApp: builds the stepper, scene, bindings and render loop for a scenario
    //
    // Owns everything the loop points at. The scene is headless; the info panel
    // fields are console text targets.
    // ============================================================================

    class OrbitApp
    {
    public:
        struct Options
        {
            uint64_t summary_every_n_frames{kDefaultSummaryEveryNFrames};
            IClock *clock{nullptr}; // nullptr = own a SteadyClock
        };

        // Throws std::invalid_argument when the scenario cannot be simulated.
        explicit OrbitApp(const ScenarioConfig &config);
        OrbitApp(const ScenarioConfig &config, const Options &options);
        ~OrbitApp();

        // Non-copyable
        OrbitApp(const OrbitApp &) = delete;
        OrbitApp &operator=(const OrbitApp &) = delete;

        // Blocks until `host` stops.
        void run(IFrameHost &host);

        RenderLoop &loop() { return *_loop; }
        const RenderLoop &loop() const { return *_loop; }
        NBodyStepper &stepper() { return *_stepper; }
        HeadlessScene &scene() { return _scene; }
        const ConsoleRenderer &renderer() const { return *_renderer; }
        TextTargets &text_targets() { return _text_targets; }

        const ConsoleTextTarget &distance_text() const { return _distance_text; }
        const ConsoleTextTarget &velocity_text() const { return _velocity_text; }
        const ConsoleTextTarget &sim_time_text() const { return _sim_time_text; }

    private:
        std::vector<BodyBinding> build_bindings(const ScenarioConfig &config);

        std::unique_ptr<NBodyStepper> _stepper;
        HeadlessScene _scene;
        std::unique_ptr<ConsoleRenderer> _renderer;

        std::unique_ptr<SteadyClock> _owned_clock;
        IClock *_clock{nullptr};

        ConsoleTextTarget _distance_text{"Distance (AU)"};
        ConsoleTextTarget _velocity_text{"Velocity (km/s)"};
        ConsoleTextTarget _sim_time_text{"Days"};
        TextTargets _text_targets;

        std::unique_ptr<RenderLoop> _loop;
    };
} // namespace OrbitView
