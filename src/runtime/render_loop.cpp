#include "render_loop.h"
#include "clock.h"
#include "frame_host.h"
#include "core/text/text_targets.h"
#include "core/util/logger.h"
#include "physics/physics_stepper.h"

#include <stdexcept>

namespace OrbitView
{
    namespace
    {
        SimulationClock::Config make_clock_config(const LoopConfig &config)
        {
            SimulationClock::Config cfg{};
            cfg.physics_interval_s = config.physics_interval_s;
            cfg.trail_every_n_frames = config.trail_every_n_frames;
            return cfg;
        }
    } // namespace

    RenderLoop::RenderLoop(const LoopConfig &config, const RenderLoopContext &ctx, std::vector<BodyBinding> bindings)
        : _config(config)
        , _ctx(ctx)
        , _converter(config.scale_factor)
        , _sim_clock(make_clock_config(config))
        , _bindings(std::move(bindings))
    {
        if (!_ctx.stepper || !_ctx.clock || !_ctx.renderer)
        {
            throw std::invalid_argument("RenderLoop needs a stepper, a clock and a renderer");
        }

        for (size_t i = 0; i < _bindings.size(); ++i)
        {
            BodyBinding &b = _bindings[i];
            if (!b.body || !b.node)
            {
                throw std::invalid_argument("RenderLoop binding without body or scene node");
            }

            // Lines start out as the collapsed ring (every point at the origin).
            if (b.trail && b.trail_line)
            {
                b.trail_line->set_vertex_buffer(b.trail->as_vertex_array());
                b.trail_line->mark_dirty();
            }

            if (!_config.light_body.empty() && b.body->id == _config.light_body)
            {
                _light_binding = i;
            }
        }
        _scene_positions.resize(_bindings.size(), SceneVec3(0.0f));

        if (!_config.tracked_body.empty())
        {
            _tracked_body = _ctx.stepper->find_body(_config.tracked_body);
            if (!_tracked_body)
            {
                Logger::warn("[RenderLoop] tracked body '{}' not found; info panel disabled.", _config.tracked_body);
            }
        }
        if (_ctx.light && !_config.light_body.empty() && !_light_binding)
        {
            Logger::warn("[RenderLoop] light body '{}' has no binding; light stays fixed.", _config.light_body);
        }

        Logger::info("[RenderLoop] {} bindings, physics every {}s, trails every {} frames, scale {}",
                     _bindings.size(), _config.physics_interval_s, _config.trail_every_n_frames,
                     _converter.scale_factor());
    }

    void RenderLoop::frame()
    {
        // --- Time --- //
        const double current_time = _ctx.clock->elapsed_seconds();
        const float delta_time = static_cast<float>(current_time - _last_frame_time);
        _last_frame_time = current_time;
        ++_frame_count;

        // --- Physics cadence --- //
        step_physics(current_time);

        // --- Scene nodes --- //
        sync_nodes();

        // --- Trail cadence --- //
        if (_sim_clock.tick_trail_counter())
        {
            sample_trails();
        }

        // --- Light + idle rotation --- //
        update_auxiliary(delta_time);

        // --- Draw --- //
        _ctx.renderer->render();
    }

    void RenderLoop::run(IFrameHost &host)
    {
        _host = &host;
        try
        {
            host.run([this]() { frame(); });
        }
        catch (...)
        {
            _host = nullptr;
            throw;
        }
        _host = nullptr;
    }

    void RenderLoop::request_stop()
    {
        if (_host)
        {
            _host->request_stop();
        }
    }

    void RenderLoop::step_physics(double current_time)
    {
        if (!_sim_clock.try_step_physics(current_time, *_ctx.stepper))
        {
            return;
        }

        Logger::debug("[RenderLoop] physics step {} at t={:.2f}s, sim time {:.0f}s",
                      _sim_clock.physics_steps(), current_time, _sim_clock.simulation_time());
        publish_metrics();
    }

    void RenderLoop::publish_metrics()
    {
        if (!_tracked_body)
        {
            return;
        }

        const InfoMetrics m = compute_info_metrics(*_tracked_body, _sim_clock.simulation_time());
        _last_metrics = m;

        if (!_ctx.text_targets)
        {
            return;
        }

        // Absent targets are skipped.
        _ctx.text_targets->publish(kDistanceTarget, format_distance_au(m.distance_au));
        _ctx.text_targets->publish(kVelocityTarget, format_speed_kmps(m.speed_kmps));
        _ctx.text_targets->publish(kSimTimeTarget, format_elapsed_days(m.elapsed_days));
    }

    void RenderLoop::sync_nodes()
    {
        for (size_t i = 0; i < _bindings.size(); ++i)
        {
            const SceneVec3 p = _converter.to_scene(_bindings[i].body->position_m);
            _scene_positions[i] = p;
            _bindings[i].node->set_position(p.x, p.y, p.z);
        }
    }

    void RenderLoop::sample_trails()
    {
        for (size_t i = 0; i < _bindings.size(); ++i)
        {
            BodyBinding &b = _bindings[i];
            if (!b.trail)
            {
                continue;
            }

            b.trail->record(_scene_positions[i]);
            if (b.trail_line)
            {
                b.trail_line->set_vertex_buffer(b.trail->as_vertex_array());
                b.trail_line->mark_dirty();
            }
        }
    }

    void RenderLoop::update_auxiliary(float delta_time)
    {
        if (_ctx.light && _light_binding)
        {
            _ctx.light->set_position(_scene_positions[*_light_binding]);
        }

        for (BodyBinding &b : _bindings)
        {
            const float angle = b.node->rotation(Axis::Y) + delta_time * b.rotation_speed;
            b.node->set_rotation(Axis::Y, angle);
        }
    }
} // namespace OrbitView
