#include "orbit_app.h"
#include "core/util/color.h"
#include "core/util/logger.h"
#include "runtime/frame_host.h"

namespace OrbitView
{
    namespace
    {
        std::vector<Body> collect_bodies(const ScenarioConfig &config)
        {
            std::vector<Body> bodies;
            bodies.reserve(config.bodies.size());
            for (const auto &def : config.bodies)
            {
                bodies.push_back(def.body);
            }
            return bodies;
        }

        DisplayScalePolicy make_display_policy(const ScenarioConfig &config)
        {
            DisplayScalePolicy policy{};
            policy.reference_scale = config.display_reference_scale;
            policy.star_compression = config.display_star_compression;

            const ScenarioConfig::BodyDef *ref = config.find_body(config.display_reference_body);
            if (ref && ref->body.radius_m > 0.0)
            {
                policy.reference_radius_m = ref->body.radius_m;
            }
            else
            {
                Logger::warn("Display reference body '{}' missing or without radius; using {} m.",
                             config.display_reference_body, policy.reference_radius_m);
            }
            return policy;
        }
    } // namespace

    OrbitApp::OrbitApp(const ScenarioConfig &config)
        : OrbitApp(config, Options{})
    {
    }

    OrbitApp::OrbitApp(const ScenarioConfig &config, const Options &options)
    {
        NBodyStepper::Config stepper_cfg{};
        stepper_cfg.dt_s = config.physics_dt_s;
        _stepper = std::make_unique<NBodyStepper>(collect_bodies(config), stepper_cfg);

        _renderer = std::make_unique<ConsoleRenderer>(_scene, options.summary_every_n_frames);

        if (options.clock)
        {
            _clock = options.clock;
        }
        else
        {
            _owned_clock = std::make_unique<SteadyClock>();
            _clock = _owned_clock.get();
        }

        _text_targets.add(kDistanceTarget, &_distance_text);
        _text_targets.add(kVelocityTarget, &_velocity_text);
        _text_targets.add(kSimTimeTarget, &_sim_time_text);

        RenderLoopContext ctx{};
        ctx.stepper = _stepper.get();
        ctx.clock = _clock;
        ctx.renderer = _renderer.get();
        ctx.light = &_scene.light();
        ctx.text_targets = &_text_targets;

        _loop = std::make_unique<RenderLoop>(config.loop, ctx, build_bindings(config));
    }

    OrbitApp::~OrbitApp() = default;

    std::vector<BodyBinding> OrbitApp::build_bindings(const ScenarioConfig &config)
    {
        const DisplayScalePolicy policy = make_display_policy(config);

        std::vector<BodyBinding> bindings;
        bindings.reserve(config.bodies.size());

        // Stepper bodies are in scenario order.
        std::vector<Body> &bodies = _stepper->bodies();
        for (size_t i = 0; i < config.bodies.size(); ++i)
        {
            const ScenarioConfig::BodyDef &def = config.bodies[i];
            const Body &body = bodies[i];

            HeadlessNode &node = _scene.create_node(body.id);
            const float s = policy.scale_for(body.radius_m, def.is_star);
            node.set_scale(s, s, s);

            BodyBinding binding{};
            binding.body = &body;
            binding.node = &node;
            binding.rotation_speed = def.rotation_speed;

            if (def.trail)
            {
                const glm::vec3 rgb = parse_hex_color(def.trail_color).value_or(glm::vec3(1.0f));
                binding.trail.emplace(config.loop.trail_capacity);
                binding.trail_line = &_scene.create_line(body.id + "_trail", with_alpha(rgb, def.trail_opacity));
            }

            Logger::info("Body '{}' ({}): scale {:.3f}, trail {}", body.id, body.name, s,
                         def.trail ? "on" : "off");
            bindings.push_back(std::move(binding));
        }

        return bindings;
    }

    void OrbitApp::run(IFrameHost &host)
    {
        _loop->run(host);
    }
} // namespace OrbitView
