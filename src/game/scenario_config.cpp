#include "scenario_config.h"
#include "physics/body_presets.h"

namespace OrbitView
{
    // ---- Default scenario ----

    ScenarioConfig default_solar_config()
    {
        ScenarioConfig cfg;
        cfg.loop = LoopConfig{};
        cfg.physics_dt_s = kDefaultPhysicsDtSeconds;
        cfg.display_reference_body = "mars";

        // Sun: no trail, the light follows it
        {
            ScenarioConfig::BodyDef sun{};
            sun.body = make_sun();
            sun.rotation_speed = 0.5f;
            sun.trail = false;
            sun.trail_color = sun.body.color;
            sun.is_star = true;
            cfg.bodies.push_back(std::move(sun));
        }

        // Earth
        {
            ScenarioConfig::BodyDef earth{};
            earth.body = make_earth();
            earth.rotation_speed = 1.5f;
            earth.trail_color = "#4169E1";
            earth.trail_opacity = 0.6f;
            cfg.bodies.push_back(std::move(earth));
        }

        // Mars (tracked by the info panel)
        {
            ScenarioConfig::BodyDef mars{};
            mars.body = make_mars();
            mars.rotation_speed = 2.0f;
            mars.trail_color = "#FF4500";
            mars.trail_opacity = 0.6f;
            cfg.bodies.push_back(std::move(mars));
        }

        return cfg;
    }
} // namespace OrbitView
