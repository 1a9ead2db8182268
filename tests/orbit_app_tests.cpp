#include "game/orbit_app.h"
#include "runtime/frame_host.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace
{
    using namespace OrbitView;

    OrbitApp::Options manual_options(ManualClock &clock)
    {
        OrbitApp::Options opts{};
        opts.clock = &clock;
        opts.summary_every_n_frames = 0;
        return opts;
    }
} // namespace

TEST(OrbitApp, BuildsSceneForDefaultSystem)
{
    ManualClock clock;
    OrbitApp app(default_solar_config(), manual_options(clock));

    ASSERT_EQ(app.scene().nodes().size(), 3u);
    EXPECT_NE(app.scene().find_node("sun"), nullptr);
    EXPECT_NE(app.scene().find_line("earth_trail"), nullptr);
    EXPECT_NE(app.scene().find_line("mars_trail"), nullptr);
    EXPECT_EQ(app.scene().find_line("sun_trail"), nullptr);

    // Mars is the display reference; Earth is ~1.88x Mars, the Sun compressed.
    EXPECT_FLOAT_EQ(app.scene().find_node("mars")->scale().x, 0.1f);
    EXPECT_NEAR(app.scene().find_node("earth")->scale().x, 0.1 * 6.371e6 / 3.39e6, 1e-5);
    EXPECT_NEAR(app.scene().find_node("sun")->scale().x, 0.1 * (6.96e8 / 3.39e6) * 0.01, 1e-5);

    const HeadlessLine *mars_trail = app.scene().find_line("mars_trail");
    EXPECT_EQ(mars_trail->vertex_count(), 200u);
    EXPECT_FLOAT_EQ(mars_trail->color().r, 1.0f);
    EXPECT_FLOAT_EQ(mars_trail->color().a, 0.6f);
}

TEST(OrbitApp, FirstFramePlacesMarsAtReferenceDistance)
{
    ManualClock clock;
    OrbitApp app(default_solar_config(), manual_options(clock));

    app.loop().frame();

    const SceneVec3 mars = app.scene().find_node("mars")->position();
    EXPECT_FLOAT_EQ(mars.x, 2.28f);
    EXPECT_FLOAT_EQ(mars.y, 0.0f);
    EXPECT_FLOAT_EQ(app.scene().find_node("earth")->position().x, 1.496f);
    EXPECT_EQ(app.scene().light().position(), SceneVec3(0.0f));
}

TEST(OrbitApp, InfoPanelUpdatesOnPhysicsSteps)
{
    ManualClock clock;
    OrbitApp app(default_solar_config(), manual_options(clock));

    // Two seconds at 60 fps: four physics steps, 24 trail samples.
    for (int i = 0; i < 120; ++i)
    {
        clock.advance(1.0 / 60.0);
        app.loop().frame();
    }

    const auto &sim_clock = app.loop().simulation_clock();
    EXPECT_GE(sim_clock.physics_steps(), 3u);
    EXPECT_LE(sim_clock.physics_steps(), 4u);
    EXPECT_EQ(app.sim_time_text().text(), format_elapsed_days(sim_clock.simulation_time() / kSecondsPerDay));
    EXPECT_FALSE(app.distance_text().text().empty());
    EXPECT_FALSE(app.velocity_text().text().empty());

    const BodyBinding &mars = app.loop().bindings()[2];
    ASSERT_TRUE(mars.has_trail());
    EXPECT_EQ(mars.trail->recorded(), 24u);

    // Mars has moved off the +X axis in its prograde direction.
    EXPECT_GT(app.scene().find_node("mars")->position().y, 0.0f);
}

TEST(OrbitApp, RunsUntilFrameLimit)
{
    ManualClock clock;
    OrbitApp app(default_solar_config(), manual_options(clock));

    FixedRateFrameHost::Config host_cfg{};
    host_cfg.target_fps = 0.0;
    host_cfg.max_frames = 10;
    FixedRateFrameHost host(host_cfg);

    app.run(host);

    EXPECT_EQ(app.loop().frame_count(), 10u);
    EXPECT_EQ(app.renderer().frame_count(), 10u);
    // Two trail samples re-uploaded both trail lines, plus the initial upload.
    EXPECT_EQ(app.renderer().line_uploads(), 2u + 2u * 2u);
}

TEST(OrbitApp, RejectsUnsimulatableScenario)
{
    ScenarioConfig cfg = default_solar_config();
    cfg.loop.scale_factor = 0.0;
    EXPECT_THROW(OrbitApp app(cfg), std::invalid_argument);

    ScenarioConfig empty = default_solar_config();
    empty.bodies.clear();
    EXPECT_THROW(OrbitApp app(empty), std::invalid_argument);
}
