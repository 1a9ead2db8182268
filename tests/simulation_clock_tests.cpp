#include "runtime/simulation_clock.h"
#include "test_doubles.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace
{
    using OrbitView::SimulationClock;
    using OrbitView::Testing::ScriptedStepper;
    using OrbitView::Testing::make_test_body;

    SimulationClock make_clock(double interval_s, uint32_t every_n_frames)
    {
        SimulationClock::Config cfg{};
        cfg.physics_interval_s = interval_s;
        cfg.trail_every_n_frames = every_n_frames;
        return SimulationClock(cfg);
    }
} // namespace

TEST(SimulationClock, PhysicsCadenceStepsTwiceOverOnePointTwoSeconds)
{
    SimulationClock clock = make_clock(0.5, 5);
    ScriptedStepper stepper({make_test_body("a", {1.0, 0.0})});

    std::vector<double> stepped_at;
    for (double t : {0.0, 0.3, 0.6, 0.9, 1.2})
    {
        if (clock.try_step_physics(t, stepper))
        {
            stepped_at.push_back(t);
        }
    }

    ASSERT_EQ(stepped_at.size(), 2u);
    EXPECT_DOUBLE_EQ(stepped_at[0], 0.6);
    EXPECT_DOUBLE_EQ(stepped_at[1], 1.2);
    EXPECT_EQ(stepper.steps, 2);
    EXPECT_EQ(clock.physics_steps(), 2u);
}

TEST(SimulationClock, AccumulatesStepperTimestep)
{
    SimulationClock clock = make_clock(0.5, 5);
    ScriptedStepper stepper({make_test_body("a", {1.0, 0.0})}, 86400.0 * 10.0);

    clock.try_step_physics(0.5, stepper);
    clock.try_step_physics(1.0, stepper);

    EXPECT_DOUBLE_EQ(clock.simulation_time(), 2.0 * 864000.0);
    EXPECT_DOUBLE_EQ(clock.last_physics_update(), 1.0);
}

TEST(SimulationClock, StallDoesNotBackfillSteps)
{
    SimulationClock clock = make_clock(0.5, 5);
    ScriptedStepper stepper({make_test_body("a", {1.0, 0.0})});

    // Ten intervals pass between two frames: still one step.
    EXPECT_TRUE(clock.try_step_physics(5.0, stepper));
    EXPECT_FALSE(clock.try_step_physics(5.0, stepper));
    EXPECT_EQ(stepper.steps, 1);
    EXPECT_DOUBLE_EQ(clock.last_physics_update(), 5.0);
}

TEST(SimulationClock, ShouldStepDoesNotMutate)
{
    SimulationClock clock = make_clock(0.5, 5);

    EXPECT_FALSE(clock.should_step_physics(0.49));
    EXPECT_TRUE(clock.should_step_physics(0.5));
    EXPECT_TRUE(clock.should_step_physics(0.5));
    EXPECT_EQ(clock.physics_steps(), 0u);
    EXPECT_DOUBLE_EQ(clock.simulation_time(), 0.0);
}

TEST(SimulationClock, RecordPhysicsStepForExternalStepping)
{
    SimulationClock clock = make_clock(0.5, 5);

    clock.record_physics_step(0.7, 3600.0);
    EXPECT_DOUBLE_EQ(clock.simulation_time(), 3600.0);
    EXPECT_DOUBLE_EQ(clock.last_physics_update(), 0.7);
    EXPECT_FALSE(clock.should_step_physics(1.0));
    EXPECT_TRUE(clock.should_step_physics(1.2));
}

TEST(SimulationClock, TrailCadenceSamplesEveryFifthFrame)
{
    SimulationClock clock = make_clock(0.5, 5);

    std::vector<uint64_t> sampled_at;
    for (int frame = 0; frame < 12; ++frame)
    {
        if (clock.tick_trail_counter())
        {
            sampled_at.push_back(clock.trail_sample_counter());
        }
    }

    ASSERT_EQ(sampled_at.size(), 2u);
    EXPECT_EQ(sampled_at[0], 5u);
    EXPECT_EQ(sampled_at[1], 10u);
    EXPECT_EQ(clock.trail_sample_counter(), 12u);
}

TEST(SimulationClock, TrailEveryFrameWhenCadenceIsOne)
{
    SimulationClock clock = make_clock(0.5, 1);
    for (int frame = 0; frame < 4; ++frame)
    {
        EXPECT_TRUE(clock.tick_trail_counter());
    }
}

TEST(SimulationClock, CadencesAreIndependent)
{
    SimulationClock clock = make_clock(0.5, 5);
    ScriptedStepper stepper({make_test_body("a", {1.0, 0.0})});

    for (int frame = 0; frame < 4; ++frame)
    {
        clock.tick_trail_counter();
    }
    clock.try_step_physics(0.6, stepper);

    EXPECT_EQ(clock.trail_sample_counter(), 4u);
    EXPECT_TRUE(clock.tick_trail_counter());
}

TEST(SimulationClock, DefaultsMatchReferenceConfiguration)
{
    SimulationClock clock;
    EXPECT_DOUBLE_EQ(clock.config().physics_interval_s, 0.5);
    EXPECT_EQ(clock.config().trail_every_n_frames, 5u);
}

TEST(SimulationClock, RejectsInvalidCadences)
{
    EXPECT_THROW(make_clock(0.0, 5), std::invalid_argument);
    EXPECT_THROW(make_clock(-1.0, 5), std::invalid_argument);
    EXPECT_THROW(make_clock(0.5, 0), std::invalid_argument);
}
