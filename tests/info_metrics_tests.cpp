#include "runtime/info_metrics.h"
#include "physics/body_presets.h"
#include "scene/display_scale.h"
#include "core/util/color.h"

#include <gtest/gtest.h>

namespace
{
    using namespace OrbitView;
} // namespace

TEST(InfoMetrics, MarsAtStartOfSimulation)
{
    const InfoMetrics m = compute_info_metrics(make_mars(), 0.0);

    EXPECT_NEAR(m.distance_au, 2.28e11 / 1.496e11, 1e-12);
    EXPECT_NEAR(m.speed_kmps, 24.1, 1e-12);
    EXPECT_DOUBLE_EQ(m.elapsed_days, 0.0);

    EXPECT_EQ(format_distance_au(m.distance_au), "1.524");
    EXPECT_EQ(format_speed_kmps(m.speed_kmps), "24.10");
    EXPECT_EQ(format_elapsed_days(m.elapsed_days), "0");
}

TEST(InfoMetrics, UsesVectorMagnitudes)
{
    Body b = make_body({.id = "b", .position_m = {3.0 * 1.496e11, 4.0 * 1.496e11}, .velocity_mps = {3000.0, -4000.0}});
    const InfoMetrics m = compute_info_metrics(b, 86400.0 * 2.5);

    EXPECT_NEAR(m.distance_au, 5.0, 1e-12);
    EXPECT_NEAR(m.speed_kmps, 5.0, 1e-12);
    EXPECT_DOUBLE_EQ(m.elapsed_days, 2.5);
    EXPECT_EQ(format_elapsed_days(m.elapsed_days), "2");
}

TEST(InfoMetrics, ElapsedDaysAreGroupedByThousands)
{
    EXPECT_EQ(format_elapsed_days(1234.9), "1,234");
    EXPECT_EQ(format_elapsed_days(999.0), "999");
    EXPECT_EQ(format_elapsed_days(1000.0), "1,000");
    EXPECT_EQ(group_thousands(1234567), "1,234,567");
    EXPECT_EQ(group_thousands(-45000), "-45,000");
    EXPECT_EQ(group_thousands(0), "0");
}

TEST(DisplayScalePolicy, PlanetsScaleWithRadius)
{
    DisplayScalePolicy policy{};
    policy.reference_radius_m = 3.39e6;

    EXPECT_FLOAT_EQ(policy.scale_for(3.39e6, false), 0.1f);
    EXPECT_NEAR(policy.scale_for(6.371e6, false), 0.1 * 6.371e6 / 3.39e6, 1e-6);
}

TEST(DisplayScalePolicy, StarsAreCompressed)
{
    DisplayScalePolicy policy{};
    policy.reference_radius_m = 3.39e6;

    // Sun: ~205x Mars, shown at 1% of that ratio.
    EXPECT_NEAR(policy.scale_for(6.96e8, true), 0.1 * (6.96e8 / 3.39e6) * 0.01, 1e-6);
}

TEST(DisplayScalePolicy, DegenerateRadiusFallsBackToReferenceScale)
{
    DisplayScalePolicy policy{};
    EXPECT_FLOAT_EQ(policy.scale_for(0.0, false), policy.reference_scale);

    policy.reference_radius_m = 0.0;
    EXPECT_FLOAT_EQ(policy.scale_for(6.371e6, false), policy.reference_scale);
}

TEST(HexColor, ParsesWithAndWithoutHash)
{
    const auto c = parse_hex_color("#FF4500");
    ASSERT_TRUE(c.has_value());
    EXPECT_FLOAT_EQ(c->r, 1.0f);
    EXPECT_FLOAT_EQ(c->g, 69.0f / 255.0f);
    EXPECT_FLOAT_EQ(c->b, 0.0f);

    const auto lower = parse_hex_color("4169e1");
    ASSERT_TRUE(lower.has_value());
    EXPECT_EQ(to_hex_color(*lower), "#4169E1");
}

TEST(HexColor, RejectsMalformedInput)
{
    EXPECT_FALSE(parse_hex_color("").has_value());
    EXPECT_FALSE(parse_hex_color("#FFF").has_value());
    EXPECT_FALSE(parse_hex_color("#GG0000").has_value());
    EXPECT_FALSE(parse_hex_color("#1234567").has_value());
}
