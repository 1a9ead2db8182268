#include "core/text/text_targets.h"

#include <gtest/gtest.h>

#include <string>

using namespace OrbitView;

TEST(TextTargets, FindReturnsNullForUnknownName)
{
    TextTargets targets;
    ConsoleTextTarget distance("distance");
    targets.add("distance", &distance);

    EXPECT_EQ(targets.find("distance"), &distance);
    EXPECT_EQ(targets.find("velocity"), nullptr);
    EXPECT_FALSE(targets.publish("velocity", "24.10"));
}

TEST(TextTargets, PublishSetsTextOnRegisteredTarget)
{
    TextTargets targets;
    ConsoleTextTarget velocity("velocity");
    targets.add("velocity", &velocity);

    EXPECT_TRUE(targets.publish("velocity", "24.10"));
    EXPECT_EQ(velocity.text(), "24.10");
    EXPECT_EQ(velocity.label(), "velocity");
}

TEST(TextTargets, AddingNullOrRemovingUnregisters)
{
    TextTargets targets;
    ConsoleTextTarget a("a");
    ConsoleTextTarget b("b");
    targets.add("a", &a);
    targets.add("b", &b);
    ASSERT_EQ(targets.size(), 2u);

    targets.add("a", nullptr);
    targets.remove("b");

    EXPECT_EQ(targets.size(), 0u);
    EXPECT_EQ(targets.find("a"), nullptr);
}
