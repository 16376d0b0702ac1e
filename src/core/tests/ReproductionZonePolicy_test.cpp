#include "core/ReproductionZonePolicy.h"
#include <gtest/gtest.h>

using namespace EvoSim;

TEST(ReproductionZonePolicyTest, AllowAllAllowsEverything)
{
    AllowAllZonePolicy policy;
    EXPECT_FALSE(policy.hasActiveZones());

    const ZoneDecision decision =
        policy.validateArea({ .parentA = { 0, 0 }, .parentB = { 50, 50 }, .spawn = Vector2i{ 9, 9 } });
    EXPECT_TRUE(decision.allowed);

    const std::vector<Vector2i> candidates = { { 1, 1 }, { 2, 2 } };
    EXPECT_EQ(policy.filterSpawnCandidates(candidates), candidates);
}

TEST(ReproductionZonePolicyTest, EmptyRectPolicyAllows)
{
    RectZonePolicy policy;
    policy.addZone({ .x = 0, .y = 0, .width = 0, .height = 5 });

    EXPECT_FALSE(policy.hasActiveZones());
    EXPECT_TRUE(policy.validateArea({ .parentA = { 9, 9 }, .parentB = { 8, 8 } }).allowed);
}

TEST(ReproductionZonePolicyTest, RectZonesConfineParentsAndSpawn)
{
    RectZonePolicy policy;
    policy.addZone({ .x = 0, .y = 0, .width = 5, .height = 5 });
    ASSERT_TRUE(policy.hasActiveZones());

    EXPECT_TRUE(policy.validateArea({ .parentA = { 1, 1 }, .parentB = { 4, 4 } }).allowed);

    const ZoneDecision outsideB = policy.validateArea({ .parentA = { 1, 1 }, .parentB = { 5, 4 } });
    EXPECT_FALSE(outsideB.allowed);
    EXPECT_FALSE(outsideB.reason.empty());

    const ZoneDecision outsideSpawn = policy.validateArea(
        { .parentA = { 1, 1 }, .parentB = { 2, 2 }, .spawn = Vector2i{ 7, 0 } });
    EXPECT_FALSE(outsideSpawn.allowed);

    policy.clearZones();
    EXPECT_TRUE(policy.validateArea({ .parentA = { 1, 1 }, .parentB = { 5, 4 } }).allowed);
}

TEST(ReproductionZonePolicyTest, FilterKeepsZoneCandidates)
{
    RectZonePolicy policy;
    policy.addZone({ .x = 2, .y = 2, .width = 2, .height = 2 });
    policy.addZone({ .x = 10, .y = 0, .width = 1, .height = 1 });

    const std::vector<Vector2i> candidates = { { 0, 0 }, { 2, 3 }, { 10, 0 }, { 4, 4 } };
    const std::vector<Vector2i> filtered = policy.filterSpawnCandidates(candidates);

    ASSERT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered[0], (Vector2i{ 2, 3 }));
    EXPECT_EQ(filtered[1], (Vector2i{ 10, 0 }));
}

TEST(ReproductionZonePolicyTest, FilterNeverEmptiesANonEmptyList)
{
    RectZonePolicy policy;
    policy.addZone({ .x = 2, .y = 2, .width = 2, .height = 2 });

    const std::vector<Vector2i> candidates = { { 0, 0 }, { 9, 9 } };
    EXPECT_EQ(policy.filterSpawnCandidates(candidates), candidates);
    EXPECT_TRUE(policy.filterSpawnCandidates({}).empty());
}
