#include "core/GridData.h"
#include "core/SimilarityCache.h"
#include "core/SimulationSettings.h"
#include "core/SpatialTargetResolver.h"
#include "core/tests/GenomeBuilder.h"
#include <gtest/gtest.h>
#include <random>

using namespace EvoSim;
using EvoSim::Test::GenomeBuilder;

class SpatialTargetResolverTest : public ::testing::Test {
protected:
    void SetUp() override { settings = getDefaultSimulationSettings().reproduction; }

    // Hostility is disabled so classification follows similarity alone.
    Organism* place(int row, int col, uint8_t locus, double sight = 1.0)
    {
        auto& slot = grid.occupants[grid.index(row, col)];
        slot = std::make_unique<Organism>(
            nextId++,
            GenomeBuilder(locus)
                .with(Trait::Sight, sight)
                .with(Trait::MinEnemyBias, 0.0)
                .with(Trait::MaxEnemyBias, 0.0)
                .without(Trait::AllyThreshold)
                .without(Trait::EnemyThreshold)
                .build(),
            Vector2i{ col, row },
            2.0);
        return slot.get();
    }

    GridData grid{ 7, 7 };
    ReproductionSettings settings;
    SimilarityCache cache;
    SpatialTargetResolver resolver;
    std::mt19937 rng{ 3 };
    OrganismId nextId = 1;
};

TEST_F(SpatialTargetResolverTest, ClassifiesBySimilarity)
{
    Organism* observer = place(3, 3, 0);
    place(2, 3, 0);   // Clone: society.
    place(3, 4, 100); // Similarity ~0.61: mate.
    place(4, 4, 255); // Opposite: enemy.

    const TargetLists lists =
        resolver.findTargets(*observer, { 3, 3 }, grid, 0.0, settings, cache, rng);

    ASSERT_EQ(lists.society.size(), 1u);
    ASSERT_EQ(lists.mates.size(), 1u);
    ASSERT_EQ(lists.enemies.size(), 1u);
    EXPECT_EQ(lists.society[0].position, (Vector2i{ 3, 2 }));
    EXPECT_EQ(lists.mates[0].position, (Vector2i{ 4, 3 }));
    EXPECT_EQ(lists.enemies[0].position, (Vector2i{ 4, 4 }));
    EXPECT_EQ(lists.enemies[0].distance, 1);
    EXPECT_DOUBLE_EQ(lists.society[0].similarity, 1.0);
}

TEST_F(SpatialTargetResolverTest, WindowFollowsSight)
{
    Organism* observer = place(3, 3, 0, 1.9);
    place(1, 1, 100);
    place(3, 5, 100);

    TargetLists lists = resolver.findTargets(*observer, { 3, 3 }, grid, 0.0, settings, cache, rng);
    EXPECT_TRUE(lists.empty());

    Organism* farSighted = place(0, 0, 0, 2.0);
    lists = resolver.findTargets(*farSighted, { 0, 0 }, grid, 0.0, settings, cache, rng);
    ASSERT_EQ(lists.mates.size(), 1u);
    EXPECT_EQ(lists.mates[0].distance, 1);
}

TEST_F(SpatialTargetResolverTest, BlindObserverSeesNothing)
{
    Organism* observer = place(3, 3, 0, 0.5);
    place(3, 4, 0);

    EXPECT_TRUE(resolver.findTargets(*observer, { 3, 3 }, grid, 0.0, settings, cache, rng).empty());
}

TEST_F(SpatialTargetResolverTest, WindowIsClippedAtEdges)
{
    Organism* observer = place(0, 0, 0, 3.0);
    place(0, 3, 0);
    place(3, 3, 0);
    place(4, 0, 0);

    const TargetLists lists =
        resolver.findTargets(*observer, { 0, 0 }, grid, 0.0, settings, cache, rng);
    EXPECT_EQ(lists.society.size(), 2u);
}

TEST_F(SpatialTargetResolverTest, DeadNeighboursAreSkipped)
{
    Organism* observer = place(3, 3, 0);
    place(3, 4, 0)->markDead();

    EXPECT_TRUE(resolver.findTargets(*observer, { 3, 3 }, grid, 0.0, settings, cache, rng).empty());
}

TEST_F(SpatialTargetResolverTest, CertainHostilityMakesEveryStrangerAnEnemy)
{
    auto& slot = grid.occupants[grid.index(3, 3)];
    slot = std::make_unique<Organism>(
        nextId++,
        GenomeBuilder(0)
            .with(Trait::Sight, 1.0)
            .with(Trait::MinEnemyBias, 1.0)
            .with(Trait::MaxEnemyBias, 1.0)
            .with(Trait::RiskTolerance, 1.0)
            .without(Trait::AllyThreshold)
            .without(Trait::EnemyThreshold)
            .build(),
        Vector2i{ 3, 3 },
        2.0);
    place(2, 2, 100);
    place(2, 3, 0);

    const TargetLists lists = resolver.findTargets(*slot, { 3, 3 }, grid, 0.5, settings, cache, rng);
    EXPECT_TRUE(lists.mates.empty());
    EXPECT_EQ(lists.enemies.size(), 1u);
    EXPECT_EQ(lists.society.size(), 1u);
}

TEST_F(SpatialTargetResolverTest, SimilarityIsCachedPerTick)
{
    Organism* observer = place(3, 3, 0);
    place(3, 4, 100);

    resolver.findTargets(*observer, { 3, 3 }, grid, 0.0, settings, cache, rng);
    resolver.findTargets(*observer, { 3, 3 }, grid, 0.0, settings, cache, rng);
    EXPECT_EQ(cache.getMisses(), 1u);
    EXPECT_EQ(cache.getHits(), 1u);

    cache.reset();
    EXPECT_EQ(cache.size(), 0u);
}
