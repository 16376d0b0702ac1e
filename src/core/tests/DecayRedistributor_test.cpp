#include "core/DecayRedistributor.h"
#include "core/GridData.h"
#include "core/SimulationSettings.h"
#include "core/TileEnergyField.h"
#include <cmath>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <vector>

using namespace EvoSim;

class DecayRedistributorTest : public ::testing::Test {
protected:
    void SetUp() override { settings = getDefaultSimulationSettings().decay; }

    // Release every pool completely, landing each tick's buffered energy.
    int drain(DecayRedistributor& decay, TileEnergyField& field, const GridData& grid)
    {
        int ticks = 0;
        while (decay.getPoolCount() > 0 && ticks < 1000) {
            decay.processPools(field, grid, settings);
            decay.applyPendingDeltas(field);
            ++ticks;
        }
        return ticks;
    }

    DecaySettings settings;
};

TEST_F(DecayRedistributorTest, CentreDeathReturnsNinetyPercentOverTime)
{
    spdlog::info("Starting DecayRedistributorTest::CentreDeathReturnsNinetyPercentOverTime test");
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    DecayRedistributor decay;

    const DecayDeposit deposit = decay.registerDeath(field, grid, 1, 1, 20.0, std::nullopt, settings);

    EXPECT_NEAR(deposit.immediate + deposit.reserve, 18.0, 1e-9);
    EXPECT_NEAR(deposit.immediate, 18.0 * 0.25, 1e-9);
    EXPECT_NEAR(field.getEnergyAt(1, 1), 4.5, 1e-9);
    EXPECT_EQ(decay.getPoolCount(), 1u);

    const int ticks = drain(decay, field, grid);
    EXPECT_GT(ticks, 1);
    // Every tick releases at least release_base, so the reserve is gone well before max_age.
    EXPECT_LE(ticks, static_cast<int>(std::ceil(deposit.reserve / settings.release_base)));
    EXPECT_LE(ticks, settings.max_age);
    EXPECT_EQ(decay.getPoolCount(), 0u);
    EXPECT_NEAR(field.totalEnergy() + decay.totalPooled(), 18.0, 1e-6);

    // Releases only reach the death tile and its orthogonal neighbours.
    EXPECT_DOUBLE_EQ(field.getEnergyAt(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(2, 2), 0.0);
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            EXPECT_LE(field.getEnergyAt(row, col), 5.0);
        }
    }
}

TEST_F(DecayRedistributorTest, DepositNeverExceedsReturnedEnergy)
{
    GridData grid(5, 5);
    TileEnergyField field(5, 5, 5.0);
    field.fill(3.0);
    DecayRedistributor decay;

    const std::vector<double> energies = { 0.5, 2.0, 5.0, 11.0 };
    for (double energy : energies) {
        const DecayDeposit deposit =
            decay.registerDeath(field, grid, 2, 2, energy, std::nullopt, settings);
        EXPECT_LE(deposit.immediate + deposit.reserve, energy * settings.return_fraction + 1e-12);
        EXPECT_GE(deposit.immediate, 0.0);
        EXPECT_GE(deposit.reserve, 0.0);
    }
}

TEST_F(DecayRedistributorTest, GenomeFractionOverridesSettings)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    DecayRedistributor decay;

    const DecayDeposit deposit = decay.registerDeath(field, grid, 1, 1, 4.0, 0.5, settings);
    EXPECT_NEAR(deposit.immediate + deposit.reserve, 2.0, 1e-9);

    const DecayDeposit clamped = decay.registerDeath(field, grid, 0, 0, 4.0, 3.0, settings);
    EXPECT_NEAR(clamped.immediate + clamped.reserve, 4.0, 1e-9);
}

TEST_F(DecayRedistributorTest, IgnoresUnusableDeaths)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    DecayRedistributor decay;

    const DecayDeposit none = decay.registerDeath(field, grid, 1, 1, 0.0, std::nullopt, settings);
    EXPECT_DOUBLE_EQ(none.immediate + none.reserve, 0.0);
    const DecayDeposit outside = decay.registerDeath(field, grid, 5, 5, 3.0, std::nullopt, settings);
    EXPECT_DOUBLE_EQ(outside.immediate + outside.reserve, 0.0);
    EXPECT_EQ(decay.getPoolCount(), 0u);
}

TEST_F(DecayRedistributorTest, ReleasesWaitForApplyPendingDeltas)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    DecayRedistributor decay;
    decay.registerDeath(field, grid, 1, 1, 10.0, std::nullopt, settings);
    const double before = field.totalEnergy();

    decay.processPools(field, grid, settings);
    EXPECT_GT(decay.totalPending(), 0.0);
    EXPECT_DOUBLE_EQ(field.totalEnergy(), before);

    const double pending = decay.totalPending();
    decay.applyPendingDeltas(field);
    EXPECT_DOUBLE_EQ(decay.totalPending(), 0.0);
    EXPECT_NEAR(field.totalEnergy(), before + pending, 1e-9);
    EXPECT_GT(field.getDeltaAt(1, 1), 0.0);
}

TEST_F(DecayRedistributorTest, PoolCanSpawnOnAnEmptyTile)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(5.0);
    DecayRedistributor decay;
    settings.immediate_share = 0.0;
    decay.registerDeath(field, grid, 1, 1, 10.0, std::nullopt, settings);
    ASSERT_EQ(decay.getPoolCount(), 1u);
    const double pooled = decay.totalPooled();

    int calls = 0;
    decay.processPools(field, grid, settings, [&](int row, int col, double energy) {
        ++calls;
        EXPECT_EQ(row, 1);
        EXPECT_EQ(col, 1);
        EXPECT_LE(energy, 5.0);
        return 2.0;
    });

    EXPECT_EQ(calls, 1);
    EXPECT_NEAR(decay.totalPooled() + decay.totalPending(), pooled - 2.0, 1e-9);
}

TEST_F(DecayRedistributorTest, SpawnDisabledLeavesPoolsAlone)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(5.0);
    DecayRedistributor decay;
    settings.spawn_from_pool_enabled = false;
    decay.registerDeath(field, grid, 1, 1, 10.0, std::nullopt, settings);

    int calls = 0;
    decay.processPools(field, grid, settings, [&](int, int, double) {
        ++calls;
        return 1.0;
    });
    EXPECT_EQ(calls, 0);
}

TEST_F(DecayRedistributorTest, FullGridPoolAgesOut)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(5.0);
    DecayRedistributor decay;
    settings.max_age = 3;
    decay.registerDeath(field, grid, 1, 1, 10.0, std::nullopt, settings);
    ASSERT_EQ(decay.getPoolCount(), 1u);

    for (int i = 0; i < 3; ++i) {
        decay.processPools(field, grid, settings);
    }
    EXPECT_EQ(decay.getPoolCount(), 0u);
}

TEST_F(DecayRedistributorTest, FlushDepositsRemainders)
{
    GridData grid(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    DecayRedistributor decay;
    decay.registerDeath(field, grid, 1, 1, 10.0, std::nullopt, settings);
    const double pooled = decay.totalPooled();
    const double before = field.totalEnergy();

    const double placed = decay.flush(field, grid);

    EXPECT_NEAR(placed, pooled, 1e-9);
    EXPECT_NEAR(field.totalEnergy(), before + pooled, 1e-9);
    EXPECT_EQ(decay.getPoolCount(), 0u);
}
