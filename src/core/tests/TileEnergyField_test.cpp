#include "core/DensityField.h"
#include "core/EventManager.h"
#include "core/GridData.h"
#include "core/SimulationSettings.h"
#include "core/TileEnergyField.h"
#include "core/tests/GenomeBuilder.h"
#include <cmath>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace EvoSim;
using EvoSim::Test::GenomeBuilder;

class TileEnergyFieldTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        settings = getDefaultSimulationSettings().energy;
        settings.diffusion_rate = 0.0;
    }

    Organism* occupy(
        GridData& grid,
        int row,
        int col,
        double energy,
        const GenomeBuilder& builder = GenomeBuilder())
    {
        auto& slot = grid.occupants[grid.index(row, col)];
        slot = std::make_unique<Organism>(nextId++, builder.build(), Vector2i{ col, row }, energy);
        return slot.get();
    }

    EnergySettings settings;
    OrganismId nextId = 1;
};

TEST_F(TileEnergyFieldTest, RejectsUnusableMaximum)
{
    EXPECT_THROW(TileEnergyField(3, 3, 0.0), std::invalid_argument);
    EXPECT_THROW(TileEnergyField(3, 3, -1.0), std::invalid_argument);
    EXPECT_THROW(TileEnergyField(3, 3, std::nan("")), std::invalid_argument);
    EXPECT_NO_THROW(TileEnergyField(3, 3, 5.0));
}

TEST_F(TileEnergyFieldTest, ValuesAreClampedAndOutOfBoundsIsZero)
{
    TileEnergyField field(3, 3, 5.0);

    field.setEnergyAt(1, 1, 9.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(1, 1), 5.0);
    field.setEnergyAt(1, 1, -2.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(1, 1), 0.0);
    field.setEnergyAt(1, 1, std::nan(""));
    EXPECT_DOUBLE_EQ(field.getEnergyAt(1, 1), 0.0);

    EXPECT_DOUBLE_EQ(field.getEnergyAt(-1, 0), 0.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(3, 3), 0.0);
}

TEST_F(TileEnergyFieldTest, AddEnergyStopsAtCapacity)
{
    TileEnergyField field(2, 2, 5.0);
    field.setEnergyAt(0, 0, 4.0);

    EXPECT_DOUBLE_EQ(field.addEnergy(0, 0, 3.0), 1.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(0, 0), 5.0);
    EXPECT_DOUBLE_EQ(field.remainingCapacity(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(field.takeEnergyAt(0, 0), 5.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(0, 0), 0.0);
}

TEST_F(TileEnergyFieldTest, RegenerationApproachesMaximum)
{
    spdlog::info("Starting TileEnergyFieldTest::RegenerationApproachesMaximum test");
    GridData grid(3, 3);
    DensityField density(3, 3, 1);
    density.sync(true);
    EventManager events(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(1.0);

    settings.regen_rate = 0.1;
    field.regenerate(grid, density, events, settings);

    EXPECT_NEAR(field.getEnergyAt(1, 1), 1.0 + 0.1 * 4.0, 1e-12);
    EXPECT_NEAR(field.getDeltaAt(1, 1), 0.4 / 5.0, 1e-12);

    for (int i = 0; i < 500; ++i) {
        field.regenerate(grid, density, events, settings);
    }
    EXPECT_LE(field.getEnergyAt(1, 1), 5.0);
    EXPECT_NEAR(field.getEnergyAt(1, 1), 5.0, 1e-6);
}

TEST_F(TileEnergyFieldTest, CrowdingSlowsRegeneration)
{
    GridData grid(3, 3);
    DensityField density(3, 3, 1);
    for (int col = 0; col < 3; ++col) {
        occupy(grid, 0, col, 2.0);
        density.applyDelta(0, col, +1);
    }
    density.sync(true);
    EventManager events(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(1.0);

    field.regenerate(grid, density, events, settings);

    // Row 1 is next to the crowd, row 2 is not.
    EXPECT_LT(field.getEnergyAt(1, 1), field.getEnergyAt(2, 1));
}

TEST_F(TileEnergyFieldTest, OccupiedTilesParkTheirRegen)
{
    GridData grid(3, 3);
    DensityField density(3, 3, 1);
    density.sync(true);
    EventManager events(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    occupy(grid, 1, 1, 2.0);

    settings.regen_rate = 0.1;
    field.regenerate(grid, density, events, settings);

    EXPECT_DOUBLE_EQ(field.getEnergyAt(1, 1), 0.0);
    const double pending = field.takePendingRegen(1, 1);
    EXPECT_GT(pending, 0.0);
    EXPECT_DOUBLE_EQ(field.takePendingRegen(1, 1), 0.0);

    EXPECT_DOUBLE_EQ(field.takePendingRegen(0, 0), 0.0);

    // Parked regen left uncollected goes stale once the tile is regenerated unoccupied.
    field.regenerate(grid, density, events, settings);
    grid.occupants[grid.index(1, 1)].reset();
    field.regenerate(grid, density, events, settings);
    EXPECT_DOUBLE_EQ(field.takePendingRegen(1, 1), 0.0);
    EXPECT_GT(field.getEnergyAt(1, 1), 0.0);
}

TEST_F(TileEnergyFieldTest, BlockedTilesHoldNothing)
{
    GridData grid(3, 3);
    grid.obstacles[grid.index(1, 1)] = 1;
    DensityField density(3, 3, 1);
    density.sync(true);
    EventManager events(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(3.0);

    settings.diffusion_rate = 0.2;
    field.regenerate(grid, density, events, settings);

    EXPECT_DOUBLE_EQ(field.getEnergyAt(1, 1), 0.0);
    EXPECT_GT(field.getEnergyAt(0, 1), 0.0);
}

TEST_F(TileEnergyFieldTest, DiffusionSpreadsASpike)
{
    GridData grid(3, 3);
    DensityField density(3, 3, 1);
    density.sync(true);
    EventManager events(3, 3);
    TileEnergyField field(3, 3, 5.0);
    field.fill(0.0);
    field.setEnergyAt(1, 1, 4.0);

    settings.regen_rate = 0.0;
    settings.diffusion_rate = 0.25;
    field.regenerate(grid, density, events, settings);

    EXPECT_NEAR(field.getEnergyAt(1, 1), 3.0, 1e-12);
    EXPECT_GT(field.getEnergyAt(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(field.getEnergyAt(0, 0), 0.0);
}

TEST_F(TileEnergyFieldTest, DroughtSuppressesRegen)
{
    GridData grid(4, 4);
    DensityField density(4, 4, 1);
    density.sync(true);
    EventManager events(4, 4);
    events.addEvent({ .type = EventType::DROUGHT,
                      .strength = 1.0,
                      .area = { .x = 0, .y = 0, .width = 2, .height = 4 },
                      .remaining = 10 });
    TileEnergyField field(4, 4, 5.0);
    field.fill(2.0);

    field.regenerate(grid, density, events, settings);

    EXPECT_LT(field.getEnergyAt(1, 0), field.getEnergyAt(1, 3));
}

TEST_F(TileEnergyFieldTest, HarvestIsBoundedByCapsAndRoom)
{
    GridData grid(2, 2);
    TileEnergyField field(2, 2, 5.0);
    field.setEnergyAt(0, 0, 5.0);

    Organism* forager = occupy(
        grid,
        0,
        0,
        1.0,
        GenomeBuilder()
            .with(Trait::ForageRate, 1.0)
            .with(Trait::HarvestCapMin, 0.1)
            .with(Trait::HarvestCapMax, 0.6));

    const double gain = field.harvest(*forager, 0, 0, 0.0, settings);
    EXPECT_NEAR(gain, 0.6, 1e-12);
    EXPECT_NEAR(forager->energy, 1.6, 1e-12);
    EXPECT_NEAR(field.getEnergyAt(0, 0), 4.4, 1e-12);

    forager->energy = 4.9;
    EXPECT_NEAR(field.harvest(*forager, 0, 0, 0.0, settings), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(forager->energy, 5.0);
}

TEST_F(TileEnergyFieldTest, CrowdedHarvestTakesLess)
{
    GridData grid(2, 2);
    TileEnergyField field(2, 2, 5.0);
    field.fill(5.0);
    const GenomeBuilder builder = GenomeBuilder()
                                      .with(Trait::ForageRate, 0.8)
                                      .with(Trait::HarvestCapMin, 0.05)
                                      .with(Trait::HarvestCapMax, 1.5);
    Organism* alone = occupy(grid, 0, 0, 1.0, builder);
    Organism* packed = occupy(grid, 1, 1, 1.0, builder);

    const double open = field.harvest(*alone, 0, 0, 0.0, settings);
    const double crowded = field.harvest(*packed, 1, 1, 1.0, settings);

    EXPECT_LT(crowded, open);
}
