#pragma once

#include "Pimpl.h"
#include "Result.h"
#include "SimulationSettings.h"
#include "StatsCollector.h"
#include "TickSnapshot.h"
#include "Vector2.h"
#include "organisms/Organism.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace EvoSim {

class DecayRedistributor;
class DensityField;
class EventManager;
class InteractionResolver;
class PopulationScarcityController;
class ReproductionZonePolicy;
class TileEnergyField;
class Timers;
struct GridData;

enum class PlacementError : uint8_t { OUT_OF_BOUNDS = 0, BLOCKED, OCCUPIED, NO_GENOME };

std::string_view placementErrorName(PlacementError error);

/**
 * Per-tick overrides of the world's settings. Unset values use the configured settings.
 */
struct TickOptions {
    std::optional<double> densityEffectMultiplier;
    std::optional<double> eventStrengthMultiplier;
    std::optional<double> regenRate;
    std::optional<double> diffusionRate;
    std::optional<double> societySimilarity;
    std::optional<double> enemySimilarity;
};

struct DeathDetails {
    int row = 0;
    int col = 0;
    DeathCause cause = DeathCause::REMOVED;
};

/**
 * Grid simulation of an evolving population.
 *
 * Each tick publishes the density field, releases decay pools, regenerates tile energy and
 * then lets every organism alive at tick start take one turn in a fixed order. Organisms read
 * the density published at tick start; moves, births and deaths during the tick update the
 * grid and the live caches immediately.
 *
 * The grid owns every organism. Pointers returned by this class stay valid until the
 * organism dies and the current tick ends.
 */
class GridWorld {
public:
    /**
     * @throws std::invalid_argument for non-positive dimensions or invalid settings.
     */
    GridWorld(
        int rows,
        int cols,
        const SimulationSettings& settings = getDefaultSimulationSettings(),
        uint32_t seed = 0);
    ~GridWorld();

    GridWorld(GridWorld&&) noexcept;
    GridWorld& operator=(GridWorld&&) noexcept;

    // =================================================================
    // SIMULATION
    // =================================================================

    TickSnapshot tick(const TickOptions& options = {});

    const TickSnapshot& getLastSnapshot() const;
    uint64_t getTick() const;

    // Reseeds the world generator. Offspring genomes are keyed on this seed.
    void setRandomSeed(uint32_t seed);
    uint32_t getSeed() const;

    // =================================================================
    // POPULATION
    // =================================================================

    /**
     * @brief Put an organism on an open tile with exactly `energy`.
     * The tile's energy is left alone until the end-of-tick exclusivity pass.
     */
    Result<Organism*, PlacementError> placeOrganism(
        std::shared_ptr<const Genome> genome, int row, int col, double energy);

    /**
     * @brief Birth an organism on an open tile. It absorbs the tile's energy on top of
     * `energy` and is recorded as a birth.
     */
    Result<Organism*, PlacementError> spawnOrganism(
        std::shared_ptr<const Genome> genome, int row, int col, double energy = 0.0);

    // Remove without returning energy to the grid. False when the tile is empty.
    bool removeOrganism(int row, int col);

    /**
     * @brief Remove a dead organism and hand its energy to decay.
     * A stale `details` position is corrected by scanning the grid.
     */
    void registerDeath(Organism& organism, const DeathDetails& details);

    /**
     * @brief Fill open tiles with random genomes.
     * @return Organisms placed.
     */
    int seedRandomPopulation(double fillFraction, double energyFraction);

    Organism* getOrganismAt(int row, int col) const;
    int getPopulation() const;

    // =================================================================
    // GRID
    // =================================================================

    int getRows() const;
    int getCols() const;

    // Blocking a tile evicts its occupant (energy goes to decay) and empties its energy.
    bool setObstacle(int row, int col, bool blocked);
    bool isObstacle(int row, int col) const;

    // Published density; 0 out of bounds.
    double getDensityAt(int row, int col) const;

    const GridData& getGrid() const;
    TileEnergyField& getEnergyField();
    const TileEnergyField& getEnergyField() const;
    const DensityField& getDensityField() const;
    const DecayRedistributor& getDecay() const;
    const PopulationScarcityController& getScarcityController() const;

    // =================================================================
    // PLUGGABLE POLICIES
    // =================================================================

    EventManager& getEventManager();
    void setEventManager(std::unique_ptr<EventManager> events);

    const ReproductionZonePolicy& getZonePolicy() const;
    void setZonePolicy(std::unique_ptr<ReproductionZonePolicy> policy);

    void setInteractionResolver(std::unique_ptr<InteractionResolver> resolver);

    StatsCollector& getStats();
    const StatsCollector& getStats() const;
    void setStatsCollector(std::unique_ptr<StatsCollector> stats);

    const SimulationSettings& getSettings() const;
    // Validates before applying; the minimum population is recomputed.
    void setSettings(const SimulationSettings& settings);

    Timers& getTimers();
    const Timers& getTimers() const;

    struct Impl;

private:
    Pimpl<Impl> pImpl;
};

} // namespace EvoSim
