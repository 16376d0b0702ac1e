#pragma once

#include "SimulationSettings.h"
#include "Vector2.h"

#include <algorithm>
#include <vector>

namespace EvoSim {

class DensityField;
class TileEnergyField;
struct GridData;

struct SeedingPlan {
    double energyFloorFrac = 0.35; // Minimum tile energy (x max) for a seed site.
    double spawnBufferFrac = 0.05; // Energy above the starvation threshold given to a seed.
};

struct SeedSite {
    Vector2i position;
    double score = 0.0;
};

/**
 * Tracks how far the population is below its minimum and plans compensatory seeding.
 */
class PopulationScarcityController {
public:
    // area < threshold ? 0 : max(floor, round(area * fraction)).
    static int computeMinPopulation(int rows, int cols, const ScarcitySettings& settings);

    /**
     * @brief Scarcity signal in [0,1].
     * 0 when population >= minimum; otherwise deficit * (0.6 + (1 - occupancy) * 0.4).
     */
    static double computeScarcity(int population, int minPopulation, size_t area);

    static SeedingPlan seedingPlan(double scarcity);

    // clamp(starvationFrac + buffer, floor, 0.95).
    static double spawnTargetFraction(double starvationFrac, const SeedingPlan& plan);

    void configure(int rows, int cols, const ScarcitySettings& settings);

    // Recompute and store the signal for the current population.
    double update(int population);

    double getScarcity() const { return scarcity_; }
    int getMinPopulation() const { return minPopulation_; }
    int getDeficit(int population) const { return std::max(0, minPopulation_ - population); }

    /**
     * @brief Candidate seed sites, best first.
     * Empty unblocked tiles with energy at or above the plan's floor are scored
     * normEnergy * 0.7 + (1 - density) * 0.3; only the top band is returned.
     */
    std::vector<SeedSite> selectSeedSites(
        const GridData& grid,
        const TileEnergyField& field,
        const DensityField& density,
        const SeedingPlan& plan,
        double topBand) const;

private:
    int rows_ = 0;
    int cols_ = 0;
    int minPopulation_ = 0;
    double scarcity_ = 0.0;
};

} // namespace EvoSim
