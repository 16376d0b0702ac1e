#include "PopulationScarcityController.h"
#include "DensityField.h"
#include "GridData.h"
#include "LoggingChannels.h"
#include "TileEnergyField.h"

#include <algorithm>
#include <cmath>

namespace EvoSim {

int PopulationScarcityController::computeMinPopulation(
    int rows, int cols, const ScarcitySettings& settings)
{
    const long area = static_cast<long>(std::max(0, rows)) * std::max(0, cols);
    if (area < settings.min_population_area_threshold) {
        return 0;
    }
    const long scaled = std::lround(area * settings.min_population_fraction);
    return static_cast<int>(std::max<long>(settings.min_population_floor, scaled));
}

double PopulationScarcityController::computeScarcity(int population, int minPopulation, size_t area)
{
    if (minPopulation <= 0 || population >= minPopulation) {
        return 0.0;
    }

    const double deficit =
        static_cast<double>(minPopulation - std::max(0, population)) / minPopulation;
    const double occupancy =
        area > 0 ? std::clamp(static_cast<double>(std::max(0, population)) / area, 0.0, 1.0) : 0.0;
    return std::clamp(deficit * (0.6 + (1.0 - occupancy) * 0.4), 0.0, 1.0);
}

SeedingPlan PopulationScarcityController::seedingPlan(double scarcity)
{
    const double s = std::isfinite(scarcity) ? std::clamp(scarcity, 0.0, 1.0) : 0.0;
    return SeedingPlan{ .energyFloorFrac = std::clamp(0.35 + 0.15 * s, 0.35, 0.85),
                        .spawnBufferFrac = std::clamp(0.05 + 0.05 * s, 0.05, 0.12) };
}

double PopulationScarcityController::spawnTargetFraction(
    double starvationFrac, const SeedingPlan& plan)
{
    const double starvation = std::isfinite(starvationFrac) ? starvationFrac : 0.0;
    const double floor = std::min(plan.energyFloorFrac, 0.95);
    return std::clamp(starvation + plan.spawnBufferFrac, floor, 0.95);
}

void PopulationScarcityController::configure(int rows, int cols, const ScarcitySettings& settings)
{
    rows_ = std::max(0, rows);
    cols_ = std::max(0, cols);
    minPopulation_ = computeMinPopulation(rows_, cols_, settings);
    scarcity_ = 0.0;
    LoggingChannels::scarcity()->info(
        "Minimum population for {}x{} grid: {}", rows_, cols_, minPopulation_);
}

double PopulationScarcityController::update(int population)
{
    const double previous = scarcity_;
    scarcity_ = computeScarcity(population, minPopulation_, static_cast<size_t>(rows_) * cols_);

    if ((previous > 0.0) != (scarcity_ > 0.0)) {
        LoggingChannels::scarcity()->info(
            "Population {} / minimum {}: scarcity {:.3f}", population, minPopulation_, scarcity_);
    }
    return scarcity_;
}

std::vector<SeedSite> PopulationScarcityController::selectSeedSites(
    const GridData& grid,
    const TileEnergyField& field,
    const DensityField& density,
    const SeedingPlan& plan,
    double topBand) const
{
    std::vector<SeedSite> sites;
    const double maxEnergy = field.getMaxTileEnergy();
    const double floor = plan.energyFloorFrac * maxEnergy;

    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.cols; ++col) {
            if (!grid.isOpen(row, col)) {
                continue;
            }

            const double energy = field.getEnergyAt(row, col);
            if (energy < floor) {
                continue;
            }

            const double normEnergy = std::clamp(energy / maxEnergy, 0.0, 1.0);
            const double crowd = std::clamp(density.getDensityAt(row, col), 0.0, 1.0);
            sites.push_back({ .position = { col, row },
                              .score = normEnergy * 0.7 + (1.0 - crowd) * 0.3 });
        }
    }

    // Stable ordering keeps equal-score sites in row-major order.
    std::stable_sort(sites.begin(), sites.end(), [](const SeedSite& a, const SeedSite& b) {
        return a.score > b.score;
    });

    if (!sites.empty()) {
        const double band = std::clamp(topBand, 0.0, 1.0);
        const size_t keep = std::max<size_t>(1, static_cast<size_t>(std::ceil(sites.size() * band)));
        sites.resize(std::min(keep, sites.size()));
    }
    return sites;
}

} // namespace EvoSim
