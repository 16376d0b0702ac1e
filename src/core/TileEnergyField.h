#pragma once

#include "SimulationSettings.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace EvoSim {

class DensityField;
class EventManager;
class Organism;
struct GridData;

/**
 * Double-buffered per-tile energy.
 *
 * regenerate() reads only `current` and writes only `next`, then swaps, so every tile sees
 * the same start-of-tick neighbourhood. Occupied tiles never hold regenerated energy: the
 * computed value is parked in a pending slot stamped with the regen revision, and the tile
 * reads 0 until its occupant collects it with takePendingRegen().
 */
class TileEnergyField {
public:
    // Throws std::invalid_argument when maxTileEnergy is non-finite or <= 0.
    TileEnergyField(int rows, int cols, double maxTileEnergy);

    double getMaxTileEnergy() const { return maxTileEnergy_; }
    int getRows() const { return rows_; }
    int getCols() const { return cols_; }

    // 0 out of bounds.
    double getEnergyAt(int row, int col) const;

    // Clamped to [0, max]; non-finite values store 0.
    void setEnergyAt(int row, int col, double value);

    void fill(double value);

    /**
     * @brief Add up to the tile's remaining capacity.
     * @return The amount actually stored.
     */
    double addEnergy(int row, int col, double amount);

    double remainingCapacity(int row, int col) const;

    // Empties the tile and returns what it held.
    double takeEnergyAt(int row, int col);

    // Normalized change of the last regen, in [-1, 1]; 0 out of bounds.
    double getDeltaAt(int row, int col) const;

    /**
     * @brief One regeneration step over every unblocked tile.
     *
     * regen = regenRate * (max - current) * max(0, 1 - penalty * sensitivity * effDensity),
     * scaled by the covering events' regen scale, plus event adds, minus event drains, plus
     * diffusion toward the unblocked orthogonal-neighbour mean. Blocked tiles stay at 0.
     */
    void regenerate(
        const GridData& grid,
        const DensityField& density,
        const EventManager& events,
        const EnergySettings& settings);

    /**
     * @brief Collect the regen parked for an occupied tile in the current revision.
     * Stale or already-collected slots return 0.
     */
    double takePendingRegen(int row, int col);

    /**
     * @brief Move energy from the tile into the organism.
     *
     * demand = clamp(forageRate, 0.05, 1) * crowdPenalty, where the crowd penalty
     * 1 - consumptionDensityPenalty * effDensity tightens on a declining resource trend.
     * The take is bounded by [harvestCapMin, harvestCapMax], the tile's energy and the
     * organism's remaining room below max.
     * @return The energy transferred.
     */
    double harvest(
        Organism& organism, int row, int col, double density, const EnergySettings& settings);

    // Fold absolute per-tile changes (index -> energy) into the delta buffer as fractions of max.
    void applyNormalizedDeltas(const std::unordered_map<size_t, double>& deltas);

    double totalEnergy() const;

    uint64_t getRevision() const { return revision_; }

private:
    bool inBounds(int row, int col) const
    {
        return row >= 0 && col >= 0 && row < rows_ && col < cols_;
    }

    size_t index(int row, int col) const { return static_cast<size_t>(row) * cols_ + col; }

    int rows_;
    int cols_;
    double maxTileEnergy_;
    std::vector<double> current_;
    std::vector<double> next_;
    std::vector<double> delta_;
    std::vector<double> pendingRegen_;
    std::vector<uint64_t> pendingStamp_;
    uint64_t revision_ = 0;
};

} // namespace EvoSim
