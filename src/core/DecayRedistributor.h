#pragma once

#include "SimulationSettings.h"

#include <functional>
#include <map>
#include <optional>
#include <unordered_map>

namespace EvoSim {

class TileEnergyField;
struct GridData;

struct DecayDeposit {
    double immediate = 0.0; // Placed on the grid at death.
    double reserve = 0.0;   // Left in the tile's pool for gradual release.
};

struct DecayPool {
    double amount = 0.0;
    int age = 0; // Ticks since the pool last released anything.
};

/**
 * Returns a dead organism's energy to the grid.
 *
 * A share is deposited at death; the rest sits in a per-tile pool that releases
 * min(pool, base + pool * rate) each tick. Every deposit fills the pool's own tile first and
 * spreads the overflow over the unblocked orthogonal neighbours, bounded by their capacity.
 * Pool releases are buffered and only land on the field in applyPendingDeltas(), after regen.
 */
class DecayRedistributor {
public:
    /**
     * Offered a pool on an empty, unblocked tile while the population is short.
     * Returns the energy the new organism consumed (0 when nothing spawned).
     */
    using SpawnHandler = std::function<double(int row, int col, double energy)>;

    /**
     * @brief Split a death's returned energy into an immediate deposit and a pooled reserve.
     * @param fractionOverride Genome-supplied return fraction; settings.return_fraction otherwise.
     */
    DecayDeposit registerDeath(
        TileEnergyField& field,
        const GridData& grid,
        int row,
        int col,
        double energy,
        std::optional<double> fractionOverride,
        const DecaySettings& settings);

    /**
     * @brief Take back energy an occupant at (row, col) had no room for.
     * It goes to the open orthogonal neighbours, bounded by their capacity; whatever does not
     * fit joins the tile's pool.
     * @return Energy placed on neighbours right away.
     */
    double returnOverflow(
        TileEnergyField& field, const GridData& grid, int row, int col, double amount);

    /**
     * @brief Release from every pool into the pending buffer, age and retire pools.
     * @param spawn When set, eligible pools may convert into organisms instead.
     */
    void processPools(
        const TileEnergyField& field,
        const GridData& grid,
        const DecaySettings& settings,
        const SpawnHandler& spawn = {});

    /**
     * @brief Land the buffered releases and fold them into the field's delta buffer.
     * Energy that no longer fits goes back into the tile's pool.
     */
    void applyPendingDeltas(TileEnergyField& field);

    // Deposit every pool's remainder directly, then drop all pools.
    double flush(TileEnergyField& field, const GridData& grid);

    void clear();

    double totalPooled() const;
    double totalPending() const;
    size_t getPoolCount() const { return pools_.size(); }
    std::optional<DecayPool> getPool(size_t index) const;

private:
    // Deposit onto (row, col) then its neighbours. `pending` holds energy already promised.
    double deposit(
        const TileEnergyField& field,
        const GridData& grid,
        int row,
        int col,
        double amount,
        std::unordered_map<size_t, double>& placements) const;

    std::map<size_t, DecayPool> pools_;
    std::unordered_map<size_t, double> pending_;
};

} // namespace EvoSim
