#include "DecayRedistributor.h"
#include "GridData.h"
#include "LoggingChannels.h"
#include "TileEnergyField.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace EvoSim {

double DecayRedistributor::deposit(
    const TileEnergyField& field,
    const GridData& grid,
    int row,
    int col,
    double amount,
    std::unordered_map<size_t, double>& placements) const
{
    if (!(amount > 0.0)) {
        return 0.0;
    }

    auto capacity = [&](int r, int c) {
        if (!grid.inBounds(r, c) || grid.isBlocked(r, c)) {
            return 0.0;
        }
        const size_t i = grid.index(r, c);
        double promised = 0.0;
        if (auto it = pending_.find(i); it != pending_.end()) {
            promised += it->second;
        }
        if (auto it = placements.find(i); it != placements.end()) {
            promised += it->second;
        }
        return std::max(0.0, field.remainingCapacity(r, c) - promised);
    };

    double placed = 0.0;
    double remaining = amount;

    const double centre = std::min(remaining, capacity(row, col));
    if (centre > 0.0) {
        placements[grid.index(row, col)] += centre;
        placed += centre;
        remaining -= centre;
    }

    // Overflow goes to the neighbours with room, split evenly and re-split until it fits.
    const int offsets[4][2] = { { -1, 0 }, { 1, 0 }, { 0, -1 }, { 0, 1 } };
    for (int pass = 0; pass < 4 && remaining > 1e-12; ++pass) {
        std::vector<std::pair<int, int>> open;
        for (const auto& offset : offsets) {
            const int r = row + offset[0];
            const int c = col + offset[1];
            if (capacity(r, c) > 0.0) {
                open.emplace_back(r, c);
            }
        }
        if (open.empty()) {
            break;
        }

        const double share = remaining / open.size();
        for (const auto& [r, c] : open) {
            const double amountHere = std::min(share, capacity(r, c));
            placements[grid.index(r, c)] += amountHere;
            placed += amountHere;
            remaining -= amountHere;
        }
    }

    return placed;
}

DecayDeposit DecayRedistributor::registerDeath(
    TileEnergyField& field,
    const GridData& grid,
    int row,
    int col,
    double energy,
    std::optional<double> fractionOverride,
    const DecaySettings& settings)
{
    DecayDeposit result;
    if (!grid.inBounds(row, col) || !std::isfinite(energy) || energy <= 0.0) {
        return result;
    }

    double fraction = fractionOverride.value_or(settings.return_fraction);
    fraction = std::isfinite(fraction) ? std::clamp(fraction, 0.0, 1.0) : settings.return_fraction;

    const double returned = energy * fraction;
    const double immediateTarget = returned * std::clamp(settings.immediate_share, 0.0, 1.0);

    std::unordered_map<size_t, double> placements;
    const double placed = deposit(field, grid, row, col, immediateTarget, placements);
    for (const auto& [i, amount] : placements) {
        const int r = static_cast<int>(i / grid.cols);
        const int c = static_cast<int>(i % grid.cols);
        field.addEnergy(r, c, amount);
    }

    result.immediate = placed;
    result.reserve = std::max(0.0, returned - placed);

    if (result.reserve > settings.epsilon) {
        auto& pool = pools_[grid.index(row, col)];
        pool.amount += result.reserve;
        pool.age = 0;
    }
    else {
        result.reserve = 0.0;
    }

    LoggingChannels::decay()->trace(
        "Death at ({}, {}): returned {:.4f}, immediate {:.4f}, reserve {:.4f}",
        row,
        col,
        returned,
        result.immediate,
        result.reserve);
    return result;
}

double DecayRedistributor::returnOverflow(
    TileEnergyField& field, const GridData& grid, int row, int col, double amount)
{
    if (!grid.inBounds(row, col) || !std::isfinite(amount) || amount <= 0.0) {
        return 0.0;
    }

    std::unordered_map<size_t, double> placements;
    auto room = [&](int r, int c) {
        if (!grid.isOpen(r, c)) {
            return 0.0;
        }
        const size_t i = grid.index(r, c);
        double promised = 0.0;
        if (auto it = placements.find(i); it != placements.end()) {
            promised = it->second;
        }
        return std::max(0.0, field.remainingCapacity(r, c) - promised);
    };

    const int offsets[4][2] = { { -1, 0 }, { 1, 0 }, { 0, -1 }, { 0, 1 } };
    double remaining = amount;
    for (int pass = 0; pass < 4 && remaining > 1e-12; ++pass) {
        std::vector<std::pair<int, int>> open;
        for (const auto& offset : offsets) {
            const int r = row + offset[0];
            const int c = col + offset[1];
            if (room(r, c) > 0.0) {
                open.emplace_back(r, c);
            }
        }
        if (open.empty()) {
            break;
        }

        const double share = remaining / open.size();
        for (const auto& [r, c] : open) {
            const double amountHere = std::min(share, room(r, c));
            placements[grid.index(r, c)] += amountHere;
            remaining -= amountHere;
        }
    }

    double placed = 0.0;
    for (const auto& [i, value] : placements) {
        placed += field.addEnergy(static_cast<int>(i / grid.cols), static_cast<int>(i % grid.cols), value);
    }

    remaining = std::max(0.0, amount - placed);
    if (remaining > 0.0) {
        auto& pool = pools_[grid.index(row, col)];
        pool.amount += remaining;
        pool.age = 0;
    }

    LoggingChannels::decay()->trace(
        "Overflow at ({}, {}): {:.4f} to neighbours, {:.4f} pooled", row, col, placed, remaining);
    return placed;
}

void DecayRedistributor::processPools(
    const TileEnergyField& field,
    const GridData& grid,
    const DecaySettings& settings,
    const SpawnHandler& spawn)
{
    const double maxEnergy = field.getMaxTileEnergy();
    const double spawnThreshold = settings.spawn_min_energy_fraction * maxEnergy;

    for (auto it = pools_.begin(); it != pools_.end();) {
        const size_t i = it->first;
        DecayPool& pool = it->second;
        const int row = static_cast<int>(i / grid.cols);
        const int col = static_cast<int>(i % grid.cols);

        if (spawn && settings.spawn_from_pool_enabled && pool.amount >= spawnThreshold
            && grid.isOpen(row, col)) {
            const double consumed =
                std::clamp(spawn(row, col, std::min(pool.amount, maxEnergy)), 0.0, pool.amount);
            if (consumed > 0.0) {
                pool.amount -= consumed;
                pool.age = 0;
                LoggingChannels::decay()->debug(
                    "Pool at ({}, {}) spawned an organism with {:.3f}", row, col, consumed);
            }
        }

        double release = std::min(pool.amount, settings.release_base + pool.amount * settings.release_rate);
        if (pool.amount - release <= settings.epsilon) {
            release = pool.amount;
        }

        std::unordered_map<size_t, double> placements;
        const double placed = deposit(field, grid, row, col, release, placements);
        for (const auto& [j, amount] : placements) {
            pending_[j] += amount;
        }

        pool.amount = std::max(0.0, pool.amount - placed);
        pool.age = placed > 0.0 ? 0 : pool.age + 1;

        if (pool.amount <= settings.epsilon || pool.age >= settings.max_age) {
            if (pool.amount > 0.0) {
                LoggingChannels::decay()->debug(
                    "Dropping pool at ({}, {}) with {:.5f} left", row, col, pool.amount);
            }
            it = pools_.erase(it);
        }
        else {
            ++it;
        }
    }
}

void DecayRedistributor::applyPendingDeltas(TileEnergyField& field)
{
    if (pending_.empty()) {
        return;
    }

    std::unordered_map<size_t, double> landed;
    landed.reserve(pending_.size());
    const int cols = field.getCols();

    for (const auto& [i, amount] : pending_) {
        const int row = static_cast<int>(i / cols);
        const int col = static_cast<int>(i % cols);
        const double accepted = field.addEnergy(row, col, amount);
        landed[i] = accepted;

        const double leftover = amount - accepted;
        if (leftover > 0.0) {
            pools_[i].amount += leftover;
        }
    }

    field.applyNormalizedDeltas(landed);
    pending_.clear();
}

double DecayRedistributor::flush(TileEnergyField& field, const GridData& grid)
{
    applyPendingDeltas(field);

    double placedTotal = 0.0;
    for (const auto& [i, pool] : pools_) {
        const int row = static_cast<int>(i / grid.cols);
        const int col = static_cast<int>(i % grid.cols);

        std::unordered_map<size_t, double> placements;
        placedTotal += deposit(field, grid, row, col, pool.amount, placements);
        for (const auto& [j, amount] : placements) {
            field.addEnergy(static_cast<int>(j / grid.cols), static_cast<int>(j % grid.cols), amount);
        }
    }

    LoggingChannels::decay()->debug(
        "Flushed {} pools, deposited {:.4f}", pools_.size(), placedTotal);
    pools_.clear();
    return placedTotal;
}

void DecayRedistributor::clear()
{
    pools_.clear();
    pending_.clear();
}

double DecayRedistributor::totalPooled() const
{
    double total = 0.0;
    for (const auto& [i, pool] : pools_) {
        total += pool.amount;
    }
    return total;
}

double DecayRedistributor::totalPending() const
{
    double total = 0.0;
    for (const auto& [i, amount] : pending_) {
        total += amount;
    }
    return total;
}

std::optional<DecayPool> DecayRedistributor::getPool(size_t index) const
{
    if (auto it = pools_.find(index); it != pools_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace EvoSim
