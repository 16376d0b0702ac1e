#include "TileEnergyField.h"
#include "DensityField.h"
#include "EventManager.h"
#include "GridData.h"
#include "LoggingChannels.h"
#include "organisms/Organism.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace EvoSim {

namespace {

double finiteOr(double value, double fallback)
{
    return std::isfinite(value) ? value : fallback;
}

} // namespace

TileEnergyField::TileEnergyField(int rows, int cols, double maxTileEnergy)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)), maxTileEnergy_(maxTileEnergy)
{
    if (!std::isfinite(maxTileEnergy) || maxTileEnergy <= 0.0) {
        throw std::invalid_argument(
            "TileEnergyField requires a positive finite maxTileEnergy (got "
            + std::to_string(maxTileEnergy) + ")");
    }

    const size_t area = static_cast<size_t>(rows_) * cols_;
    current_.assign(area, 0.0);
    next_.assign(area, 0.0);
    delta_.assign(area, 0.0);
    pendingRegen_.assign(area, 0.0);
    pendingStamp_.assign(area, 0);
}

double TileEnergyField::getEnergyAt(int row, int col) const
{
    if (!inBounds(row, col)) {
        return 0.0;
    }
    return current_[index(row, col)];
}

void TileEnergyField::setEnergyAt(int row, int col, double value)
{
    if (!inBounds(row, col)) {
        return;
    }
    current_[index(row, col)] = std::clamp(finiteOr(value, 0.0), 0.0, maxTileEnergy_);
}

void TileEnergyField::fill(double value)
{
    std::fill(current_.begin(), current_.end(), std::clamp(finiteOr(value, 0.0), 0.0, maxTileEnergy_));
}

double TileEnergyField::addEnergy(int row, int col, double amount)
{
    if (!inBounds(row, col) || !std::isfinite(amount) || amount <= 0.0) {
        return 0.0;
    }

    double& tile = current_[index(row, col)];
    const double accepted = std::min(amount, std::max(0.0, maxTileEnergy_ - tile));
    tile += accepted;
    return accepted;
}

double TileEnergyField::remainingCapacity(int row, int col) const
{
    if (!inBounds(row, col)) {
        return 0.0;
    }
    return std::max(0.0, maxTileEnergy_ - current_[index(row, col)]);
}

double TileEnergyField::takeEnergyAt(int row, int col)
{
    if (!inBounds(row, col)) {
        return 0.0;
    }
    const double taken = current_[index(row, col)];
    current_[index(row, col)] = 0.0;
    return taken;
}

double TileEnergyField::getDeltaAt(int row, int col) const
{
    if (!inBounds(row, col)) {
        return 0.0;
    }
    return delta_[index(row, col)];
}

void TileEnergyField::regenerate(
    const GridData& grid,
    const DensityField& density,
    const EventManager& events,
    const EnergySettings& settings)
{
    ++revision_;

    const double maxEnergy = maxTileEnergy_;
    const double regenRate = std::clamp(finiteOr(settings.regen_rate, 0.0), 0.0, 1.0);
    const double diffusionRate = std::clamp(finiteOr(settings.diffusion_rate, 0.0), 0.0, 1.0);
    const double regenPenalty = std::max(0.0, finiteOr(settings.regen_density_penalty, 0.0));
    const double densityMultiplier = finiteOr(settings.density_effect_multiplier, 1.0);
    const double strengthMultiplier = finiteOr(settings.event_strength_multiplier, 1.0);

    for (int row = 0; row < rows_; ++row) {
        const bool rowHasEvents = events.rowHasEvents(row);

        for (int col = 0; col < cols_; ++col) {
            const size_t i = index(row, col);

            if (grid.isBlocked(row, col)) {
                next_[i] = 0.0;
                delta_[i] = 0.0;
                continue;
            }

            const double current = current_[i];
            const double effDensity =
                std::clamp(density.getDensityAt(row, col) * densityMultiplier, 0.0, 1.0);

            const Organism* occupant = grid.occupants[i].get();
            const double sensitivity = occupant ? occupant->crowdingSensitivity(maxEnergy) : 1.0;

            double regen = regenRate * (maxEnergy - current)
                * std::max(0.0, 1.0 - regenPenalty * sensitivity * effDensity);

            double regenAdd = 0.0;
            double drain = 0.0;
            if (rowHasEvents) {
                const EnergyModifiers mods = events.modifiersAt(row, col, strengthMultiplier);
                regen *= mods.regenScale;
                regenAdd = mods.regenAdd;
                drain = mods.drainAdd;
            }

            double neighborSum = 0.0;
            int neighborCount = 0;
            auto addNeighbor = [&](int r, int c) {
                if (grid.inBounds(r, c) && !grid.isBlocked(r, c)) {
                    neighborSum += current_[index(r, c)];
                    ++neighborCount;
                }
            };
            addNeighbor(row - 1, col);
            addNeighbor(row + 1, col);
            addNeighbor(row, col - 1);
            addNeighbor(row, col + 1);

            const double diffusion =
                neighborCount > 0 ? diffusionRate * (neighborSum / neighborCount - current) : 0.0;

            const double value = std::clamp(
                finiteOr(current + regen + regenAdd - drain + diffusion, 0.0), 0.0, maxEnergy);

            delta_[i] = std::clamp((value - current) / maxEnergy, -1.0, 1.0);

            if (occupant) {
                pendingRegen_[i] = value;
                pendingStamp_[i] = revision_;
                next_[i] = 0.0;
            }
            else {
                next_[i] = value;
            }
        }
    }

    std::swap(current_, next_);
}

double TileEnergyField::takePendingRegen(int row, int col)
{
    if (!inBounds(row, col)) {
        return 0.0;
    }

    const size_t i = index(row, col);
    if (pendingStamp_[i] != revision_) {
        return 0.0;
    }

    const double pending = pendingRegen_[i];
    pendingRegen_[i] = 0.0;
    pendingStamp_[i] = 0;
    return pending;
}

double TileEnergyField::harvest(
    Organism& organism, int row, int col, double density, const EnergySettings& settings)
{
    if (!inBounds(row, col)) {
        return 0.0;
    }

    const size_t i = index(row, col);
    const double available = current_[i];
    if (available <= 0.0) {
        return 0.0;
    }

    const double effDensity = std::clamp(
        finiteOr(density, 0.0) * finiteOr(settings.density_effect_multiplier, 1.0), 0.0, 1.0);
    const double trend = std::clamp(delta_[i], -1.0, 1.0);

    // A shrinking tile makes crowding bite harder.
    const double decline = std::max(0.0, -trend);
    const double crowdPenalty = std::max(
        0.0,
        1.0 - finiteOr(settings.consumption_density_penalty, 0.0) * effDensity * (1.0 + decline));

    const double base = std::clamp(organism.trait(Trait::ForageRate), 0.05, 1.0);
    const double capMin = organism.trait(Trait::HarvestCapMin);
    const double capMax = std::max(capMin, organism.trait(Trait::HarvestCapMax));
    const double cap = std::clamp(base * crowdPenalty, capMin, capMax);

    const double room = std::max(0.0, maxTileEnergy_ - organism.energy);
    const double gain = std::min({ cap, available, room });
    if (gain <= 0.0) {
        return 0.0;
    }

    current_[i] = available - gain;
    organism.energy += gain;

    LoggingChannels::energy()->trace(
        "Organism {} harvested {:.4f} at ({}, {})", organism.id, gain, row, col);
    return gain;
}

void TileEnergyField::applyNormalizedDeltas(const std::unordered_map<size_t, double>& deltas)
{
    for (const auto& [i, amount] : deltas) {
        if (i >= delta_.size() || !std::isfinite(amount)) {
            continue;
        }
        delta_[i] = std::clamp(delta_[i] + amount / maxTileEnergy_, -1.0, 1.0);
    }
}

double TileEnergyField::totalEnergy() const
{
    return std::accumulate(current_.begin(), current_.end(), 0.0);
}

} // namespace EvoSim
