#pragma once

#include "Genome.h"
#include "core/Vector2.h"

#include <cstdint>
#include <memory>
#include <random>

namespace EvoSim {

using OrganismId = uint32_t;

constexpr OrganismId INVALID_ORGANISM_ID = 0;

struct MovementGenes {
    double wandering = 0.0;
    double pursuit = 0.0;
    double cautious = 0.0;
};

struct InteractionGenes {
    double avoid = 0.0;
    double fight = 0.0;
    double cooperate = 0.0;
};

enum class MovementStrategy { WANDERING, PURSUIT, CAUTIOUS };

enum class InteractionAction { AVOID, FIGHT, COOPERATE };

// Multiplier interpolated from `low` at zero density to `high` at full density.
struct DensityResponse {
    double low;
    double high;

    double at(double effectiveDensity) const;
};

/**
 * Inputs to an organism's own view of how likely a pairing is to succeed.
 */
struct ReproductionSense {
    double localDensity = 0.0;
    double densityEffectMultiplier = 1.0;
    double tileEnergyFraction = 0.0; // Energy of the focal tile over the tile cap.
    double energyTrend = 0.0;        // Normalized last-tick tile delta in [-1, 1].
    double similarity = 0.0;
};

/**
 * A simulated agent. The grid slot that owns it is authoritative for its position; the
 * `position` member is a cache that the tick loop verifies and repairs.
 */
class Organism {
public:
    Organism(OrganismId id, std::shared_ptr<const Genome> genome, Vector2i position, double energy);

    Organism(const Organism&) = delete;
    Organism& operator=(const Organism&) = delete;

    OrganismId id;
    Vector2i position;
    double energy;
    int age = 0;
    int lifespan;
    int reproduction_cooldown = 0;
    double last_event_pressure = 0.0;
    int fights_won = 0;
    int fights_lost = 0;
    int offspring = 0;
    MovementGenes movement_genes;
    InteractionGenes interaction_genes;

    const Genome& genome() const { return *genome_; }
    std::shared_ptr<const Genome> sharedGenome() const { return genome_; }
    double trait(Trait t) const { return genome_->trait(t); }

    bool isAlive() const { return alive_; }
    void markDead() { alive_ = false; }

    int sightRadius() const;
    double ageFraction() const;
    double starvationThreshold(double maxTileEnergy) const;
    double reproductionThreshold(double maxTileEnergy, double fallbackFraction) const;
    double allyThreshold(double fallback) const;
    double enemyThreshold(double fallback) const;

    /**
     * @brief Chance of treating a neighbour as an enemy regardless of similarity.
     * max(0, lerp(minEnemyBias, maxEnemyBias, effD) * (0.4 + 0.8 * risk)).
     */
    double hostilityBias(double effectiveDensity) const;

    // Scale on the regen density penalty of the occupied tile, in [0.35, 1.8].
    double crowdingSensitivity(double maxTileEnergy) const;

    /**
     * @brief Base probability that a pairing with `partner` succeeds, in [0.01, 0.95].
     * Averages both parents' reproduction traits and discounts crowding and senescence.
     */
    double computeReproductionProbability(
        const Organism& partner, const ReproductionSense& sense) const;

    /**
     * @brief Pay the per-tick metabolic cost.
     * @return true when the organism is at or below its starvation threshold.
     */
    bool manageEnergy(double localDensity, double densityEffectMultiplier, double maxTileEnergy);

    /**
     * @brief Apply an event's direct energy loss, mitigated by recovery and resistance.
     */
    void applyEventDamage(double energyLoss, double strength, double maxTileEnergy);

    MovementStrategy chooseMovementStrategy(double effectiveDensity, std::mt19937& rng) const;
    InteractionAction chooseInteractionAction(double effectiveDensity, std::mt19937& rng) const;

    // Leaderboard score: combat record, offspring, energy and survival.
    double fitness(double maxTileEnergy) const;

    static constexpr DensityResponse REPRODUCTION_RESPONSE{ 1.1, 0.7 };
    static constexpr DensityResponse FIGHT_RESPONSE{ 0.8, 1.4 };
    static constexpr DensityResponse COOPERATE_RESPONSE{ 1.2, 0.8 };
    static constexpr DensityResponse CAUTIOUS_RESPONSE{ 0.9, 1.5 };
    static constexpr DensityResponse ENERGY_LOSS_RESPONSE{ 0.9, 1.3 };

private:
    std::shared_ptr<const Genome> genome_;
    bool alive_ = true;
};

} // namespace EvoSim
