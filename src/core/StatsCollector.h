#pragma once

#include "organisms/Organism.h"

#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

namespace EvoSim {

enum class DeathCause : uint8_t { SENESCENCE = 0, STARVATION, COMBAT, EVENT, REMOVED };

constexpr size_t DEATH_CAUSE_COUNT = 5;

std::string_view deathCauseName(DeathCause cause);

// Why a reproduction attempt did not produce offspring.
enum class BlockReason : uint8_t {
    NONE = 0,
    NO_CANDIDATES,
    OUT_OF_REACH,
    COOLDOWN,
    ZONE_BLOCKED,
    LOW_ENERGY,
    PROBABILITY_ROLL,
    NO_SPAWN_SITE,
    SPAWN_ZONE_BLOCKED,
    INSUFFICIENT_INVESTMENT,
};

constexpr size_t BLOCK_REASON_COUNT = 10;

std::string_view blockReasonName(BlockReason reason);

struct MateChoiceRecord {
    OrganismId parent = INVALID_ORGANISM_ID;
    OrganismId mate = INVALID_ORGANISM_ID;
    double similarity = 0.0;
    double diversity = 0.0;
    double threshold = 0.0;      // Pair diversity threshold in force.
    double probability = 0.0;    // Final success probability.
    double penaltyMultiplier = 1.0;
    double bonusMultiplier = 1.0;
    double scarcityMultiplier = 1.0;
    uint32_t poolSize = 0;       // Candidates weighed after the pool limit.
    bool curiosityPick = false;  // Chosen by the novelty tail rather than preference.
    bool success = false;
    BlockReason reason = BlockReason::NONE; // Why the pairing stopped short of a birth.
};

/**
 * Receiver of simulation events plus the population-level signals that feed back into the
 * reproduction policy.
 */
class StatsCollector {
public:
    virtual ~StatsCollector() = default;

    virtual void resetTick() = 0;

    virtual void onBirth(const Organism& child) = 0;
    virtual void onDeath(const Organism& organism, DeathCause cause) = 0;
    virtual void onFight(const Organism& winner, const Organism& loser) = 0;
    virtual void onCooperate(const Organism& giver, const Organism& receiver, double amount) = 0;
    virtual void recordMateChoice(const MateChoiceRecord& record) = 0;
    virtual void recordReproductionBlocked(BlockReason reason) = 0;

    // Refresh diversity, diversity pressure and behaviour evenness from the live population.
    virtual void updateFromPopulation(
        const std::vector<Organism*>& population, std::mt19937& rng) = 0;

    virtual double getPopulationScarcity() const = 0;
    virtual void setPopulationScarcity(double scarcity) = 0;
    virtual double getDiversity() const = 0;
    virtual double getDiversityPressure() const = 0;
    virtual void setDiversityPressure(double pressure) = 0;
    virtual double getBehaviorEvenness() const = 0;
    virtual void setBehaviorEvenness(double evenness) = 0;
};

} // namespace EvoSim
