#pragma once

#include "StatsCollector.h"

#include <array>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace EvoSim {

/**
 * @brief Event counters for one tick, or accumulated over the run.
 */
struct EvolutionCounters {
    uint32_t births = 0;       ///< Offspring spawned (seeding included).
    uint32_t deaths = 0;       ///< Organisms removed for any cause.
    uint32_t fights = 0;       ///< Resolved fights.
    uint32_t cooperations = 0; ///< Resolved energy shares.
    uint32_t mateChoices = 0;  ///< Pairings that reached the probability roll.
    uint32_t matingSuccesses = 0;
    uint32_t curiosityPicks = 0;
    std::array<uint32_t, DEATH_CAUSE_COUNT> deathsByCause{};
    std::array<uint32_t, BLOCK_REASON_COUNT> blocked{};
};

/**
 * Default StatsCollector: counters, sampled genetic diversity and the feedback signals.
 *
 * Diversity is the mean genetic distance (1 - similarity) over sampled pairs. Diversity
 * pressure rises as diversity falls below the target and is smoothed across ticks.
 */
class EvolutionStats : public StatsCollector {
public:
    static constexpr size_t DIVERSITY_SAMPLES = 200;
    static constexpr double DIVERSITY_TARGET = 0.3;
    static constexpr double PRESSURE_SMOOTHING = 0.2;

    void resetTick() override;

    void onBirth(const Organism& child) override;
    void onDeath(const Organism& organism, DeathCause cause) override;
    void onFight(const Organism& winner, const Organism& loser) override;
    void onCooperate(const Organism& giver, const Organism& receiver, double amount) override;
    void recordMateChoice(const MateChoiceRecord& record) override;
    void recordReproductionBlocked(BlockReason reason) override;

    void updateFromPopulation(
        const std::vector<Organism*>& population, std::mt19937& rng) override;

    double getPopulationScarcity() const override { return scarcity_; }
    void setPopulationScarcity(double scarcity) override;
    double getDiversity() const override { return diversity_; }
    double getDiversityPressure() const override { return diversityPressure_; }
    void setDiversityPressure(double pressure) override;
    double getBehaviorEvenness() const override { return behaviorEvenness_; }
    void setBehaviorEvenness(double evenness) override;

    const EvolutionCounters& getTickCounters() const { return tick_; }
    const EvolutionCounters& getTotals() const { return totals_; }

    // Running mean of the similarity of chosen mates.
    double getMeanMateSimilarity() const;

    // Sampled mean genetic distance; 0 for fewer than two organisms.
    static double estimateDiversity(
        const std::vector<Organism*>& population, std::mt19937& rng, size_t samples);

    nlohmann::json toJson() const;

private:
    EvolutionCounters tick_;
    EvolutionCounters totals_;
    double mateSimilaritySum_ = 0.0;
    double scarcity_ = 0.0;
    double diversity_ = 0.0;
    double diversityPressure_ = 0.0;
    double behaviorEvenness_ = 0.0;
};

} // namespace EvoSim
