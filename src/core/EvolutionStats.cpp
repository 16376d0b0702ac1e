#include "EvolutionStats.h"
#include "BehaviorComplementarity.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <string>

namespace EvoSim {

namespace {

constexpr std::array<std::string_view, DEATH_CAUSE_COUNT> DEATH_CAUSE_NAMES = {
    "senescence", "starvation", "combat", "event", "removed"
};

constexpr std::array<std::string_view, BLOCK_REASON_COUNT> BLOCK_REASON_NAMES = {
    "none",          "no_candidates",   "out_of_reach",       "cooldown",
    "zone_blocked",  "low_energy",      "probability_roll",   "no_spawn_site",
    "spawn_zone_blocked", "insufficient_investment"
};

double unitClamp(double value)
{
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
}

nlohmann::json countersToJson(const EvolutionCounters& counters)
{
    nlohmann::json byCause = nlohmann::json::object();
    for (size_t i = 0; i < DEATH_CAUSE_COUNT; ++i) {
        byCause[std::string(DEATH_CAUSE_NAMES[i])] = counters.deathsByCause[i];
    }

    nlohmann::json blocked = nlohmann::json::object();
    for (size_t i = 1; i < BLOCK_REASON_COUNT; ++i) {
        blocked[std::string(BLOCK_REASON_NAMES[i])] = counters.blocked[i];
    }

    return { { "births", counters.births },
             { "deaths", counters.deaths },
             { "fights", counters.fights },
             { "cooperations", counters.cooperations },
             { "mate_choices", counters.mateChoices },
             { "mating_successes", counters.matingSuccesses },
             { "curiosity_picks", counters.curiosityPicks },
             { "deaths_by_cause", byCause },
             { "blocked", blocked } };
}

} // namespace

std::string_view deathCauseName(DeathCause cause)
{
    return DEATH_CAUSE_NAMES[static_cast<size_t>(cause)];
}

std::string_view blockReasonName(BlockReason reason)
{
    return BLOCK_REASON_NAMES[static_cast<size_t>(reason)];
}

void EvolutionStats::resetTick()
{
    tick_ = EvolutionCounters{};
}

void EvolutionStats::onBirth(const Organism& /*child*/)
{
    ++tick_.births;
    ++totals_.births;
}

void EvolutionStats::onDeath(const Organism& /*organism*/, DeathCause cause)
{
    ++tick_.deaths;
    ++totals_.deaths;
    ++tick_.deathsByCause[static_cast<size_t>(cause)];
    ++totals_.deathsByCause[static_cast<size_t>(cause)];
}

void EvolutionStats::onFight(const Organism& /*winner*/, const Organism& /*loser*/)
{
    ++tick_.fights;
    ++totals_.fights;
}

void EvolutionStats::onCooperate(
    const Organism& /*giver*/, const Organism& /*receiver*/, double /*amount*/)
{
    ++tick_.cooperations;
    ++totals_.cooperations;
}

void EvolutionStats::recordMateChoice(const MateChoiceRecord& record)
{
    ++tick_.mateChoices;
    ++totals_.mateChoices;
    mateSimilaritySum_ += unitClamp(record.similarity);

    if (record.success) {
        ++tick_.matingSuccesses;
        ++totals_.matingSuccesses;
    }
    if (record.curiosityPick) {
        ++tick_.curiosityPicks;
        ++totals_.curiosityPicks;
    }
}

void EvolutionStats::recordReproductionBlocked(BlockReason reason)
{
    ++tick_.blocked[static_cast<size_t>(reason)];
    ++totals_.blocked[static_cast<size_t>(reason)];
}

void EvolutionStats::updateFromPopulation(
    const std::vector<Organism*>& population, std::mt19937& rng)
{
    diversity_ = estimateDiversity(population, rng, DIVERSITY_SAMPLES);

    // Pressure only builds once there is a population to measure.
    const double target = population.size() >= 2
        ? std::clamp((DIVERSITY_TARGET - diversity_) / DIVERSITY_TARGET, 0.0, 1.0)
        : 0.0;
    diversityPressure_ =
        unitClamp(diversityPressure_ + (target - diversityPressure_) * PRESSURE_SMOOTHING);

    behaviorEvenness_ =
        BehaviorComplementarity::evenness(BehaviorComplementarity::populationMeans(population));

    LoggingChannels::reproduction()->debug(
        "Diversity {:.3f}, pressure {:.3f}, evenness {:.3f}",
        diversity_,
        diversityPressure_,
        behaviorEvenness_);
}

void EvolutionStats::setPopulationScarcity(double scarcity)
{
    scarcity_ = unitClamp(scarcity);
}

void EvolutionStats::setDiversityPressure(double pressure)
{
    diversityPressure_ = unitClamp(pressure);
}

void EvolutionStats::setBehaviorEvenness(double evenness)
{
    behaviorEvenness_ = unitClamp(evenness);
}

double EvolutionStats::getMeanMateSimilarity() const
{
    return totals_.mateChoices > 0 ? mateSimilaritySum_ / totals_.mateChoices : 0.0;
}

double EvolutionStats::estimateDiversity(
    const std::vector<Organism*>& population, std::mt19937& rng, size_t samples)
{
    const size_t n = population.size();
    if (n < 2 || samples == 0) {
        return 0.0;
    }

    const size_t pairs = n * (n - 1) / 2;
    const size_t count = std::min(samples, pairs);
    std::uniform_int_distribution<size_t> pick(0, n - 1);

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const size_t a = pick(rng);
        size_t b = pick(rng);
        while (b == a) {
            b = pick(rng);
        }
        sum += 1.0 - population[a]->genome().similarity(population[b]->genome());
    }
    return sum / count;
}

nlohmann::json EvolutionStats::toJson() const
{
    return { { "tick", countersToJson(tick_) },
             { "totals", countersToJson(totals_) },
             { "diversity", diversity_ },
             { "diversity_pressure", diversityPressure_ },
             { "behavior_evenness", behaviorEvenness_ },
             { "population_scarcity", scarcity_ },
             { "mean_mate_similarity", getMeanMateSimilarity() } };
}

} // namespace EvoSim
