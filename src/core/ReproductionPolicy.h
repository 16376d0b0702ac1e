#pragma once

#include "SimulationSettings.h"
#include "SpatialTargetResolver.h"
#include "StatsCollector.h"
#include "Vector2.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace EvoSim {

class DensityField;
class ReproductionZonePolicy;
class TileEnergyField;
struct GridData;

/**
 * Environmental and population signals shared by the threshold and penalty computations.
 * All values are in [0,1] except tileEnergyDelta, which is in [-1,1].
 */
struct PairContext {
    double localDensity = 0.0;
    double tileEnergy = 0.5; // Focal tile energy over max.
    double tileEnergyDelta = 0.0;
    double diversityPressure = 0.0;
    double behaviorComplementarity = 0.0;
    double behaviorEvenness = 0.0;
    double scarcity = 0.0;
};

struct ProbabilityInputs {
    const Organism* parentA = nullptr;
    const Organism* parentB = nullptr;
    double baseProbability = 0.0;
    double similarity = 0.0;
    double threshold = 0.0; // Pair diversity threshold.
    double penaltyFloor = 0.0;
    double diversityBonusScale = 0.6;
    double complementBonusScale = 0.15;
    int population = 0;
    int minPopulation = 0;
    PairContext context;
};

struct ProbabilityBreakdown {
    double baseProbability = 0.0;
    double diversity = 0.0;
    double threshold = 0.0;
    double penaltyMultiplier = 1.0;
    double bonusMultiplier = 1.0;
    double scarcityMultiplier = 1.0;
    double probability = 0.0;
    bool penalized = false;
};

struct ReproductionOutcome {
    bool reproduced = false;
    BlockReason reason = BlockReason::NONE;
    Organism* mate = nullptr;
    Organism* offspring = nullptr;
    Vector2i parentPosition; // Where the focal parent ended up.
    std::optional<Vector2i> spawnPosition;
    ProbabilityBreakdown breakdown;
};

/**
 * World services the reproduction policy needs. Implemented by the world that owns the grid.
 */
class ReproductionHost {
public:
    virtual ~ReproductionHost() = default;

    virtual const GridData& getGrid() const = 0;
    virtual const TileEnergyField& getEnergyField() const = 0;
    virtual const DensityField& getDensityField() const = 0;
    virtual const ReproductionZonePolicy& getZonePolicy() const = 0;
    virtual StatsCollector& getStats() = 0;

    virtual bool moveOrganism(Organism& organism, const Vector2i& from, const Vector2i& to) = 0;

    // Place a new organism; it absorbs the tile's energy. nullptr when the tile is not open.
    virtual Organism* spawnOffspring(
        std::shared_ptr<const Genome> genome, const Vector2i& position, double energy) = 0;

    virtual uint64_t getTick() const = 0;
    virtual uint32_t getWorldSeed() const = 0;
    virtual int getPopulation() const = 0;
    virtual int getMinPopulation() const = 0;
    virtual double getPopulationScarcity() const = 0;
};

/**
 * Mate selection, gating, diversity-aware probability shaping and offspring placement.
 *
 * The probability pipeline is exposed as static functions so it can be examined without a
 * world: computePairDiversityThreshold() -> computeLowDiversityMultiplier() (below the
 * threshold) or the diversity bonuses (above it) -> computeScarcityMultiplier().
 */
class ReproductionPolicy {
public:
    static constexpr double CURIOSITY_CHANCE_CAP = 0.5;

    /**
     * @brief Run one reproduction attempt for `parent` standing at `position`.
     * Never throws; every failure is reported through the outcome's BlockReason.
     */
    ReproductionOutcome attempt(
        Organism& parent,
        const Vector2i& position,
        const TargetLists& targets,
        ReproductionHost& host,
        const SimulationSettings& settings,
        std::mt19937& rng) const;

    /**
     * @brief Per-pair diversity threshold, blended back toward the baseline.
     * Shifted by diversity appetite, kin bias, caution, environmental urgency, population
     * diversity pressure and behaviour complementarity.
     */
    static double computePairDiversityThreshold(
        const Organism& a,
        const Organism& b,
        double baseline,
        const PairContext& context,
        double pressureShift = 0.08);

    /**
     * @brief Multiplier in [floor, 1] for a pair whose diversity is below the threshold.
     * Non-increasing in similarity: a closer pair is never penalized less.
     */
    static double computeLowDiversityMultiplier(
        const Organism& a,
        const Organism& b,
        double diversity,
        double threshold,
        double baseProbability,
        double floor,
        const PairContext& context);

    /**
     * @brief Reproduction lift under population scarcity.
     * Exactly 1 when scarcity is 0; strictly above 1 when scarcity and the base probability
     * are both positive; never above 1 + 1.1 * scarcity.
     */
    static double computeScarcityMultiplier(
        const Organism* a,
        const Organism* b,
        double scarcity,
        double baseProbability,
        int population,
        int minPopulation);

    static ProbabilityBreakdown computeReproductionProbability(const ProbabilityInputs& inputs);

    // Drive toward genetically distant mates in [0,1], from traits and the local environment.
    static double diversityDrive(const Organism& organism, const PairContext& context);

    // Kin preference mapped onto [-1, 1]; positive favours similar mates.
    static double matePreferenceBias(const Organism& organism);

private:
    struct MateChoice {
        const TargetEntry* entry = nullptr;
        size_t poolSize = 0;
        bool curiosity = false;
    };

    MateChoice selectMate(
        const Organism& parent,
        const Vector2i& position,
        const std::vector<TargetEntry>& pool,
        int limit,
        std::mt19937& rng) const;

    std::optional<Vector2i> chooseSpawnSite(
        const Organism& parentA,
        const Organism& parentB,
        const std::vector<Vector2i>& anchors,
        ReproductionHost& host,
        const SimulationSettings& settings,
        std::mt19937& rng) const;

    double scoreSpawnSite(
        const Organism& parentA,
        const Organism& parentB,
        const Vector2i& site,
        ReproductionHost& host,
        const SimulationSettings& settings) const;

    ReproductionOutcome block(
        ReproductionOutcome outcome, BlockReason reason, ReproductionHost& host) const;
};

} // namespace EvoSim
