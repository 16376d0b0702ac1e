#include "core/DensityField.h"
#include "core/EvolutionStats.h"
#include "core/GridData.h"
#include "core/ReproductionPolicy.h"
#include "core/ReproductionZonePolicy.h"
#include "core/TileEnergyField.h"
#include "core/tests/GenomeBuilder.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <spdlog/spdlog.h>
#include <vector>

using namespace EvoSim;
using EvoSim::Test::GenomeBuilder;

namespace {

// Keeps every mate-choice record on top of the usual counters.
class RecordingStats : public EvolutionStats {
public:
    void recordMateChoice(const MateChoiceRecord& record) override
    {
        records.push_back(record);
        EvolutionStats::recordMateChoice(record);
    }

    std::vector<MateChoiceRecord> records;
};

// Minimal world: a grid, full tiles and no crowding.
class TestHost : public ReproductionHost {
public:
    TestHost(int rows, int cols)
        : grid_(rows, cols), field_(rows, cols, 5.0), density_(rows, cols, 1)
    {
        field_.fill(5.0);
        density_.sync(true);
    }

    Organism* place(int row, int col, double energy, const GenomeBuilder& builder)
    {
        auto& slot = grid_.occupants[grid_.index(row, col)];
        slot = std::make_unique<Organism>(nextId_++, builder.build(), Vector2i{ col, row }, energy);
        return slot.get();
    }

    void setZonePolicy(std::unique_ptr<ReproductionZonePolicy> policy)
    {
        zones_ = std::move(policy);
    }

    void block(int row, int col) { grid_.obstacles[grid_.index(row, col)] = 1; }

    const GridData& getGrid() const override { return grid_; }
    const TileEnergyField& getEnergyField() const override { return field_; }
    const DensityField& getDensityField() const override { return density_; }
    const ReproductionZonePolicy& getZonePolicy() const override { return *zones_; }
    StatsCollector& getStats() override { return stats; }

    bool moveOrganism(Organism& organism, const Vector2i& from, const Vector2i& to) override
    {
        if (!grid_.isOpen(to.y, to.x)) {
            return false;
        }
        grid_.occupants[grid_.index(to.y, to.x)] =
            std::move(grid_.occupants[grid_.index(from.y, from.x)]);
        organism.position = to;
        return true;
    }

    Organism* spawnOffspring(
        std::shared_ptr<const Genome> genome, const Vector2i& position, double energy) override
    {
        if (!grid_.isOpen(position.y, position.x)) {
            return nullptr;
        }
        auto& slot = grid_.occupants[grid_.index(position.y, position.x)];
        slot = std::make_unique<Organism>(nextId_++, std::move(genome), position, energy);
        const double room = std::max(0.0, 5.0 - slot->energy);
        slot->energy += std::min(room, field_.takeEnergyAt(position.y, position.x));
        return slot.get();
    }

    uint64_t getTick() const override { return 7; }
    uint32_t getWorldSeed() const override { return 99; }
    int getPopulation() const override { return population; }
    int getMinPopulation() const override { return minPopulation; }
    double getPopulationScarcity() const override { return scarcity; }

    RecordingStats stats;
    int population = 50;
    int minPopulation = 15;
    double scarcity = 0.0;

private:
    GridData grid_;
    TileEnergyField field_;
    DensityField density_;
    std::unique_ptr<ReproductionZonePolicy> zones_ = std::make_unique<AllowAllZonePolicy>();
    OrganismId nextId_ = 1;
};

TargetLists matesOf(Organism& mate, int distance)
{
    TargetLists lists;
    lists.mates.push_back(
        { .position = mate.position, .target = &mate, .similarity = 0.6, .distance = distance });
    return lists;
}

} // namespace

class ReproductionPolicyTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        settings = getDefaultSimulationSettings();
        // A floor of 1 disables the low-diversity penalty so the roll depends on base odds only.
        settings.reproduction.low_diversity_repro_multiplier = 1.0;
    }

    GenomeBuilder eager = GenomeBuilder()
                              .with(Trait::ReproductionProb, 1.0)
                              .with(Trait::ReproductionThresholdFrac, 0.3)
                              .with(Trait::ParentalInvestmentFrac, 0.4)
                              .with(Trait::StarvationThresholdFrac, 0.1)
                              .with(Trait::ReproductionCooldown, 6.0)
                              .with(Trait::MateReach, 1.0);

    SimulationSettings settings;
    ReproductionPolicy policy;
    std::mt19937 rng{ 21 };
};

TEST_F(ReproductionPolicyTest, ScarcityMultiplierIsNeutralWithoutScarcity)
{
    EXPECT_DOUBLE_EQ(
        ReproductionPolicy::computeScarcityMultiplier(nullptr, nullptr, 0.0, 0.4, 3, 15), 1.0);

    for (double s : { 0.05, 0.3, 0.7, 1.0 }) {
        for (double base : { 0.01, 0.3, 0.9 }) {
            const double m =
                ReproductionPolicy::computeScarcityMultiplier(nullptr, nullptr, s, base, 3, 15);
            EXPECT_GT(m, 1.0) << "scarcity " << s << " base " << base;
            EXPECT_LE(m, 1.0 + 1.1 * s) << "scarcity " << s << " base " << base;
        }
    }
}

TEST_F(ReproductionPolicyTest, CloserPairsAreNeverPenalizedLess)
{
    auto genome = GenomeBuilder().build();
    Organism a(1, genome, { 0, 0 }, 3.0);
    Organism b(2, genome, { 1, 0 }, 3.0);
    const PairContext context{ .localDensity = 0.3, .tileEnergy = 0.6, .diversityPressure = 0.4 };
    const double threshold = 0.45;
    const double floor = 0.2;

    double previous = 1.0;
    for (int step = 0; step <= 45; ++step) {
        const double diversity = threshold - step * 0.01;
        const double m = ReproductionPolicy::computeLowDiversityMultiplier(
            a, b, std::max(0.0, diversity), threshold, 0.5, floor, context);
        EXPECT_GE(m, floor);
        EXPECT_LE(m, 1.0);
        EXPECT_LE(m, previous + 1e-12) << "diversity " << diversity;
        previous = m;
    }
}

TEST_F(ReproductionPolicyTest, SimilarPairsLoseOddsAndDiversePairsKeepThem)
{
    auto genome = GenomeBuilder().build();
    Organism a(1, genome, { 0, 0 }, 3.0);
    Organism b(2, genome, { 1, 0 }, 3.0);

    ProbabilityInputs inputs;
    inputs.parentA = &a;
    inputs.parentB = &b;
    inputs.baseProbability = 0.5;
    inputs.threshold = 0.4;
    inputs.penaltyFloor = 0.57;

    inputs.similarity = 0.95;
    const ProbabilityBreakdown similar = ReproductionPolicy::computeReproductionProbability(inputs);
    inputs.similarity = 0.3;
    const ProbabilityBreakdown diverse = ReproductionPolicy::computeReproductionProbability(inputs);

    EXPECT_TRUE(similar.penalized);
    EXPECT_LT(similar.probability, 0.5);
    EXPECT_GE(similar.probability, 0.5 * 0.57 - 1e-12);
    EXPECT_FALSE(diverse.penalized);
    EXPECT_GE(diverse.probability, 0.5);
    EXPECT_GT(diverse.probability, similar.probability);
}

TEST_F(ReproductionPolicyTest, ScarcityLiftsProbability)
{
    ProbabilityInputs inputs;
    inputs.baseProbability = 0.3;
    inputs.similarity = 0.2;
    inputs.threshold = 0.4;
    inputs.population = 5;
    inputs.minPopulation = 15;

    const double calm = ReproductionPolicy::computeReproductionProbability(inputs).probability;
    inputs.context.scarcity = 0.8;
    const ProbabilityBreakdown scarce = ReproductionPolicy::computeReproductionProbability(inputs);

    EXPECT_GT(scarce.scarcityMultiplier, 1.0);
    EXPECT_GT(scarce.probability, calm);
}

TEST_F(ReproductionPolicyTest, ThresholdStaysInRangeAndComplementarityRelaxesIt)
{
    auto genome = GenomeBuilder().build();
    Organism a(1, genome, { 0, 0 }, 3.0);
    Organism b(2, genome, { 1, 0 }, 3.0);

    PairContext context{ .localDensity = 0.5, .tileEnergy = 0.2, .tileEnergyDelta = -0.5 };
    const double plain = ReproductionPolicy::computePairDiversityThreshold(a, b, 0.42, context);
    context.behaviorComplementarity = 1.0;
    const double complementary =
        ReproductionPolicy::computePairDiversityThreshold(a, b, 0.42, context);

    EXPECT_GE(plain, 0.0);
    EXPECT_LE(plain, 1.0);
    EXPECT_LE(complementary, plain);
}

TEST_F(ReproductionPolicyTest, KinPreferenceMapsToBias)
{
    auto kin = GenomeBuilder().with(Trait::KinPreference, 1.0).build();
    auto novel = GenomeBuilder().with(Trait::KinPreference, 0.0).build();

    EXPECT_DOUBLE_EQ(ReproductionPolicy::matePreferenceBias(Organism(1, kin, {}, 1.0)), 1.0);
    EXPECT_DOUBLE_EQ(ReproductionPolicy::matePreferenceBias(Organism(2, novel, {}, 1.0)), -1.0);
}

TEST_F(ReproductionPolicyTest, NoCandidatesIsReported)
{
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 4.0, eager);

    const ReproductionOutcome outcome = policy.attempt(*parent, { 2, 2 }, {}, host, settings, rng);

    EXPECT_FALSE(outcome.reproduced);
    EXPECT_EQ(outcome.reason, BlockReason::NO_CANDIDATES);
    EXPECT_EQ(host.stats.getTotals().blocked[static_cast<size_t>(BlockReason::NO_CANDIDATES)], 1u);
}

TEST_F(ReproductionPolicyTest, CooldownBlocksEitherParent)
{
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 4.0, eager);
    Organism* mate = host.place(2, 3, 4.0, eager);
    mate->reproduction_cooldown = 2;

    const ReproductionOutcome outcome =
        policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, rng);

    EXPECT_EQ(outcome.reason, BlockReason::COOLDOWN);
    EXPECT_EQ(outcome.mate, mate);
}

TEST_F(ReproductionPolicyTest, DistantMateIsApproachedButOutOfReach)
{
    TestHost host(5, 7);
    Organism* parent = host.place(2, 0, 4.0, eager);
    Organism* mate = host.place(2, 4, 4.0, eager);

    const ReproductionOutcome outcome =
        policy.attempt(*parent, { 0, 2 }, matesOf(*mate, 4), host, settings, rng);

    EXPECT_EQ(outcome.reason, BlockReason::OUT_OF_REACH);
    EXPECT_EQ(outcome.parentPosition, (Vector2i{ 1, 2 }));
    EXPECT_EQ(host.getGrid().occupantAt(2, 1), parent);
}

TEST_F(ReproductionPolicyTest, ZonesCanForbidThePair)
{
    TestHost host(6, 6);
    auto zones = std::make_unique<RectZonePolicy>();
    zones->addZone({ .x = 4, .y = 4, .width = 2, .height = 2 });
    host.setZonePolicy(std::move(zones));
    Organism* parent = host.place(1, 1, 4.0, eager);
    Organism* mate = host.place(1, 2, 4.0, eager);

    const ReproductionOutcome outcome =
        policy.attempt(*parent, { 1, 1 }, matesOf(*mate, 1), host, settings, rng);

    EXPECT_EQ(outcome.reason, BlockReason::ZONE_BLOCKED);
}

TEST_F(ReproductionPolicyTest, HungryParentsAreBlockedAfterTheRoll)
{
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 1.0, eager);
    Organism* mate = host.place(2, 3, 4.0, eager);

    ReproductionOutcome outcome;
    for (int i = 0; i < 100; ++i) {
        outcome = policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, rng);
        if (outcome.reason != BlockReason::PROBABILITY_ROLL) {
            break;
        }
    }

    EXPECT_EQ(outcome.reason, BlockReason::LOW_ENERGY);
    EXPECT_DOUBLE_EQ(parent->energy, 1.0);
    EXPECT_GT(host.stats.getTotals().mateChoices, 0u);
}

TEST_F(ReproductionPolicyTest, EnclosedPairHasNoSpawnSite)
{
    TestHost host(1, 2);
    Organism* parent = host.place(0, 0, 4.0, eager);
    Organism* mate = host.place(0, 1, 4.0, eager);

    ReproductionOutcome outcome;
    for (int i = 0; i < 100; ++i) {
        outcome = policy.attempt(*parent, { 0, 0 }, matesOf(*mate, 1), host, settings, rng);
        if (outcome.reason != BlockReason::PROBABILITY_ROLL) {
            break;
        }
    }

    EXPECT_EQ(outcome.reason, BlockReason::NO_SPAWN_SITE);
    EXPECT_DOUBLE_EQ(parent->energy, 4.0);
    EXPECT_DOUBLE_EQ(mate->energy, 4.0);
}

TEST_F(ReproductionPolicyTest, SuccessfulPairingSpawnsAdjacentOffspring)
{
    spdlog::info("Starting ReproductionPolicyTest::SuccessfulPairingSpawnsAdjacentOffspring test");
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 4.0, eager);
    Organism* mate = host.place(2, 3, 4.0, eager);

    ReproductionOutcome outcome;
    for (int i = 0; i < 100 && !outcome.reproduced; ++i) {
        outcome = policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, rng);
        if (!outcome.reproduced) {
            ASSERT_EQ(outcome.reason, BlockReason::PROBABILITY_ROLL);
        }
    }

    ASSERT_TRUE(outcome.reproduced);
    ASSERT_NE(outcome.offspring, nullptr);
    ASSERT_TRUE(outcome.spawnPosition.has_value());
    EXPECT_EQ(outcome.reason, BlockReason::NONE);

    const Vector2i site = *outcome.spawnPosition;
    EXPECT_LE(std::min(chebyshevDistance(site, { 2, 2 }), chebyshevDistance(site, { 3, 2 })), 1);
    EXPECT_EQ(host.getGrid().occupantAt(site), outcome.offspring);

    // Each parent invests min(40% of 4.0, 4.0 - 0.5).
    EXPECT_NEAR(parent->energy, 2.4, 1e-12);
    EXPECT_NEAR(mate->energy, 2.4, 1e-12);
    EXPECT_NEAR(outcome.offspring->energy, 5.0, 1e-12);

    EXPECT_EQ(parent->reproduction_cooldown, 6);
    EXPECT_EQ(mate->reproduction_cooldown, 6);
    EXPECT_EQ(parent->offspring, 1);
    EXPECT_EQ(mate->offspring, 1);
    EXPECT_EQ(host.stats.getTotals().births, 1u);
    EXPECT_EQ(host.stats.getTotals().matingSuccesses, 1u);
}

TEST_F(ReproductionPolicyTest, ScarcityShortensCooldowns)
{
    TestHost host(5, 5);
    host.scarcity = 1.0;
    host.population = 2;
    Organism* parent = host.place(2, 2, 4.0, eager);
    Organism* mate = host.place(2, 3, 4.0, eager);

    ReproductionOutcome outcome;
    for (int i = 0; i < 100 && !outcome.reproduced; ++i) {
        outcome = policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, rng);
    }

    ASSERT_TRUE(outcome.reproduced);
    EXPECT_EQ(parent->reproduction_cooldown, 3);
}

TEST_F(ReproductionPolicyTest, OffspringGenomeIsKeyedOnTickAndParents)
{
    TestHost first(5, 5);
    TestHost second(5, 5);
    std::mt19937 rngA(1);
    std::mt19937 rngB(1);

    auto run = [&](TestHost& host, std::mt19937& generator) {
        Organism* parent = host.place(2, 2, 4.0, eager);
        Organism* mate = host.place(2, 3, 4.0, GenomeBuilder(40).with(Trait::MateReach, 1.0));
        ReproductionOutcome outcome;
        for (int i = 0; i < 100 && !outcome.reproduced; ++i) {
            outcome =
                policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, generator);
        }
        return outcome;
    };

    const ReproductionOutcome a = run(first, rngA);
    const ReproductionOutcome b = run(second, rngB);

    ASSERT_TRUE(a.reproduced);
    ASSERT_TRUE(b.reproduced);
    EXPECT_EQ(a.offspring->genome().loci(), b.offspring->genome().loci());
}

TEST_F(ReproductionPolicyTest, MateChoiceRecordsDescribeThePairing)
{
    settings.reproduction.mate_pool_limit = 2;
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 4.0, eager);
    Organism* near = host.place(2, 3, 4.0, eager);
    Organism* side = host.place(1, 2, 4.0, eager);
    Organism* far = host.place(0, 0, 4.0, eager);

    TargetLists lists;
    lists.mates.push_back(
        { .position = near->position, .target = near, .similarity = 0.6, .distance = 1 });
    lists.mates.push_back(
        { .position = side->position, .target = side, .similarity = 0.6, .distance = 1 });
    lists.mates.push_back(
        { .position = far->position, .target = far, .similarity = 0.6, .distance = 2 });

    ReproductionOutcome outcome;
    for (int i = 0; i < 100 && !outcome.reproduced; ++i) {
        outcome = policy.attempt(*parent, { 2, 2 }, lists, host, settings, rng);
    }
    ASSERT_TRUE(outcome.reproduced);
    ASSERT_FALSE(host.stats.records.empty());

    for (const MateChoiceRecord& record : host.stats.records) {
        EXPECT_EQ(record.parent, parent->id);
        EXPECT_EQ(record.poolSize, 2u);
        if (!record.success) {
            EXPECT_EQ(record.reason, BlockReason::PROBABILITY_ROLL);
        }
    }

    const MateChoiceRecord& last = host.stats.records.back();
    EXPECT_TRUE(last.success);
    EXPECT_EQ(last.reason, BlockReason::NONE);
    EXPECT_EQ(last.mate, outcome.mate->id);
    EXPECT_DOUBLE_EQ(last.similarity, 0.6);
    EXPECT_DOUBLE_EQ(last.penaltyMultiplier, outcome.breakdown.penaltyMultiplier);
    EXPECT_DOUBLE_EQ(last.bonusMultiplier, outcome.breakdown.bonusMultiplier);
    EXPECT_DOUBLE_EQ(last.scarcityMultiplier, outcome.breakdown.scarcityMultiplier);
}

TEST_F(ReproductionPolicyTest, BlockedPairingRecordsItsReason)
{
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 1.0, eager);
    Organism* mate = host.place(2, 3, 4.0, eager);

    ReproductionOutcome outcome;
    for (int i = 0; i < 100; ++i) {
        outcome = policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, rng);
        if (outcome.reason != BlockReason::PROBABILITY_ROLL) {
            break;
        }
    }

    ASSERT_EQ(outcome.reason, BlockReason::LOW_ENERGY);
    ASSERT_FALSE(host.stats.records.empty());
    EXPECT_EQ(host.stats.records.back().reason, BlockReason::LOW_ENERGY);
    EXPECT_EQ(host.stats.records.back().poolSize, 1u);
    EXPECT_FALSE(host.stats.records.back().success);
}

TEST_F(ReproductionPolicyTest, InvestmentNeverExceedsWhatTheChildHolds)
{
    const GenomeBuilder generous = GenomeBuilder(eager).with(Trait::ParentalInvestmentFrac, 0.9);
    TestHost host(5, 5);
    Organism* parent = host.place(2, 2, 5.0, generous);
    Organism* mate = host.place(2, 3, 5.0, generous);

    ReproductionOutcome outcome;
    for (int i = 0; i < 100 && !outcome.reproduced; ++i) {
        outcome = policy.attempt(*parent, { 2, 2 }, matesOf(*mate, 1), host, settings, rng);
    }
    ASSERT_TRUE(outcome.reproduced);

    // Each would give 4.5; together they are scaled down to one tile's worth.
    EXPECT_NEAR(parent->energy, 2.5, 1e-12);
    EXPECT_NEAR(mate->energy, 2.5, 1e-12);
    EXPECT_NEAR(outcome.offspring->energy, 5.0, 1e-12);
}
