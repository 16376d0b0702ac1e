#include "ReproductionPolicy.h"
#include "BehaviorComplementarity.h"
#include "DensityField.h"
#include "GridData.h"
#include "LoggingChannels.h"
#include "RandomStreams.h"
#include "ReproductionZonePolicy.h"
#include "TileEnergyField.h"

#include <algorithm>
#include <cmath>

namespace EvoSim {

namespace {

double unitClamp(double value)
{
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
}

double fertilityFraction(const Organism& organism)
{
    return unitClamp(organism.genome().findTrait(Trait::ReproductionThresholdFrac).value_or(0.4));
}

// Density, low tile energy and a shrinking tile all push toward urgency.
double environmentUrgency(const PairContext& context, double densityWeight, double energyWeight,
                          double declineWeight)
{
    return unitClamp(
        densityWeight * unitClamp(context.localDensity)
        + energyWeight * unitClamp(1.0 - context.tileEnergy)
        + declineWeight * unitClamp(-context.tileEnergyDelta));
}

int stepToward(int from, int to)
{
    return (to > from) - (to < from);
}

} // namespace

double ReproductionPolicy::matePreferenceBias(const Organism& organism)
{
    return std::clamp(2.0 * organism.trait(Trait::KinPreference) - 1.0, -1.0, 1.0);
}

double ReproductionPolicy::diversityDrive(const Organism& organism, const PairContext& context)
{
    const double appetite = unitClamp(organism.trait(Trait::DiversityAppetite));
    const double bias = matePreferenceBias(organism);
    const double curiosity =
        unitClamp(appetite + std::max(0.0, -bias) * 0.5 - std::max(0.0, bias) * 0.4);
    const double caution = unitClamp(1.0 - fertilityFraction(organism));
    const double environment = environmentUrgency(context, 0.5, 0.3, 0.2);
    const double drive = curiosity * (0.55 + 0.45 * caution);

    return unitClamp(drive * 0.7 + environment * 0.3);
}

double ReproductionPolicy::computePairDiversityThreshold(
    const Organism& a,
    const Organism& b,
    double baseline,
    const PairContext& context,
    double pressureShift)
{
    const double base = unitClamp(baseline);

    const double appetiteAverage =
        (unitClamp(a.trait(Trait::DiversityAppetite)) + unitClamp(b.trait(Trait::DiversityAppetite)))
        / 2.0;
    const double appetiteDelta = appetiteAverage - 0.35;

    const double biasAverage =
        std::clamp((matePreferenceBias(a) + matePreferenceBias(b)) / 2.0, -1.0, 1.0);
    const double noveltyBias = std::max(0.0, -biasAverage);
    const double kinBias = std::max(0.0, biasAverage);

    const double caution = unitClamp(1.0 - (fertilityFraction(a) + fertilityFraction(b)) / 2.0);
    const double cautionDelta = caution - 0.5;

    const double urgency = environmentUrgency(context, 0.45, 0.35, 0.2);
    const double pressure = unitClamp(context.diversityPressure);
    const double complement = unitClamp(context.behaviorComplementarity);
    const double scarcity = unitClamp(context.scarcity);

    const double appetiteShift = appetiteDelta * (0.3 + urgency * 0.3 + pressure * 0.2);
    const double cautionShift = cautionDelta * (0.18 + urgency * 0.22);
    const double noveltyShift = noveltyBias * (0.15 + urgency * 0.25 + pressure * 0.2);
    const double kinShift = kinBias * (0.2 - urgency * 0.1 - pressure * 0.05);
    const double complementRelief =
        complement * (0.2 + pressure * 0.25 + urgency * 0.2 + scarcity * 0.3);

    const double delta =
        appetiteShift + cautionShift + noveltyShift + pressure * pressureShift - kinShift;
    const double raw = unitClamp(base + delta - complementRelief);
    const double smoothing = unitClamp(0.25 + urgency * 0.35 + pressure * 0.25);

    return unitClamp(base * (1.0 - smoothing) + raw * smoothing);
}

double ReproductionPolicy::computeLowDiversityMultiplier(
    const Organism& a,
    const Organism& b,
    double diversity,
    double threshold,
    double baseProbability,
    double floor,
    const PairContext& context)
{
    const double floorValue = unitClamp(floor);
    if (!(threshold > 0.0)) {
        return 1.0;
    }

    const double shortfall = unitClamp(1.0 - unitClamp(diversity) / threshold);
    const double closeness = shortfall > 0.0 ? std::pow(shortfall, 0.35) : 0.0;

    const double combinedDrive = unitClamp((diversityDrive(a, context) + diversityDrive(b, context)) / 2.0);
    const double environment = environmentUrgency(context, 0.5, 0.3, 0.2);
    const double slack = unitClamp(1.0 - baseProbability);

    const double kinPreference =
        std::clamp((matePreferenceBias(a) + matePreferenceBias(b)) / 2.0, -1.0, 1.0);
    const double kinComfort = unitClamp(0.5 + 0.5 * kinPreference);

    const double evenness = unitClamp(context.behaviorEvenness);
    const double evennessDrag = 1.0 - evenness;
    const double complement = unitClamp(context.behaviorComplementarity);
    const double pressure = unitClamp(context.diversityPressure);
    const double scarcity = unitClamp(context.scarcity);

    double severity = closeness * 0.35 + closeness * combinedDrive * (0.4 + 0.2 * slack)
        + closeness * environment * (0.25 + 0.25 * slack) + closeness * slack * 0.1;

    severity *= std::clamp(1.0 - kinComfort * 0.6, 0.3, 1.0);
    severity *= 1.0 + pressure * 0.75;
    severity *= 1.0 + evennessDrag * (0.35 + 0.25 * combinedDrive);

    if (complement > 0.0 && evennessDrag > 0.0) {
        const double reliefScale =
            0.25 + evennessDrag * 0.4 + combinedDrive * 0.25 + pressure * 0.2;
        const double relief = std::clamp(complement * reliefScale, 0.0, 0.8);
        severity *= std::clamp(1.0 - relief, 0.25, 1.0);
        severity -= complement * evennessDrag * 0.12;
    }

    severity = unitClamp(severity);
    if (scarcity > 0.0) {
        severity *= std::clamp(1.0 - scarcity * 0.65, 0.15, 1.0);
    }

    const double evennessRelief = std::clamp(evenness * (0.25 + pressure * 0.2), 0.0, 0.45);
    if (evennessRelief > 0.0) {
        severity *= std::clamp(1.0 - evennessRelief, 0.25, 1.0);
    }

    return std::clamp(1.0 - severity, floorValue, 1.0);
}

double ReproductionPolicy::computeScarcityMultiplier(
    const Organism* a,
    const Organism* b,
    double scarcity,
    double baseProbability,
    int population,
    int minPopulation)
{
    const double s = unitClamp(scarcity);
    if (s <= 0.0) {
        return 1.0;
    }

    const double base = std::isfinite(baseProbability) ? std::clamp(baseProbability, 0.0, 1.0) : 0.5;
    const double deficit = minPopulation > 0
        ? unitClamp(static_cast<double>(minPopulation - std::max(0, population)) / minPopulation)
        : s;

    const double driveA = a ? a->trait(Trait::DiversityDrive) : 1.0;
    const double driveB = b ? b->trait(Trait::DiversityDrive) : 1.0;
    const double alignment = std::clamp((driveA + driveB) / 2.0, 0.3, 2.0);

    const double lift = 1.0 + s * (0.25 + (1.0 - base) * 0.45 + deficit * 0.35);
    return std::clamp(1.0 + (lift - 1.0) * alignment, 1.0, 1.0 + 1.1 * s);
}

ProbabilityBreakdown ReproductionPolicy::computeReproductionProbability(
    const ProbabilityInputs& inputs)
{
    ProbabilityBreakdown result;
    const PairContext& context = inputs.context;

    result.baseProbability = unitClamp(inputs.baseProbability);
    result.diversity = 1.0 - unitClamp(inputs.similarity);
    result.threshold = unitClamp(inputs.threshold);

    double probability = result.baseProbability;

    if (result.diversity < result.threshold) {
        result.penalized = true;
        if (inputs.parentA && inputs.parentB) {
            result.penaltyMultiplier = computeLowDiversityMultiplier(
                *inputs.parentA,
                *inputs.parentB,
                result.diversity,
                result.threshold,
                result.baseProbability,
                inputs.penaltyFloor,
                context);
        }
        probability = unitClamp(probability * result.penaltyMultiplier);
    }
    else {
        const double pressure = unitClamp(context.diversityPressure);
        double bonus = 1.0;

        if (pressure > 0.0 && result.threshold < 1.0) {
            const double excess =
                unitClamp((result.diversity - result.threshold) / (1.0 - result.threshold));
            bonus *= 1.0 + excess * inputs.diversityBonusScale * (0.5 + 0.5 * pressure);
        }

        const double complement = unitClamp(context.behaviorComplementarity);
        const double complementPressure = 1.0 - unitClamp(context.behaviorEvenness);
        if (complement > 0.0 && complementPressure > 0.0) {
            bonus *= 1.0
                + complement * complementPressure * (inputs.complementBonusScale + pressure * 0.22);
        }

        result.bonusMultiplier = bonus;
        probability = unitClamp(probability * bonus);
    }

    if (context.scarcity > 0.0 && probability > 0.0) {
        result.scarcityMultiplier = computeScarcityMultiplier(
            inputs.parentA,
            inputs.parentB,
            context.scarcity,
            probability,
            inputs.population,
            inputs.minPopulation);
        probability = unitClamp(probability * result.scarcityMultiplier);
    }

    result.probability = probability;
    return result;
}

ReproductionPolicy::MateChoice ReproductionPolicy::selectMate(
    const Organism& parent,
    const Vector2i& /*position*/,
    const std::vector<TargetEntry>& pool,
    int limit,
    std::mt19937& rng) const
{
    MateChoice choice;
    if (pool.empty()) {
        return choice;
    }

    std::vector<const TargetEntry*> nearest;
    nearest.reserve(pool.size());
    for (const auto& entry : pool) {
        if (entry.target && entry.target->isAlive()) {
            nearest.push_back(&entry);
        }
    }
    std::stable_sort(nearest.begin(), nearest.end(), [](const TargetEntry* a, const TargetEntry* b) {
        return a->distance < b->distance;
    });
    if (limit > 0 && nearest.size() > static_cast<size_t>(limit)) {
        nearest.resize(static_cast<size_t>(limit));
    }
    choice.poolSize = nearest.size();
    if (nearest.empty()) {
        return choice;
    }

    const double bias = matePreferenceBias(parent);
    const double appetite = unitClamp(parent.trait(Trait::DiversityAppetite));

    std::vector<double> weights(nearest.size());
    double totalWeight = 0.0;
    for (size_t i = 0; i < nearest.size(); ++i) {
        const double similarity = unitClamp(nearest[i]->similarity);
        const double diversity = 1.0 - similarity;
        const double similarPull = similarity * (1.0 + std::max(0.0, bias));
        const double diversePull = diversity * (1.0 + std::max(0.0, -bias) + appetite);
        const double curiosityBonus = diversity * appetite * 0.5;
        weights[i] = std::max(0.0001, similarPull + diversePull + curiosityBonus);
        totalWeight += weights[i];
    }

    const double curiosityChance = std::min(
        CURIOSITY_CHANCE_CAP, appetite * 0.25 + unitClamp(parent.trait(Trait::MateCuriosity)));

    if (nearest.size() > 1 && RandomStreams::unit(rng) < curiosityChance) {
        std::vector<const TargetEntry*> novel = nearest;
        std::stable_sort(novel.begin(), novel.end(), [](const TargetEntry* a, const TargetEntry* b) {
            return a->similarity < b->similarity;
        });
        const size_t tailSpan = std::max<size_t>(
            1, static_cast<size_t>(std::ceil(novel.size() * (0.2 + appetite * 0.5))));
        const size_t idx = std::min(
            novel.size() - 1, static_cast<size_t>(RandomStreams::unit(rng) * tailSpan));
        choice.entry = novel[idx];
        choice.curiosity = true;
        return choice;
    }

    if (totalWeight > 0.0) {
        double roll = RandomStreams::unit(rng) * totalWeight;
        for (size_t i = 0; i < nearest.size(); ++i) {
            roll -= weights[i];
            if (roll <= 0.0) {
                choice.entry = nearest[i];
                return choice;
            }
        }
        choice.entry = nearest.back();
        return choice;
    }

    choice.entry = *std::max_element(
        nearest.begin(), nearest.end(), [](const TargetEntry* a, const TargetEntry* b) {
            return a->similarity < b->similarity;
        });
    return choice;
}

double ReproductionPolicy::scoreSpawnSite(
    const Organism& parentA,
    const Organism& parentB,
    const Vector2i& site,
    ReproductionHost& host,
    const SimulationSettings& settings) const
{
    const auto& field = host.getEnergyField();
    const double maxEnergy = field.getMaxTileEnergy();

    const double tileEnergy = unitClamp(field.getEnergyAt(site.y, site.x) / maxEnergy);
    const double tileTrend = unitClamp((field.getDeltaAt(site.y, site.x) + 1.0) / 2.0);
    const double density = unitClamp(
        host.getDensityField().getDensityAt(site.y, site.x)
        * settings.energy.density_effect_multiplier);

    const double crowdComfort = unitClamp(
        (parentA.trait(Trait::CrowdingTolerance) + parentB.trait(Trait::CrowdingTolerance)) / 2.0);
    const double crowdAffinity = unitClamp(1.0 - std::abs(density - crowdComfort));
    const double resourceDrive = unitClamp(
        (parentA.trait(Trait::ExploitationBias) + parentB.trait(Trait::ExploitationBias)) / 2.0);
    const double risk = unitClamp(
        (parentA.trait(Trait::RiskTolerance) + parentB.trait(Trait::RiskTolerance)) / 2.0);

    const double energyWeight = 0.45 + resourceDrive * 0.35;
    const double densityWeight = 0.35 + (1.0 - resourceDrive) * 0.25;
    const double trendWeight = 0.2 + resourceDrive * 0.3;
    const double crowdRiskPenalty =
        density > crowdComfort ? (density - crowdComfort) * risk * 0.6 : 0.0;

    return std::max(
        0.0,
        tileEnergy * energyWeight + crowdAffinity * densityWeight + tileTrend * trendWeight
            - crowdRiskPenalty);
}

std::optional<Vector2i> ReproductionPolicy::chooseSpawnSite(
    const Organism& parentA,
    const Organism& parentB,
    const std::vector<Vector2i>& anchors,
    ReproductionHost& host,
    const SimulationSettings& settings,
    std::mt19937& rng) const
{
    const GridData& grid = host.getGrid();

    std::vector<Vector2i> candidates;
    auto consider = [&](const Vector2i& pos) {
        if (!grid.isOpen(pos.y, pos.x)) {
            return;
        }
        if (std::find(candidates.begin(), candidates.end(), pos) == candidates.end()) {
            candidates.push_back(pos);
        }
    };

    for (const auto& anchor : anchors) {
        consider(anchor);
        for (int dr = -1; dr <= 1; ++dr) {
            for (int dc = -1; dc <= 1; ++dc) {
                if (dr != 0 || dc != 0) {
                    consider({ anchor.x + dc, anchor.y + dr });
                }
            }
        }
    }

    candidates = host.getZonePolicy().filterSpawnCandidates(candidates);
    if (candidates.empty()) {
        return std::nullopt;
    }

    const auto& field = host.getEnergyField();
    std::vector<double> weights(candidates.size(), 0.0);
    std::vector<size_t> energized;
    double totalWeight = 0.0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (field.getEnergyAt(candidates[i].y, candidates[i].x) > 0.0) {
            energized.push_back(i);
            weights[i] = scoreSpawnSite(parentA, parentB, candidates[i], host, settings);
            totalWeight += weights[i];
        }
    }

    if (totalWeight > 0.0) {
        double roll = RandomStreams::unit(rng) * totalWeight;
        for (size_t i = 0; i < candidates.size(); ++i) {
            roll -= weights[i];
            if (weights[i] > 0.0 && roll <= 0.0) {
                return candidates[i];
            }
        }
        return candidates[energized.back()];
    }

    if (!energized.empty()) {
        return candidates[energized[RandomStreams::index(rng, energized.size())]];
    }
    return candidates[RandomStreams::index(rng, candidates.size())];
}

ReproductionOutcome ReproductionPolicy::block(
    ReproductionOutcome outcome, BlockReason reason, ReproductionHost& host) const
{
    outcome.reproduced = false;
    outcome.reason = reason;
    host.getStats().recordReproductionBlocked(reason);
    return outcome;
}

ReproductionOutcome ReproductionPolicy::attempt(
    Organism& parent,
    const Vector2i& position,
    const TargetLists& targets,
    ReproductionHost& host,
    const SimulationSettings& settings,
    std::mt19937& rng) const
{
    ReproductionOutcome outcome;
    outcome.parentPosition = position;

    const auto& pool = targets.mates.empty() ? targets.society : targets.mates;
    const MateChoice choice =
        selectMate(parent, position, pool, settings.reproduction.mate_pool_limit, rng);
    if (!choice.entry) {
        return block(outcome, BlockReason::NO_CANDIDATES, host);
    }

    Organism& mate = *choice.entry->target;
    const Vector2i matePos = choice.entry->position;
    outcome.mate = &mate;

    // Close the gap by one step when the pair is not already adjacent.
    Vector2i current = position;
    if (chebyshevDistance(current, matePos) > 1) {
        const Vector2i next{ current.x + stepToward(current.x, matePos.x),
                             current.y + stepToward(current.y, matePos.y) };
        if (host.getGrid().isOpen(next.y, next.x) && host.moveOrganism(parent, current, next)) {
            current = next;
        }
    }
    outcome.parentPosition = current;

    const double reach = (parent.trait(Trait::MateReach) + mate.trait(Trait::MateReach)) / 2.0;
    if (chebyshevDistance(current, matePos) > reach) {
        return block(outcome, BlockReason::OUT_OF_REACH, host);
    }

    if (parent.reproduction_cooldown > 0 || mate.reproduction_cooldown > 0) {
        return block(outcome, BlockReason::COOLDOWN, host);
    }

    const ZoneDecision pairZone =
        host.getZonePolicy().validateArea({ .parentA = current, .parentB = matePos, .spawn = {} });
    if (!pairZone.allowed) {
        LoggingChannels::reproduction()->trace("Pair {}/{} blocked: {}", parent.id, mate.id, pairZone.reason);
        return block(outcome, BlockReason::ZONE_BLOCKED, host);
    }

    const auto& field = host.getEnergyField();
    const double maxEnergy = field.getMaxTileEnergy();
    const double rawDensity = host.getDensityField().getDensityAt(current.y, current.x);
    const double densityMultiplier = settings.energy.density_effect_multiplier;
    auto& stats = host.getStats();

    PairContext context;
    context.localDensity = unitClamp(rawDensity * densityMultiplier);
    context.tileEnergy = unitClamp(field.getEnergyAt(current.y, current.x) / maxEnergy);
    context.tileEnergyDelta = std::clamp(field.getDeltaAt(current.y, current.x), -1.0, 1.0);
    context.diversityPressure = stats.getDiversityPressure();
    context.behaviorComplementarity = BehaviorComplementarity::compute(parent, mate);
    context.behaviorEvenness = stats.getBehaviorEvenness();
    context.scarcity = host.getPopulationScarcity();

    const double similarity = choice.entry->similarity;
    const ReproductionSense sense{ .localDensity = rawDensity,
                                   .densityEffectMultiplier = densityMultiplier,
                                   .tileEnergyFraction = context.tileEnergy,
                                   .energyTrend = context.tileEnergyDelta,
                                   .similarity = similarity };

    ProbabilityInputs inputs;
    inputs.parentA = &parent;
    inputs.parentB = &mate;
    inputs.baseProbability = parent.computeReproductionProbability(mate, sense);
    inputs.similarity = similarity;
    inputs.threshold = computePairDiversityThreshold(
        parent,
        mate,
        settings.reproduction.mating_diversity_threshold,
        context,
        settings.reproduction.diversity_pressure_shift);
    inputs.penaltyFloor = settings.reproduction.low_diversity_repro_multiplier;
    inputs.diversityBonusScale = settings.reproduction.diversity_bonus_scale;
    inputs.complementBonusScale = settings.reproduction.complement_bonus_scale;
    inputs.population = host.getPopulation();
    inputs.minPopulation = host.getMinPopulation();
    inputs.context = context;

    outcome.breakdown = computeReproductionProbability(inputs);

    MateChoiceRecord record{ .parent = parent.id,
                             .mate = mate.id,
                             .similarity = similarity,
                             .diversity = outcome.breakdown.diversity,
                             .threshold = outcome.breakdown.threshold,
                             .probability = outcome.breakdown.probability,
                             .penaltyMultiplier = outcome.breakdown.penaltyMultiplier,
                             .bonusMultiplier = outcome.breakdown.bonusMultiplier,
                             .scarcityMultiplier = outcome.breakdown.scarcityMultiplier,
                             .poolSize = static_cast<uint32_t>(choice.poolSize),
                             .curiosityPick = choice.curiosity,
                             .success = false };
    auto rejectPair = [&](BlockReason reason) {
        record.reason = reason;
        stats.recordMateChoice(record);
        return block(outcome, reason, host);
    };

    if (!(RandomStreams::unit(rng) < outcome.breakdown.probability)) {
        return rejectPair(BlockReason::PROBABILITY_ROLL);
    }

    const double fallbackFrac = settings.reproduction.reproduction_threshold_fraction;
    if (parent.energy < parent.reproductionThreshold(maxEnergy, fallbackFrac)
        || mate.energy < mate.reproductionThreshold(maxEnergy, fallbackFrac)) {
        return rejectPair(BlockReason::LOW_ENERGY);
    }

    const auto site =
        chooseSpawnSite(parent, mate, { position, current, matePos }, host, settings, rng);
    if (!site) {
        return rejectPair(BlockReason::NO_SPAWN_SITE);
    }
    outcome.spawnPosition = site;

    const ZoneDecision spawnZone = host.getZonePolicy().validateArea(
        { .parentA = current, .parentB = matePos, .spawn = *site });
    if (!spawnZone.allowed) {
        return rejectPair(BlockReason::SPAWN_ZONE_BLOCKED);
    }

    double investA = std::min(
        parent.energy * parent.trait(Trait::ParentalInvestmentFrac),
        parent.energy - parent.starvationThreshold(maxEnergy));
    double investB = std::min(
        mate.energy * mate.trait(Trait::ParentalInvestmentFrac),
        mate.energy - mate.starvationThreshold(maxEnergy));
    if (!(investA > 0.0) || !(investB > 0.0)) {
        return rejectPair(BlockReason::INSUFFICIENT_INVESTMENT);
    }

    // A child holds at most one tile's worth; parents only pay for what it can take.
    if (investA + investB > maxEnergy) {
        const double scale = maxEnergy / (investA + investB);
        investA *= scale;
        investB *= scale;
    }

    const double mutationChance =
        (parent.trait(Trait::MutationChance) + mate.trait(Trait::MutationChance)) / 2.0;
    const double mutationRange =
        (parent.trait(Trait::MutationRange) + mate.trait(Trait::MutationRange)) / 2.0;
    auto stream = RandomStreams::keyedStream(
        host.getWorldSeed(),
        "offspring",
        { host.getTick(), std::min(parent.id, mate.id), std::max(parent.id, mate.id) });
    auto genome = std::make_shared<const Genome>(
        parent.genome().crossover(mate.genome(), stream, mutationChance, mutationRange));

    parent.energy -= investA;
    mate.energy -= investB;

    Organism* child = host.spawnOffspring(std::move(genome), *site, investA + investB);
    if (!child) {
        parent.energy += investA;
        mate.energy += investB;
        return rejectPair(BlockReason::NO_SPAWN_SITE);
    }

    const double scarcity = unitClamp(context.scarcity);
    const int relief = scarcity > 0.0 ? static_cast<int>(std::lround(1.0 + 2.0 * scarcity)) : 0;
    auto cooldownFor = [relief](const Organism& organism) {
        const int base = static_cast<int>(std::lround(organism.trait(Trait::ReproductionCooldown)));
        return std::max(0, base - relief);
    };
    parent.reproduction_cooldown = cooldownFor(parent);
    mate.reproduction_cooldown = cooldownFor(mate);
    ++parent.offspring;
    ++mate.offspring;

    stats.onBirth(*child);
    record.success = true;
    stats.recordMateChoice(record);

    outcome.reproduced = true;
    outcome.offspring = child;

    LoggingChannels::reproduction()->trace(
        "Organisms {} and {} produced {} at ({}, {}), p={:.3f}, diversity {:.3f} vs {:.3f}",
        parent.id,
        mate.id,
        child->id,
        site->y,
        site->x,
        outcome.breakdown.probability,
        outcome.breakdown.diversity,
        outcome.breakdown.threshold);
    return outcome;
}

} // namespace EvoSim
