#include "Organism.h"

#include <algorithm>
#include <cmath>

namespace EvoSim {

namespace {

double lerp(double a, double b, double t)
{
    return a + (b - a) * std::clamp(t, 0.0, 1.0);
}

double effective(double localDensity, double multiplier)
{
    const double d = std::isfinite(localDensity) ? localDensity : 0.0;
    const double m = std::isfinite(multiplier) ? multiplier : 1.0;
    return std::clamp(d * m, 0.0, 1.0);
}

// Cost of perception per tick, per unit of sight.
constexpr double COGNITIVE_COST_PER_SIGHT = 0.002;

} // namespace

double DensityResponse::at(double effectiveDensity) const
{
    return lerp(low, high, effectiveDensity);
}

Organism::Organism(
    OrganismId id, std::shared_ptr<const Genome> genome, Vector2i position, double energy)
    : id(id),
      position(position),
      energy(std::isfinite(energy) ? std::max(0.0, energy) : 0.0),
      lifespan(static_cast<int>(std::lround(genome->trait(Trait::Lifespan)))),
      genome_(std::move(genome))
{
    movement_genes = { .wandering = trait(Trait::Wandering),
                       .pursuit = trait(Trait::Pursuit),
                       .cautious = trait(Trait::Cautious) };
    interaction_genes = { .avoid = trait(Trait::Avoid),
                          .fight = trait(Trait::Fight),
                          .cooperate = trait(Trait::Cooperate) };
}

int Organism::sightRadius() const
{
    return std::max(0, static_cast<int>(std::floor(trait(Trait::Sight))));
}

double Organism::ageFraction() const
{
    if (lifespan <= 0) {
        return 1.0;
    }
    return std::clamp(static_cast<double>(age) / lifespan, 0.0, 1.0);
}

double Organism::starvationThreshold(double maxTileEnergy) const
{
    return trait(Trait::StarvationThresholdFrac) * maxTileEnergy;
}

double Organism::reproductionThreshold(double maxTileEnergy, double fallbackFraction) const
{
    return genome_->findTrait(Trait::ReproductionThresholdFrac).value_or(fallbackFraction)
        * maxTileEnergy;
}

double Organism::allyThreshold(double fallback) const
{
    return genome_->findTrait(Trait::AllyThreshold).value_or(fallback);
}

double Organism::enemyThreshold(double fallback) const
{
    return genome_->findTrait(Trait::EnemyThreshold).value_or(fallback);
}

double Organism::hostilityBias(double effectiveDensity) const
{
    const double bias =
        lerp(trait(Trait::MinEnemyBias), trait(Trait::MaxEnemyBias), effectiveDensity);
    return std::max(0.0, bias * (0.4 + 0.8 * trait(Trait::RiskTolerance)));
}

double Organism::crowdingSensitivity(double maxTileEnergy) const
{
    const double tolerance = trait(Trait::CrowdingTolerance);
    const double reserve = maxTileEnergy > 0.0 ? std::clamp(energy / maxTileEnergy, 0.0, 1.0) : 0.0;

    // Intolerant or hungry occupants feel the crowd more.
    const double sensitivity = 0.35 + (1.0 - tolerance) * 1.0 + (1.0 - reserve) * 0.45;
    return std::clamp(sensitivity, 0.35, 1.8);
}

double Organism::computeReproductionProbability(
    const Organism& partner, const ReproductionSense& sense) const
{
    const double base =
        (trait(Trait::ReproductionProb) + partner.trait(Trait::ReproductionProb)) / 2.0;
    const double effD = effective(sense.localDensity, sense.densityEffectMultiplier);

    const double crowd = REPRODUCTION_RESPONSE.at(effD);
    const double senescence = 1.0
        - 0.5
            * (trait(Trait::SenescenceRate) * ageFraction()
               + partner.trait(Trait::SenescenceRate) * partner.ageFraction());

    const double tile =
        std::isfinite(sense.tileEnergyFraction) ? std::clamp(sense.tileEnergyFraction, 0.0, 1.0) : 0.0;
    const double trend =
        std::isfinite(sense.energyTrend) ? std::clamp(sense.energyTrend, -1.0, 1.0) : 0.0;
    const double energyFactor = (0.7 + 0.3 * tile) * (1.0 + 0.15 * trend);

    const double similarity =
        std::isfinite(sense.similarity) ? std::clamp(sense.similarity, 0.0, 1.0) : 0.0;
    const double kin = (trait(Trait::KinPreference) + partner.trait(Trait::KinPreference)) / 2.0;
    const double kinFactor = 1.0 + 0.1 * kin * (similarity - 0.5);

    const double probability =
        base * crowd * std::max(0.2, senescence) * energyFactor * kinFactor;
    return std::clamp(probability, 0.01, 0.95);
}

bool Organism::manageEnergy(
    double localDensity, double densityEffectMultiplier, double maxTileEnergy)
{
    const double effD = effective(localDensity, densityEffectMultiplier);

    const double loss = trait(Trait::EnergyLossBase) * trait(Trait::EnergyLossScale)
        * (1.0 + trait(Trait::Metabolism))
        * (1.0 + trait(Trait::SenescenceRate) * ageFraction()) * ENERGY_LOSS_RESPONSE.at(effD);
    const double cognitive = COGNITIVE_COST_PER_SIGHT * sightRadius() * (0.5 + 0.5 * effD);

    energy = std::clamp(energy - loss - cognitive, 0.0, maxTileEnergy);
    return energy <= starvationThreshold(maxTileEnergy);
}

void Organism::applyEventDamage(double energyLoss, double strength, double maxTileEnergy)
{
    if (!std::isfinite(energyLoss) || !std::isfinite(strength) || strength <= 0.0) {
        return;
    }

    const double felt = strength * (1.0 - 0.5 * trait(Trait::RecoveryRate));
    last_event_pressure = std::max(last_event_pressure, std::clamp(felt, 0.0, 1.0));

    const double damage = energyLoss * felt * (1.0 - trait(Trait::EventResistance));
    energy = std::clamp(energy - std::max(0.0, damage), 0.0, maxTileEnergy);
}

MovementStrategy Organism::chooseMovementStrategy(double effectiveDensity, std::mt19937& rng) const
{
    const double wandering = std::max(0.0, movement_genes.wandering);
    const double pursuit = std::max(0.0, movement_genes.pursuit);
    const double cautious = std::max(0.0, movement_genes.cautious)
        * CAUTIOUS_RESPONSE.at(effectiveDensity);

    const double total = wandering + pursuit + cautious;
    if (total <= 0.0) {
        return MovementStrategy::WANDERING;
    }

    const double roll = std::uniform_real_distribution<double>(0.0, total)(rng);
    if (roll < wandering) {
        return MovementStrategy::WANDERING;
    }
    if (roll < wandering + pursuit) {
        return MovementStrategy::PURSUIT;
    }
    return MovementStrategy::CAUTIOUS;
}

InteractionAction Organism::chooseInteractionAction(
    double effectiveDensity, std::mt19937& rng) const
{
    const double avoid = std::max(0.0, interaction_genes.avoid);
    const double fight = std::max(0.0, interaction_genes.fight) * FIGHT_RESPONSE.at(effectiveDensity);
    const double cooperate =
        std::max(0.0, interaction_genes.cooperate) * COOPERATE_RESPONSE.at(effectiveDensity);

    const double total = avoid + fight + cooperate;
    if (total <= 0.0) {
        return InteractionAction::AVOID;
    }

    const double roll = std::uniform_real_distribution<double>(0.0, total)(rng);
    if (roll < avoid) {
        return InteractionAction::AVOID;
    }
    if (roll < avoid + fight) {
        return InteractionAction::FIGHT;
    }
    return InteractionAction::COOPERATE;
}

double Organism::fitness(double maxTileEnergy) const
{
    const double energyTerm = maxTileEnergy > 0.0 ? energy / maxTileEnergy : 0.0;
    const double ageTerm = lifespan > 0 ? static_cast<double>(age) / lifespan : 0.0;
    return (fights_won - fights_lost) * 0.5 + offspring * 1.5 + energyTerm + ageTerm;
}

} // namespace EvoSim
