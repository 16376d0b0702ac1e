#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string_view>

namespace EvoSim {

/**
 * Numeric traits an organism's genome can provide.
 *
 * Consumers ask for a trait and always receive a number: GenomeTraits::get() falls back to
 * the per-trait default when the genome does not set it. Traits listed as "settings-backed"
 * are read with find() so that the simulation settings supply the fallback instead.
 */
enum class Trait : uint8_t {
    // Foraging and metabolism.
    ForageRate = 0,
    HarvestCapMin,
    HarvestCapMax,
    EnergyLossBase,
    EnergyLossScale,
    Metabolism,
    MoveCost,
    StarvationThresholdFrac,
    // Life cycle.
    Lifespan,
    SenescenceRate,
    ActivityRate,
    RecoveryRate,
    EventResistance,
    DecayReturnFraction, // Settings-backed.
    // Perception and social classification.
    Sight,
    AllyThreshold,  // Settings-backed.
    EnemyThreshold, // Settings-backed.
    MinEnemyBias,
    MaxEnemyBias,
    RiskTolerance,
    CrowdingTolerance,
    Cohesion,
    ExploitationBias,
    // Reproduction.
    ReproductionProb,
    ReproductionThresholdFrac, // Settings-backed.
    ParentalInvestmentFrac,
    ReproductionCooldown,
    MateReach,
    MutationChance,
    MutationRange,
    DiversityAppetite,
    KinPreference,
    MateCuriosity,
    DiversityDrive,
    // Combat and cooperation.
    FightCost,
    CombatPower,
    CooperateShareFrac,
    // Behaviour gene snapshots.
    Wandering,
    Pursuit,
    Cautious,
    Avoid,
    Fight,
    Cooperate,

    Count
};

constexpr size_t TRAIT_COUNT = static_cast<size_t>(Trait::Count);

struct TraitInfo {
    std::string_view name;
    double min; // Valid range; set() clamps into it.
    double max;
    double defaultValue;
    double decodeMin; // Range a locus byte maps onto.
    double decodeMax;
};

const TraitInfo& traitInfo(Trait trait);

std::optional<Trait> traitFromName(std::string_view name);

/**
 * Capability table of decoded trait values.
 */
class GenomeTraits {
public:
    GenomeTraits() = default;

    // Stored value, or the trait's default when unset.
    double get(Trait trait) const;

    // Stored value only.
    std::optional<double> find(Trait trait) const;

    bool has(Trait trait) const { return values_[index(trait)].has_value(); }

    // Non-finite values are ignored; finite ones are clamped to the trait's range.
    GenomeTraits& set(Trait trait, double value);

    void unset(Trait trait) { values_[index(trait)].reset(); }

    size_t size() const;

    nlohmann::json toJson() const;

private:
    static constexpr size_t index(Trait trait) { return static_cast<size_t>(trait); }

    std::array<std::optional<double>, TRAIT_COUNT> values_{};
};

} // namespace EvoSim
