#pragma once

#include "ReflectSerializer.h"
#include "Result.h"
#include <nlohmann/json.hpp>
#include <string>

namespace EvoSim {

/**
 * @brief Tile energy economy: regeneration, diffusion and harvesting.
 */
struct EnergySettings {
    double max_tile_energy;             // Required; construction fails when missing or <= 0.
    double regen_rate;                  // Fraction of the missing energy restored per tick.
    double diffusion_rate;              // Pull toward the orthogonal-neighbour mean per tick.
    int density_radius;                 // Radius of the tracked density field.
    double regen_density_penalty;       // Regen lost per unit of effective density.
    double consumption_density_penalty; // Harvest demand lost per unit of effective density.
    double density_effect_multiplier;   // Scales raw density before it is clamped to [0,1].
    double event_strength_multiplier;   // Global scale on every event's strength.
    double initial_tile_energy_fraction;
};

/**
 * @brief Mate classification and the diversity-aware reproduction policy.
 */
struct ReproductionSettings {
    double society_similarity; // Ally threshold used when a genome does not carry one.
    double enemy_similarity;   // Enemy threshold used when a genome does not carry one.
    double mating_diversity_threshold;
    double low_diversity_repro_multiplier; // Floor of the low-diversity penalty.
    int mate_pool_limit;                   // Nearest candidates considered for selection.
    double reproduction_threshold_fraction;
    double diversity_pressure_shift;
    double diversity_bonus_scale;
    double complement_bonus_scale;
};

/**
 * @brief Death-energy return and the gradual-release decay pools.
 */
struct DecaySettings {
    double return_fraction; // Share of a dead organism's energy returned to the grid.
    double immediate_share; // Share of the returned energy deposited at death.
    double release_base;    // Constant part of each tick's pool release.
    double release_rate;    // Proportional part of each tick's pool release.
    int max_age;            // Ticks a pool may go without releasing before it is dropped.
    double epsilon;
    bool spawn_from_pool_enabled;
    double spawn_min_energy_fraction; // Pool energy (x max tile energy) needed to spawn.
};

/**
 * @brief Minimum-population target and compensatory seeding.
 */
struct ScarcitySettings {
    int min_population_area_threshold; // Grids smaller than this have no minimum.
    int min_population_floor;
    double min_population_fraction;
    bool seeding_enabled;
    double seeding_top_band; // Fraction of the best-scoring tiles eligible for seeding.
    int seeding_attempts_per_tile;
    int max_seeds_per_tick;
};

/**
 * @brief Random environmental event generation.
 */
struct EventSettings {
    bool enabled;
    double frequency_multiplier;
    int max_concurrent;
    int duration_min;
    int duration_max;
    double strength_min;
    double strength_max;
    int span_min;
    double span_ratio;
    int cooldown_min;
    int cooldown_max;
    bool start_with_event;
};

/**
 * @brief Toggles for the per-organism behaviour stages.
 */
struct BehaviorSettings {
    bool movement_enabled;
    bool interactions_enabled;
    bool reproduction_enabled;
    bool activity_gate_enabled;
};

/**
 * @brief Initial population fill used by seedRandomPopulation().
 */
struct PopulationSettings {
    double initial_fill_fraction;
    double initial_energy_fraction;
};

/**
 * @brief All tunables of one simulation instance.
 *
 * Use getDefaultSimulationSettings() for defaults. The numeric shaping constants are tuning
 * defaults, not contracts.
 */
struct SimulationSettings {
    EnergySettings energy;
    ReproductionSettings reproduction;
    DecaySettings decay;
    ScarcitySettings scarcity;
    EventSettings events;
    BehaviorSettings behavior;
    PopulationSettings population;
};

SimulationSettings getDefaultSimulationSettings();

/**
 * @brief Throw std::invalid_argument for an unusable max_tile_energy, then clamp every
 * other field into its valid range in place.
 */
void validateSimulationSettings(SimulationSettings& settings);

/**
 * @brief Load a JSON settings file on top of the defaults.
 * Keys absent from the file keep their default value.
 */
Result<SimulationSettings, std::string> loadSimulationSettings(const std::string& path);

/**
 * @brief Apply a JSON document on top of `base`.
 */
Result<SimulationSettings, std::string> applySettingsJson(
    const nlohmann::json& j, const SimulationSettings& base = getDefaultSimulationSettings());

#define EVOSIM_SETTINGS_JSON(Type)                                          \
    inline void to_json(nlohmann::json& j, const Type& value)              \
    {                                                                      \
        j = ReflectSerializer::to_json(value);                             \
    }                                                                      \
    inline void from_json(const nlohmann::json& j, Type& value)            \
    {                                                                      \
        value = ReflectSerializer::from_json<Type>(j);                     \
    }

EVOSIM_SETTINGS_JSON(EnergySettings)
EVOSIM_SETTINGS_JSON(ReproductionSettings)
EVOSIM_SETTINGS_JSON(DecaySettings)
EVOSIM_SETTINGS_JSON(ScarcitySettings)
EVOSIM_SETTINGS_JSON(EventSettings)
EVOSIM_SETTINGS_JSON(BehaviorSettings)
EVOSIM_SETTINGS_JSON(PopulationSettings)
EVOSIM_SETTINGS_JSON(SimulationSettings)

#undef EVOSIM_SETTINGS_JSON

} // namespace EvoSim
