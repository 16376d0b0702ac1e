#include "SimulationSettings.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace EvoSim {

namespace {

double clampFinite(double value, double lo, double hi, double fallback)
{
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::clamp(value, lo, hi);
}

} // namespace

/**
 * @brief Get default simulation settings.
 *
 * Kept out of the header so tuning a default does not rebuild every consumer.
 */
SimulationSettings getDefaultSimulationSettings()
{
    return SimulationSettings{
        .energy = { .max_tile_energy = 5.0,
                    .regen_rate = 0.0082,
                    .diffusion_rate = 0.05,
                    .density_radius = 1,
                    .regen_density_penalty = 0.5,
                    .consumption_density_penalty = 0.5,
                    .density_effect_multiplier = 1.0,
                    .event_strength_multiplier = 1.0,
                    .initial_tile_energy_fraction = 0.5 },
        .reproduction = { .society_similarity = 0.7,
                          .enemy_similarity = 0.4,
                          .mating_diversity_threshold = 0.42,
                          .low_diversity_repro_multiplier = 0.57,
                          .mate_pool_limit = 12,
                          .reproduction_threshold_fraction = 0.4,
                          .diversity_pressure_shift = 0.08,
                          .diversity_bonus_scale = 0.6,
                          .complement_bonus_scale = 0.15 },
        .decay = { .return_fraction = 0.9,
                   .immediate_share = 0.25,
                   .release_base = 0.12,
                   .release_rate = 0.18,
                   .max_age = 240,
                   .epsilon = 1e-4,
                   .spawn_from_pool_enabled = true,
                   .spawn_min_energy_fraction = 0.5 },
        .scarcity = { .min_population_area_threshold = 100,
                      .min_population_floor = 15,
                      .min_population_fraction = 0.025,
                      .seeding_enabled = true,
                      .seeding_top_band = 0.2,
                      .seeding_attempts_per_tile = 6,
                      .max_seeds_per_tick = 8 },
        .events = { .enabled = true,
                    .frequency_multiplier = 1.0,
                    .max_concurrent = 2,
                    .duration_min = 300,
                    .duration_max = 900,
                    .strength_min = 0.25,
                    .strength_max = 1.0,
                    .span_min = 10,
                    .span_ratio = 1.0 / 3.0,
                    .cooldown_min = 180,
                    .cooldown_max = 480,
                    .start_with_event = false },
        .behavior = { .movement_enabled = true,
                      .interactions_enabled = true,
                      .reproduction_enabled = true,
                      .activity_gate_enabled = true },
        .population = { .initial_fill_fraction = 0.2, .initial_energy_fraction = 0.6 },
    };
}

void validateSimulationSettings(SimulationSettings& settings)
{
    auto& energy = settings.energy;
    if (!std::isfinite(energy.max_tile_energy) || energy.max_tile_energy <= 0.0) {
        throw std::invalid_argument(
            "energy.max_tile_energy must be a positive finite number (got "
            + std::to_string(energy.max_tile_energy) + ")");
    }

    energy.regen_rate = clampFinite(energy.regen_rate, 0.0, 1.0, 0.0);
    energy.diffusion_rate = clampFinite(energy.diffusion_rate, 0.0, 1.0, 0.0);
    energy.density_radius = std::clamp(energy.density_radius, 0, 16);
    energy.regen_density_penalty = clampFinite(energy.regen_density_penalty, 0.0, 1.0, 0.0);
    energy.consumption_density_penalty =
        clampFinite(energy.consumption_density_penalty, 0.0, 1.0, 0.0);
    energy.density_effect_multiplier = clampFinite(energy.density_effect_multiplier, 0.0, 10.0, 1.0);
    energy.event_strength_multiplier = clampFinite(energy.event_strength_multiplier, 0.0, 10.0, 1.0);
    energy.initial_tile_energy_fraction =
        clampFinite(energy.initial_tile_energy_fraction, 0.0, 1.0, 0.0);

    auto& repro = settings.reproduction;
    repro.society_similarity = clampFinite(repro.society_similarity, 0.0, 1.0, 0.7);
    repro.enemy_similarity = clampFinite(repro.enemy_similarity, 0.0, 1.0, 0.4);
    repro.mating_diversity_threshold = clampFinite(repro.mating_diversity_threshold, 0.0, 1.0, 0.42);
    repro.low_diversity_repro_multiplier =
        clampFinite(repro.low_diversity_repro_multiplier, 0.0, 1.0, 0.57);
    repro.mate_pool_limit = std::max(1, repro.mate_pool_limit);
    repro.reproduction_threshold_fraction =
        clampFinite(repro.reproduction_threshold_fraction, 0.0, 1.0, 0.4);
    repro.diversity_pressure_shift = clampFinite(repro.diversity_pressure_shift, 0.0, 0.5, 0.08);
    repro.diversity_bonus_scale = clampFinite(repro.diversity_bonus_scale, 0.0, 2.0, 0.6);
    repro.complement_bonus_scale = clampFinite(repro.complement_bonus_scale, 0.0, 1.0, 0.15);

    auto& decay = settings.decay;
    decay.return_fraction = clampFinite(decay.return_fraction, 0.0, 1.0, 0.9);
    decay.immediate_share = clampFinite(decay.immediate_share, 0.0, 1.0, 0.25);
    decay.release_base = clampFinite(decay.release_base, 0.0, energy.max_tile_energy, 0.12);
    decay.release_rate = clampFinite(decay.release_rate, 0.0, 1.0, 0.18);
    decay.max_age = std::max(1, decay.max_age);
    decay.epsilon = clampFinite(decay.epsilon, 0.0, 1.0, 1e-4);
    decay.spawn_min_energy_fraction = clampFinite(decay.spawn_min_energy_fraction, 0.0, 1.0, 0.5);

    auto& scarcity = settings.scarcity;
    scarcity.min_population_area_threshold = std::max(0, scarcity.min_population_area_threshold);
    scarcity.min_population_floor = std::max(0, scarcity.min_population_floor);
    scarcity.min_population_fraction = clampFinite(scarcity.min_population_fraction, 0.0, 1.0, 0.025);
    scarcity.seeding_top_band = clampFinite(scarcity.seeding_top_band, 0.01, 1.0, 0.2);
    scarcity.seeding_attempts_per_tile = std::max(1, scarcity.seeding_attempts_per_tile);
    scarcity.max_seeds_per_tick = std::max(0, scarcity.max_seeds_per_tick);

    auto& events = settings.events;
    events.frequency_multiplier = clampFinite(events.frequency_multiplier, 0.0, 100.0, 1.0);
    events.max_concurrent = std::max(0, events.max_concurrent);
    events.duration_min = std::max(1, events.duration_min);
    events.duration_max = std::max(events.duration_min, events.duration_max);
    events.strength_min = clampFinite(events.strength_min, 0.0, 10.0, 0.25);
    events.strength_max = std::max(events.strength_min, clampFinite(events.strength_max, 0.0, 10.0, 1.0));
    events.span_min = std::max(1, events.span_min);
    events.span_ratio = clampFinite(events.span_ratio, 0.0, 1.0, 1.0 / 3.0);
    events.cooldown_min = std::max(0, events.cooldown_min);
    events.cooldown_max = std::max(events.cooldown_min, events.cooldown_max);

    auto& population = settings.population;
    population.initial_fill_fraction = clampFinite(population.initial_fill_fraction, 0.0, 1.0, 0.0);
    population.initial_energy_fraction =
        clampFinite(population.initial_energy_fraction, 0.0, 1.0, 0.6);
}

Result<SimulationSettings, std::string> applySettingsJson(
    const nlohmann::json& j, const SimulationSettings& base)
{
    if (!j.is_object()) {
        return Result<SimulationSettings, std::string>::error("settings JSON must be an object");
    }

    SimulationSettings settings = base;
    try {
        ReflectSerializer::merge(j, settings);
    }
    catch (const nlohmann::json::exception& e) {
        return Result<SimulationSettings, std::string>::error(
            std::string("invalid settings value: ") + e.what());
    }

    return Result<SimulationSettings, std::string>::okay(settings);
}

Result<SimulationSettings, std::string> loadSimulationSettings(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<SimulationSettings, std::string>::error("cannot open settings file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<SimulationSettings, std::string>::error(
            "failed to parse " + path + ": " + e.what());
    }

    auto result = applySettingsJson(j);
    if (result.isValue()) {
        LoggingChannels::config()->info("Loaded simulation settings from {}", path);
    }
    return result;
}

} // namespace EvoSim
