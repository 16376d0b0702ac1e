#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <vector>

namespace EvoSim {

/**
 * @brief One live organism in a tick snapshot, in row-major order.
 */
struct SnapshotEntry {
    int row = 0;
    int col = 0;
    double fitness = 0.0;
    int age = 0;
    double energy = 0.0;
    int fights_won = 0;
    int offspring = 0;
};

/**
 * @brief Population summary published at the end of every tick.
 */
struct TickSnapshot {
    uint64_t tick = 0;
    int population = 0;
    double total_energy = 0.0; ///< Sum of organism energy.
    double total_age = 0.0;
    double max_fitness = 0.0;
    double population_scarcity = 0.0;
    std::vector<SnapshotEntry> entries;
};

void to_json(nlohmann::json& j, const SnapshotEntry& entry);
void from_json(const nlohmann::json& j, SnapshotEntry& entry);
void to_json(nlohmann::json& j, const TickSnapshot& snapshot);
void from_json(const nlohmann::json& j, TickSnapshot& snapshot);

} // namespace EvoSim
