#include "GenomeTraits.h"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

namespace EvoSim {

namespace {

// clang-format off
constexpr std::array<TraitInfo, TRAIT_COUNT> TRAIT_TABLE = { {
    //  name                          min     max     default decodeMin decodeMax
    { "forage_rate",                  0.0,    1.0,    0.5,    0.2,    0.8   },
    { "harvest_cap_min",              0.0,    1.0,    0.1,    0.03,   0.15  },
    { "harvest_cap_max",              0.0,    2.0,    0.5,    0.25,   0.85  },
    { "energy_loss_base",             0.0,    0.5,    0.025,  0.015,  0.045 },
    { "energy_loss_scale",            0.0,    3.0,    1.0,    0.5,    1.5   },
    { "metabolism",                   0.0,    1.0,    0.2,    0.0,    0.6   },
    { "move_cost",                    0.0,    0.1,    0.004,  0.002,  0.008 },
    { "starvation_threshold_frac",    0.0,    1.0,    0.25,   0.1,    0.4   },
    { "lifespan",                     1.0,    5000.0, 400.0,  150.0,  900.0 },
    { "senescence_rate",              0.0,    1.0,    0.2,    0.1,    0.5   },
    { "activity_rate",                0.0,    1.0,    0.8,    0.3,    1.0   },
    { "recovery_rate",                0.0,    1.0,    0.5,    0.0,    1.0   },
    { "event_resistance",             0.0,    1.0,    0.3,    0.0,    1.0   },
    { "decay_return_fraction",        0.0,    1.0,    0.9,    0.6,    1.0   },
    { "sight",                        0.0,    10.0,   2.0,    1.0,    5.0   },
    { "ally_threshold",               0.0,    1.0,    0.7,    0.5,    0.9   },
    { "enemy_threshold",              0.0,    1.0,    0.4,    0.2,    0.6   },
    { "min_enemy_bias",               0.0,    1.0,    0.02,   0.0,    0.1   },
    { "max_enemy_bias",               0.0,    1.0,    0.15,   0.05,   0.4   },
    { "risk_tolerance",               0.0,    1.0,    0.5,    0.0,    1.0   },
    { "crowding_tolerance",           0.0,    1.0,    0.5,    0.2,    0.8   },
    { "cohesion",                     0.0,    1.0,    0.5,    0.0,    1.0   },
    { "exploitation_bias",            0.0,    1.0,    0.5,    0.0,    1.0   },
    { "reproduction_prob",            0.0,    1.0,    0.35,   0.05,   0.9   },
    { "reproduction_threshold_frac",  0.0,    1.0,    0.4,    0.22,   0.7   },
    { "parental_investment_frac",     0.0,    1.0,    0.4,    0.2,    0.7   },
    { "reproduction_cooldown",        0.0,    100.0,  4.0,    2.0,    12.0  },
    { "mate_reach",                   1.0,    10.0,   1.5,    1.0,    3.0   },
    { "mutation_chance",              0.0,    1.0,    0.15,   0.08,   0.28  },
    { "mutation_range",               0.0,    255.0,  12.0,   6.0,    25.0  },
    { "diversity_appetite",           0.0,    1.0,    0.5,    0.0,    1.0   },
    { "kin_preference",               0.0,    1.0,    0.3,    0.0,    1.0   },
    { "mate_curiosity",               0.0,    1.0,    0.1,    0.0,    0.3   },
    { "diversity_drive",              0.0,    3.0,    1.0,    0.5,    1.5   },
    { "fight_cost",                   0.0,    1.0,    0.02,   0.01,   0.04  },
    { "combat_power",                 0.0,    5.0,    1.0,    0.8,    1.7   },
    { "cooperate_share_frac",         0.0,    1.0,    0.3,    0.2,    0.6   },
    { "wandering",                    0.0,    1.0,    0.5,    0.0,    1.0   },
    { "pursuit",                      0.0,    1.0,    0.3,    0.0,    1.0   },
    { "cautious",                     0.0,    1.0,    0.2,    0.0,    1.0   },
    { "avoid",                        0.0,    1.0,    0.4,    0.0,    1.0   },
    { "fight",                        0.0,    1.0,    0.3,    0.0,    1.0   },
    { "cooperate",                    0.0,    1.0,    0.3,    0.0,    1.0   },
} };
// clang-format on

} // namespace

const TraitInfo& traitInfo(Trait trait)
{
    return TRAIT_TABLE[static_cast<size_t>(trait)];
}

std::optional<Trait> traitFromName(std::string_view name)
{
    for (size_t i = 0; i < TRAIT_COUNT; ++i) {
        if (TRAIT_TABLE[i].name == name) {
            return static_cast<Trait>(i);
        }
    }
    return std::nullopt;
}

double GenomeTraits::get(Trait trait) const
{
    const auto& stored = values_[index(trait)];
    return stored.has_value() ? *stored : traitInfo(trait).defaultValue;
}

std::optional<double> GenomeTraits::find(Trait trait) const
{
    return values_[index(trait)];
}

GenomeTraits& GenomeTraits::set(Trait trait, double value)
{
    if (!std::isfinite(value)) {
        return *this;
    }

    const auto& info = traitInfo(trait);
    values_[index(trait)] = std::clamp(value, info.min, info.max);
    return *this;
}

size_t GenomeTraits::size() const
{
    return static_cast<size_t>(
        std::count_if(values_.begin(), values_.end(), [](const auto& v) { return v.has_value(); }));
}

nlohmann::json GenomeTraits::toJson() const
{
    nlohmann::json j = nlohmann::json::object();
    for (size_t i = 0; i < TRAIT_COUNT; ++i) {
        if (values_[i]) {
            j[std::string(TRAIT_TABLE[i].name)] = *values_[i];
        }
    }
    return j;
}

} // namespace EvoSim
