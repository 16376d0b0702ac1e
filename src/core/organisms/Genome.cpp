#include "Genome.h"
#include "core/RandomStreams.h"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <vector>

namespace EvoSim {

Genome::Genome(const Loci& loci) : loci_(loci), traits_(decode(loci))
{}

Genome::Genome(const Loci& loci, const GenomeTraits& traits) : loci_(loci), traits_(traits)
{}

Genome Genome::random(std::mt19937& rng)
{
    std::uniform_int_distribution<int> byte(0, 255);
    Loci loci{};
    for (auto& locus : loci) {
        locus = static_cast<uint8_t>(byte(rng));
    }
    return Genome(loci);
}

Genome Genome::uniform(uint8_t value)
{
    Loci loci{};
    loci.fill(value);
    return Genome(loci);
}

GenomeTraits Genome::decode(const Loci& loci)
{
    GenomeTraits traits;
    for (size_t i = 0; i < TRAIT_COUNT; ++i) {
        const auto trait = static_cast<Trait>(i);
        if (trait == Trait::DecayReturnFraction) {
            continue;
        }

        const auto& info = traitInfo(trait);
        const double t = loci[i] / 255.0;
        traits.set(trait, info.decodeMin + t * (info.decodeMax - info.decodeMin));
    }
    return traits;
}

double Genome::similarity(const Genome& other) const
{
    int64_t sumSquares = 0;
    for (size_t i = 0; i < TRAIT_COUNT; ++i) {
        const int64_t d = static_cast<int64_t>(loci_[i]) - static_cast<int64_t>(other.loci_[i]);
        sumSquares += d * d;
    }

    static const double maxDistance = 255.0 * std::sqrt(static_cast<double>(TRAIT_COUNT));
    const double distance = std::sqrt(static_cast<double>(sumSquares));
    return std::clamp(1.0 - distance / maxDistance, 0.0, 1.0);
}

Genome Genome::crossover(
    const Genome& other, std::mt19937& rng, double mutationChance, double mutationRange) const
{
    const double chance = std::isfinite(mutationChance) ? std::clamp(mutationChance, 0.0, 1.0) : 0.0;
    const double range = std::isfinite(mutationRange) ? std::clamp(mutationRange, 0.0, 255.0) : 0.0;

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    Loci child{};
    for (size_t i = 0; i < TRAIT_COUNT; ++i) {
        double value = unit(rng) < 0.5 ? loci_[i] : other.loci_[i];
        if (unit(rng) < chance) {
            value += (unit(rng) * 2.0 - 1.0) * range;
        }
        child[i] = static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
    }
    return Genome(child);
}

uint32_t Genome::seed() const
{
    return RandomStreams::fnv1a(loci_.data(), loci_.size());
}

nlohmann::json Genome::toJson() const
{
    return { { "loci", std::vector<int>(loci_.begin(), loci_.end()) },
             { "traits", traits_.toJson() } };
}

} // namespace EvoSim
