#pragma once

#include "GenomeTraits.h"

#include <array>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <random>

namespace EvoSim {

/**
 * Byte-locus genome. Each trait is read from its own locus and decoded linearly onto the
 * trait's decode range; genetic distance is measured over all loci.
 */
class Genome {
public:
    using Loci = std::array<uint8_t, TRAIT_COUNT>;

    // Decodes every trait except the settings-backed decay return fraction.
    explicit Genome(const Loci& loci);

    // Explicit trait table; unset traits fall back to their defaults.
    Genome(const Loci& loci, const GenomeTraits& traits);

    static Genome random(std::mt19937& rng);

    // All loci set to `value`; handy for building genomes at a known distance.
    static Genome uniform(uint8_t value);

    const GenomeTraits& traits() const { return traits_; }
    double trait(Trait t) const { return traits_.get(t); }
    std::optional<double> findTrait(Trait t) const { return traits_.find(t); }

    const Loci& loci() const { return loci_; }

    /**
     * @brief Genetic similarity in [0,1]; 1 for identical loci.
     * Symmetric: a.similarity(b) == b.similarity(a) exactly.
     */
    double similarity(const Genome& other) const;

    /**
     * @brief Uniform crossover with per-locus mutation.
     * @param mutationChance Probability that a locus is perturbed.
     * @param mutationRange Maximum perturbation in locus units.
     */
    Genome crossover(
        const Genome& other, std::mt19937& rng, double mutationChance, double mutationRange) const;

    // Stable 32-bit identity of the loci (FNV-1a).
    uint32_t seed() const;

    nlohmann::json toJson() const;

private:
    static GenomeTraits decode(const Loci& loci);

    Loci loci_{};
    GenomeTraits traits_;
};

} // namespace EvoSim
