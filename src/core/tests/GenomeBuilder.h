#pragma once

#include "core/organisms/Genome.h"

#include <array>
#include <memory>

namespace EvoSim::Test {

/**
 * Builds genomes with chosen loci and explicit trait overrides on top of the decoded table.
 *
 * Example:
 *   auto genome = GenomeBuilder(128).with(Trait::Sight, 0.0).build();
 */
class GenomeBuilder {
public:
    explicit GenomeBuilder(uint8_t locus = 128) : base_(Genome::uniform(locus)) {}

    GenomeBuilder& with(Trait trait, double value)
    {
        overrides_.set(trait, value);
        return *this;
    }

    // Leave a trait unset so callers fall back to settings or defaults.
    GenomeBuilder& without(Trait trait)
    {
        unset_[static_cast<size_t>(trait)] = true;
        return *this;
    }

    std::shared_ptr<const Genome> build() const
    {
        GenomeTraits traits = base_.traits();
        for (size_t i = 0; i < TRAIT_COUNT; ++i) {
            const auto trait = static_cast<Trait>(i);
            if (auto value = overrides_.find(trait)) {
                traits.set(trait, *value);
            }
            if (unset_[i]) {
                traits.unset(trait);
            }
        }
        return std::make_shared<const Genome>(base_.loci(), traits);
    }

private:
    Genome base_;
    GenomeTraits overrides_;
    std::array<bool, TRAIT_COUNT> unset_{};
};

} // namespace EvoSim::Test
