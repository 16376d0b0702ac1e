#include "BehaviorComplementarity.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace EvoSim::BehaviorComplementarity {

namespace {

double gene(double value)
{
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
}

} // namespace

double compute(const Organism& a, const Organism& b)
{
    const auto& ga = a.interaction_genes;
    const auto& gb = b.interaction_genes;

    const double sum = std::abs(gene(ga.cooperate) - gene(gb.cooperate))
        + std::abs(gene(ga.fight) - gene(gb.fight)) + std::abs(gene(ga.avoid) - gene(gb.avoid));
    return std::clamp(sum / 3.0, 0.0, 1.0);
}

InteractionGenes populationMeans(const std::vector<Organism*>& population)
{
    InteractionGenes means;
    size_t count = 0;
    for (const Organism* organism : population) {
        if (!organism || !organism->isAlive()) {
            continue;
        }
        means.avoid += gene(organism->interaction_genes.avoid);
        means.fight += gene(organism->interaction_genes.fight);
        means.cooperate += gene(organism->interaction_genes.cooperate);
        ++count;
    }

    if (count > 0) {
        means.avoid /= count;
        means.fight /= count;
        means.cooperate /= count;
    }
    return means;
}

double evenness(const InteractionGenes& means)
{
    const double total = means.avoid + means.fight + means.cooperate;
    if (!(total > 0.0)) {
        return 0.0;
    }

    const double shares[3] = { means.avoid / total, means.fight / total, means.cooperate / total };
    const auto [lo, hi] = std::minmax_element(std::begin(shares), std::end(shares));
    return std::clamp(1.0 - (*hi - *lo), 0.0, 1.0);
}

} // namespace EvoSim::BehaviorComplementarity
