#pragma once

#include "organisms/Organism.h"

#include <vector>

namespace EvoSim::BehaviorComplementarity {

/**
 * @brief Mean absolute difference of two organisms' cooperate, fight and avoid genes.
 * 0 for identical behaviour, 1 for opposite extremes.
 */
double compute(const Organism& a, const Organism& b);

// Population means of the interaction genes; all zero for an empty population.
InteractionGenes populationMeans(const std::vector<Organism*>& population);

/**
 * @brief 1 minus the spread of the normalized interaction-gene means.
 * 1 when the population weights every action equally, 0 when one action dominates.
 */
double evenness(const InteractionGenes& means);

} // namespace EvoSim::BehaviorComplementarity
