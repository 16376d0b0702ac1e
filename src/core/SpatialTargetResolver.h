#pragma once

#include "SimilarityCache.h"
#include "Vector2.h"

#include <random>
#include <vector>

namespace EvoSim {

struct GridData;
struct ReproductionSettings;

struct TargetEntry {
    Vector2i position;
    Organism* target = nullptr;
    double similarity = 0.0;
    int distance = 0; // Chebyshev distance from the observer.
};

struct TargetLists {
    std::vector<TargetEntry> mates;
    std::vector<TargetEntry> enemies;
    std::vector<TargetEntry> society;

    bool empty() const { return mates.empty() && enemies.empty() && society.empty(); }
};

/**
 * Classifies the organisms within an observer's sight window.
 *
 * The window is (2S+1)^2 tiles around the observer with S = floor(sight), excluding the
 * observer. A neighbour is society when similarity >= allyThreshold, an enemy when
 * similarity <= enemyThreshold or a hostility roll succeeds, and a mate otherwise.
 */
class SpatialTargetResolver {
public:
    TargetLists findTargets(
        const Organism& observer,
        const Vector2i& origin,
        const GridData& grid,
        double effectiveDensity,
        const ReproductionSettings& settings,
        SimilarityCache& cache,
        std::mt19937& rng) const;
};

} // namespace EvoSim
