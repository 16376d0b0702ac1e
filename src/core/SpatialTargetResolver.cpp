#include "SpatialTargetResolver.h"
#include "GridData.h"
#include "LoggingChannels.h"
#include "SimulationSettings.h"

#include <algorithm>

namespace EvoSim {

TargetLists SpatialTargetResolver::findTargets(
    const Organism& observer,
    const Vector2i& origin,
    const GridData& grid,
    double effectiveDensity,
    const ReproductionSettings& settings,
    SimilarityCache& cache,
    std::mt19937& rng) const
{
    TargetLists lists;

    const int sight = observer.sightRadius();
    if (sight <= 0) {
        return lists;
    }

    const double allyThreshold = observer.allyThreshold(settings.society_similarity);
    const double enemyThreshold = observer.enemyThreshold(settings.enemy_similarity);
    const double hostility = observer.hostilityBias(effectiveDensity);
    std::uniform_real_distribution<double> roll(0.0, 1.0);

    const int r0 = std::max(0, origin.y - sight);
    const int r1 = std::min(grid.rows - 1, origin.y + sight);
    const int c0 = std::max(0, origin.x - sight);
    const int c1 = std::min(grid.cols - 1, origin.x + sight);

    for (int row = r0; row <= r1; ++row) {
        for (int col = c0; col <= c1; ++col) {
            if (row == origin.y && col == origin.x) {
                continue;
            }

            Organism* other = grid.occupantAt(row, col);
            if (!other || other == &observer || !other->isAlive()) {
                continue;
            }

            const Vector2i position{ col, row };
            TargetEntry entry{ .position = position,
                               .target = other,
                               .similarity = cache.get(observer, *other),
                               .distance = chebyshevDistance(origin, position) };

            if (entry.similarity >= allyThreshold) {
                lists.society.push_back(entry);
            }
            else if (entry.similarity <= enemyThreshold || roll(rng) < hostility) {
                lists.enemies.push_back(entry);
            }
            else {
                lists.mates.push_back(entry);
            }
        }
    }

    LoggingChannels::targets()->trace(
        "Organism {} at ({}, {}): {} mates, {} enemies, {} society",
        observer.id,
        origin.y,
        origin.x,
        lists.mates.size(),
        lists.enemies.size(),
        lists.society.size());

    return lists;
}

} // namespace EvoSim
