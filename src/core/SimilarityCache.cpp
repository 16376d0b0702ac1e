#include "SimilarityCache.h"

#include <algorithm>

namespace EvoSim {

uint64_t SimilarityCache::pairKey(OrganismId a, OrganismId b)
{
    const auto lo = std::min(a, b);
    const auto hi = std::max(a, b);
    return (static_cast<uint64_t>(lo) << 32) | hi;
}

double SimilarityCache::get(const Organism& a, const Organism& b)
{
    if (a.id == b.id) {
        return 1.0;
    }

    const uint64_t key = pairKey(a.id, b.id);
    if (auto it = entries_.find(key); it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    const double similarity = a.genome().similarity(b.genome());
    entries_.emplace(key, similarity);
    return similarity;
}

void SimilarityCache::reset()
{
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

void SimilarityCache::clear()
{
    std::unordered_map<uint64_t, double>().swap(entries_);
    hits_ = 0;
    misses_ = 0;
}

} // namespace EvoSim
