#pragma once

#include "organisms/Organism.h"

#include <cstdint>
#include <unordered_map>

namespace EvoSim {

/**
 * Per-tick memo of genetic similarity for unordered organism pairs.
 * Owned by a simulation instance; reset() at the start of each tick.
 */
class SimilarityCache {
public:
    // Cached similarity of a and b, computed on first request this tick.
    double get(const Organism& a, const Organism& b);

    // Forget this tick's entries, keeping the allocated buckets.
    void reset();

    // Forget everything and release memory.
    void clear();

    size_t size() const { return entries_.size(); }
    uint64_t getHits() const { return hits_; }
    uint64_t getMisses() const { return misses_; }

private:
    static uint64_t pairKey(OrganismId a, OrganismId b);

    std::unordered_map<uint64_t, double> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace EvoSim
