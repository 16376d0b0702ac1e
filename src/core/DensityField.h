#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace EvoSim {

struct GridData;

/**
 * Incremental neighbour-occupancy density in [0,1] for one radius.
 *
 * Density at a tile is the occupied fraction of its (2r+1)^2 window, excluding the tile
 * itself and clamped at the edges. Occupancy changes update a live buffer in O(r^2); readers
 * see a published snapshot that only changes on sync().
 */
class DensityField {
public:
    DensityField(int rows, int cols, int radius);

    int getRadius() const { return radius_; }

    /**
     * @brief Record an occupant arriving (+1) or leaving (-1) at (row, col).
     * Neighbours in the window are updated and marked dirty; the tile itself is unaffected.
     */
    void applyDelta(int row, int col, int delta);

    /**
     * @brief Publish the live values. Only dirty tiles are copied unless `force` is set.
     */
    void sync(bool force = false);

    // Published density; 0 out of bounds. Falls back to the live value before the first sync.
    double getDensityAt(int row, int col) const;

    // Live (unpublished) density; 0 out of bounds.
    double getLiveDensityAt(int row, int col) const;

    bool hasSnapshot() const { return hasSnapshot_; }

    // Recount every tile from occupancy, then publish.
    void rebuild(const GridData& grid);

    size_t dirtyCount() const { return dirtyList_.size(); }

    /**
     * @brief Density computed by scanning the grid directly.
     * Used before a snapshot exists and to check the incremental field.
     */
    static double scanDensity(const GridData& grid, int row, int col, int radius);

    // Neighbour slots in the edge-clamped window, excluding the centre.
    static int windowTotal(int rows, int cols, int row, int col, int radius);

private:
    bool inBounds(int row, int col) const
    {
        return row >= 0 && col >= 0 && row < rows_ && col < cols_;
    }

    size_t index(int row, int col) const { return static_cast<size_t>(row) * cols_ + col; }

    void refreshLive(size_t i);

    int rows_;
    int cols_;
    int radius_;
    std::vector<int> totals_;
    std::vector<int> counts_;
    std::vector<double> live_;
    std::vector<double> snapshot_;
    std::vector<uint8_t> dirty_;
    std::vector<size_t> dirtyList_;
    bool hasSnapshot_ = false;
};

} // namespace EvoSim
