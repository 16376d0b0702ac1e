#pragma once

#include "Vector2.h"
#include "organisms/Organism.h"

#include <cassert>
#include <cstdint>
#include <memory>
#include <vector>

namespace EvoSim {

/**
 * Tile storage of a grid world. The occupant slots own their organisms; every other structure
 * refers to organisms by raw pointer and must not outlive the slot.
 */
struct GridData {
    int rows = 0;
    int cols = 0;
    std::vector<uint8_t> obstacles;                    // obstacles[row * cols + col]
    std::vector<std::unique_ptr<Organism>> occupants; // occupants[row * cols + col]

    GridData() = default;
    GridData(int rows, int cols)
        : rows(rows), cols(cols),
          obstacles(static_cast<size_t>(rows) * cols, 0),
          occupants(static_cast<size_t>(rows) * cols)
    {}

    inline bool inBounds(int row, int col) const
    {
        return row >= 0 && col >= 0 && row < rows && col < cols;
    }

    inline size_t index(int row, int col) const
    {
        assert(inBounds(row, col));
        return static_cast<size_t>(row) * cols + col;
    }

    inline size_t area() const { return static_cast<size_t>(rows) * cols; }

    inline bool isBlocked(int row, int col) const { return obstacles[index(row, col)] != 0; }

    inline Organism* occupantAt(int row, int col) const { return occupants[index(row, col)].get(); }

    inline Organism* occupantAt(const Vector2i& pos) const { return occupantAt(pos.y, pos.x); }

    // In bounds, unblocked and unoccupied.
    inline bool isOpen(int row, int col) const
    {
        if (!inBounds(row, col)) {
            return false;
        }
        const size_t i = index(row, col);
        return obstacles[i] == 0 && !occupants[i];
    }
};

} // namespace EvoSim
