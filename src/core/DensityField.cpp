#include "DensityField.h"
#include "GridData.h"
#include "LoggingChannels.h"

#include <algorithm>

namespace EvoSim {

DensityField::DensityField(int rows, int cols, int radius)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)), radius_(std::max(0, radius))
{
    const size_t area = static_cast<size_t>(rows_) * cols_;
    totals_.resize(area);
    counts_.assign(area, 0);
    live_.assign(area, 0.0);
    snapshot_.assign(area, 0.0);
    dirty_.assign(area, 0);

    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            totals_[index(row, col)] = windowTotal(rows_, cols_, row, col, radius_);
        }
    }
}

int DensityField::windowTotal(int rows, int cols, int row, int col, int radius)
{
    const int rowSpan = std::min(rows - 1, row + radius) - std::max(0, row - radius) + 1;
    const int colSpan = std::min(cols - 1, col + radius) - std::max(0, col - radius) + 1;
    return std::max(0, rowSpan * colSpan - 1);
}

void DensityField::applyDelta(int row, int col, int delta)
{
    if (!inBounds(row, col) || delta == 0) {
        return;
    }

    const int r0 = std::max(0, row - radius_);
    const int r1 = std::min(rows_ - 1, row + radius_);
    const int c0 = std::max(0, col - radius_);
    const int c1 = std::min(cols_ - 1, col + radius_);

    for (int r = r0; r <= r1; ++r) {
        for (int c = c0; c <= c1; ++c) {
            if (r == row && c == col) {
                continue;
            }

            const size_t i = index(r, c);
            counts_[i] = std::clamp(counts_[i] + delta, 0, totals_[i]);
            refreshLive(i);
        }
    }
}

void DensityField::refreshLive(size_t i)
{
    live_[i] = totals_[i] > 0 ? std::clamp(static_cast<double>(counts_[i]) / totals_[i], 0.0, 1.0)
                              : 0.0;
    if (!dirty_[i]) {
        dirty_[i] = 1;
        dirtyList_.push_back(i);
    }
}

void DensityField::sync(bool force)
{
    if (force || !hasSnapshot_) {
        snapshot_ = live_;
    }
    else {
        for (size_t i : dirtyList_) {
            snapshot_[i] = live_[i];
        }
    }

    for (size_t i : dirtyList_) {
        dirty_[i] = 0;
    }
    dirtyList_.clear();
    hasSnapshot_ = true;
}

double DensityField::getDensityAt(int row, int col) const
{
    if (!inBounds(row, col)) {
        return 0.0;
    }
    return hasSnapshot_ ? snapshot_[index(row, col)] : live_[index(row, col)];
}

double DensityField::getLiveDensityAt(int row, int col) const
{
    if (!inBounds(row, col)) {
        return 0.0;
    }
    return live_[index(row, col)];
}

void DensityField::rebuild(const GridData& grid)
{
    std::fill(counts_.begin(), counts_.end(), 0);
    for (int row = 0; row < rows_ && row < grid.rows; ++row) {
        for (int col = 0; col < cols_ && col < grid.cols; ++col) {
            if (grid.occupantAt(row, col)) {
                applyDelta(row, col, 1);
            }
        }
    }

    // Tiles no occupant touched still need their live value reset.
    for (size_t i = 0; i < live_.size(); ++i) {
        refreshLive(i);
    }

    sync(true);
    LoggingChannels::density()->debug("Density field rebuilt ({}x{}, radius {})", rows_, cols_, radius_);
}

double DensityField::scanDensity(const GridData& grid, int row, int col, int radius)
{
    if (!grid.inBounds(row, col)) {
        return 0.0;
    }

    const int total = windowTotal(grid.rows, grid.cols, row, col, radius);
    if (total <= 0) {
        return 0.0;
    }

    int occupied = 0;
    for (int r = std::max(0, row - radius); r <= std::min(grid.rows - 1, row + radius); ++r) {
        for (int c = std::max(0, col - radius); c <= std::min(grid.cols - 1, col + radius); ++c) {
            if ((r != row || c != col) && grid.occupantAt(r, c)) {
                ++occupied;
            }
        }
    }
    return std::clamp(static_cast<double>(occupied) / total, 0.0, 1.0);
}

} // namespace EvoSim
