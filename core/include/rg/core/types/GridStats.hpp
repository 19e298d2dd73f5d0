#pragma once

#include "rg/core/types/GridOptions.hpp"
#include "rg/core/util/Decimal.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>

namespace rg {

template<typename T> class Grid;

/**
 * @brief Aggregate statistics of one grid: count, exact sum, min and max.
 *
 * In Updated mode every cell write is folded in through apply(). When the
 * last cell holding the current minimum (or maximum) changes, that extreme
 * is recomputed by a full scan on its next read. In Stale mode writes only
 * mark the aggregates out of date and the next read rescans the grid.
 *
 * No-data cells never contribute.
 */
template<typename T>
class GridStats
{
public:
    GridStats(Grid<T>& grid, StatsMode mode);

    [[nodiscard]] StatsMode mode() const { return _mode; }
    void setMode(StatsMode mode);

    // Fold in one cell write. Called by the grid after the chunk was updated.
    void apply(T newValue, T oldValue);
    // Aggregates no longer reflect the grid (bulk writes that skipped apply()).
    void invalidate() { _upToDate = false; }
    [[nodiscard]] bool upToDate() const { return _upToDate; }

    std::int64_t count();
    Decimal sum();
    std::optional<T> min();
    std::optional<T> max();
    // Number of cells holding the minimum / maximum value.
    std::int64_t nMin();
    std::int64_t nMax();
    // Mean rounded to dp places; empty when the grid has no data.
    std::optional<Decimal> mean(int dp, RoundingMode rm);

    // Recompute everything from a full scan.
    void update();

    nlohmann::json toJson();

private:
    void ensureFresh();
    void rescanExtremes();

    Grid<T>& _grid;
    StatsMode _mode;
    bool _upToDate = true;

    std::int64_t _count = 0;
    Decimal _sum = 0;
    std::optional<T> _min;
    std::optional<T> _max;
    std::int64_t _nMin = 0;
    std::int64_t _nMax = 0;
    bool _minStale = false;
    bool _maxStale = false;
};

} // namespace rg
