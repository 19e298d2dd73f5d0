#pragma once

#include "rg/core/types/Chunk.hpp"
#include "rg/core/types/ChunkID.hpp"
#include "rg/core/types/GridOptions.hpp"
#include "rg/core/types/GridStats.hpp"
#include "rg/core/util/Decimal.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/EvictionRegistry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace rg {

// Result of a nearest-data search: every cell tied at the minimum distance.
struct NearestCells {
    std::vector<CellID> cells;
    std::optional<Decimal> distance;  // empty when the grid holds no data
};

/**
 * @brief Two-dimensional raster of T partitioned into independently evictable chunks.
 *
 * Cells outside the grid read as the no-data value and ignore writes. Chunks
 * are created on the first write to their region and start Uniform at the
 * no-data value. Evicted chunks are reloaded from the registry's blob store on
 * the next access.
 *
 * Grids register with an EvictionRegistry for their whole lifetime and are
 * therefore neither copyable nor movable; create them through create() or
 * copyWindow().
 */
template<typename T>
class Grid final : public EvictableGrid
{
public:
    using value_type = T;

    struct ChunkAddress {
        ChunkID id;
        int row;  // within the chunk
        int col;
    };

    /**
     * @brief New grid with every cell at the no-data value.
     * @throws std::invalid_argument for empty extents or a non-finite no-data value
     * @throws ConfigError for invalid chunk options
     */
    static std::unique_ptr<Grid> create(EvictionRegistry& registry,
                                        std::int64_t nRows, std::int64_t nCols,
                                        const Dimensions& dims, T noData,
                                        const GridOptions& options = {});

    /**
     * @brief Copy rows [startRow, endRow] and cols [startCol, endCol] of src.
     *
     * The origin is shifted to the window. Source no-data (and NaN or infinite
     * source values) become this grid's no-data value.
     */
    template<typename U>
    static std::unique_ptr<Grid> copyWindow(EvictionRegistry& registry, Grid<U>& src,
                                            std::int64_t startRow, std::int64_t startCol,
                                            std::int64_t endRow, std::int64_t endCol,
                                            T noData, const GridOptions& options = {});

    ~Grid() override;

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    // EvictableGrid
    [[nodiscard]] GridId gridId() const override { return _id; }
    [[nodiscard]] std::size_t residentBytes() const override { return _residentBytes; }
    void collectEvictionCandidates(std::vector<EvictionCandidate>& out) override;
    std::size_t evictChunk(const ChunkID& id) override;

    [[nodiscard]] std::int64_t nRows() const { return _nRows; }
    [[nodiscard]] std::int64_t nCols() const { return _nCols; }
    [[nodiscard]] int chunkNRows() const { return _options.chunkRows; }
    [[nodiscard]] int chunkNCols() const { return _options.chunkCols; }
    [[nodiscard]] int nChunkRows() const { return _nChunkRows; }
    [[nodiscard]] int nChunkCols() const { return _nChunkCols; }
    // Extent of a chunk row/column; the last one is clipped to the grid.
    [[nodiscard]] int chunkRowsAt(int chunkRow) const;
    [[nodiscard]] int chunkColsAt(int chunkCol) const;

    [[nodiscard]] T noData() const { return _noData; }
    [[nodiscard]] const Dimensions& dimensions() const { return _dims; }
    [[nodiscard]] const GridOptions& options() const { return _options; }
    [[nodiscard]] Decimal xMax() const { return _dims.xMin + Decimal(_nCols) * _dims.cellSize; }
    [[nodiscard]] Decimal yMax() const { return _dims.yMin + Decimal(_nRows) * _dims.cellSize; }

    [[nodiscard]] bool inGrid(std::int64_t row, std::int64_t col) const
    {
        return row >= 0 && row < _nRows && col >= 0 && col < _nCols;
    }
    [[nodiscard]] bool isNoData(T v) const { return v == _noData; }

    [[nodiscard]] ChunkAddress cellToChunk(std::int64_t row, std::int64_t col) const;
    [[nodiscard]] CellID chunkToCell(const ChunkID& id, int localRow, int localCol) const;

    // Coordinate mapping. Throws ArithmeticDomainError when the index does not fit 64 bits.
    [[nodiscard]] std::int64_t rowAt(const Decimal& y) const;
    [[nodiscard]] std::int64_t colAt(const Decimal& x) const;
    [[nodiscard]] Decimal cellX(std::int64_t col) const;
    [[nodiscard]] Decimal cellY(std::int64_t row) const;

    T getCell(std::int64_t row, std::int64_t col);
    T getCell(const Decimal& x, const Decimal& y) { return getCell(rowAt(y), colAt(x)); }

    // Returns the previous value. NaN and infinite values are stored as no-data.
    T setCell(std::int64_t row, std::int64_t col, T value);
    T setCell(const Decimal& x, const Decimal& y, T value) { return setCell(rowAt(y), colAt(x), value); }

    // No-data is treated as zero for the current value only; a no-data delta is ignored.
    void addToCell(std::int64_t row, std::int64_t col, T delta);
    void addToCell(const Decimal& x, const Decimal& y, T delta) { addToCell(rowAt(y), colAt(x), delta); }

    // Bulk-construction write. With skipStats the aggregates are only marked stale.
    void initCell(std::int64_t row, std::int64_t col, T value, bool skipStats);

    /**
     * @brief Values of the in-grid cells whose centroid lies within radius of (x, y).
     *
     * Distances are computed at dp decimal places with rounding rm. Cells are
     * returned row-major starting from the lowest row.
     */
    std::vector<T> cellsWithinRadius(const Decimal& x, const Decimal& y, const Decimal& radius,
                                     int dp, RoundingMode rm);
    std::vector<CellID> cellIDsWithinRadius(const Decimal& x, const Decimal& y, const Decimal& radius,
                                            int dp, RoundingMode rm);

    /**
     * @brief Cells holding data closest to (x, y).
     *
     * If the cell containing the point holds data it is returned with
     * distance 0. Otherwise rings of neighbours are searched outwards until
     * one contains data, and the result is refined with every cell within
     * the best true distance found.
     */
    NearestCells nearestDataCells(const Decimal& x, const Decimal& y, int dp, RoundingMode rm);
    // Search from the centroid of (row, col).
    NearestCells nearestDataCells(std::int64_t row, std::int64_t col, int dp, RoundingMode rm);

    /**
     * @brief Same extents and origin, and every cell either no-data in both or equal.
     *
     * Each side is tested against its own no-data value. The caller guarantees
     * that neither no-data value is also used as a data value.
     */
    template<typename U>
    bool equalsByDimensionsAndValues(Grid<U>& other);

    // Visits every cell (row, col, value), chunk by chunk. The callback may
    // read the grid but not write it: writes throw std::logic_error.
    void forEachCell(const std::function<void(std::int64_t, std::int64_t, T)>& fn);
    // Visits runs of equal values: whole Uniform chunks as one run, other cells singly.
    // Same restriction as forEachCell().
    void forEachValueRun(const std::function<void(T, std::int64_t)>& fn);

    GridStats<T>& stats() { return _stats; }

    [[nodiscard]] EvictionRegistry::PinGuard pinChunk(const ChunkID& id) { return _registry.pinScoped(*this, id); }
    [[nodiscard]] bool hasChunk(const ChunkID& id) const { return _chunks.contains(id); }
    [[nodiscard]] bool isResident(const ChunkID& id) const;
    // Encoding of a resident chunk.
    [[nodiscard]] std::optional<ChunkEncoding> chunkEncoding(const ChunkID& id) const;
    [[nodiscard]] std::size_t residentChunkCount() const;
    [[nodiscard]] const std::set<ChunkID>& worthEvicting() const { return _worthEvicting; }

    nlohmann::json toJson();

private:
    struct Slot {
        std::optional<Chunk<T>> chunk;   // empty when evicted
        bool dirty = true;               // differs from the stored blob
        bool stored = false;             // a blob exists in the store
        std::uint64_t lastAccess = 0;
        std::size_t evictedBytes = 0;    // footprint when last evicted
    };

    Grid(EvictionRegistry& registry, std::int64_t nRows, std::int64_t nCols,
         const Dimensions& dims, T noData, const GridOptions& options);

    // Create or reload the chunk and return its slot. The caller holds a pin.
    Slot& materialize(const ChunkID& id);
    T write(std::int64_t row, std::int64_t col, T value, bool trackStats, bool initializing);
    void convert(Slot& slot, const ChunkID& id, ChunkEncoding target);
    void accountResize(Slot& slot, const ChunkID& id, std::size_t before);

    struct RadiusHit {
        CellID cell;
        Decimal distance;
    };
    std::vector<RadiusHit> radiusHits(const Decimal& x, const Decimal& y, const Decimal& radius,
                                      int dp, RoundingMode rm);

    EvictionRegistry& _registry;
    GridId _id = 0;
    std::int64_t _nRows;
    std::int64_t _nCols;
    int _nChunkRows = 0;
    int _nChunkCols = 0;
    Dimensions _dims;
    T _noData;
    GridOptions _options;

    std::map<ChunkID, Slot> _chunks;
    std::set<ChunkID> _worthEvicting;
    std::size_t _residentBytes = 0;
    int _traversals = 0;  // forEach* calls in progress
    GridStats<T> _stats;
};

// ============ cross-type templates ============

namespace detail {

// Source value to target cell value; anything without a representation becomes target no-data.
template<typename T, typename U>
T convertCell(U v, U srcNoData, T dstNoData)
{
    if (v == srcNoData)
        return dstNoData;
    if constexpr (std::is_floating_point_v<U>) {
        if (!std::isfinite(v))
            return dstNoData;
        if constexpr (std::is_integral_v<T>) {
            if (v < static_cast<U>(std::numeric_limits<T>::min()) ||
                v > static_cast<U>(std::numeric_limits<T>::max())) {
                throw ArithmeticDomainError("value " + std::to_string(v) + " does not fit the target cell type");
            }
        }
    }
    return static_cast<T>(v);
}

} // namespace detail

template<typename T>
template<typename U>
std::unique_ptr<Grid<T>> Grid<T>::copyWindow(EvictionRegistry& registry, Grid<U>& src,
                                             std::int64_t startRow, std::int64_t startCol,
                                             std::int64_t endRow, std::int64_t endCol,
                                             T noData, const GridOptions& options)
{
    if (endRow < startRow || endCol < startCol) {
        throw std::invalid_argument("copyWindow: empty window");
    }

    const auto& sd = src.dimensions();
    Dimensions dims{sd.xMin + Decimal(startCol) * sd.cellSize,
                    sd.yMin + Decimal(startRow) * sd.cellSize,
                    sd.cellSize};
    auto dst = create(registry, endRow - startRow + 1, endCol - startCol + 1, dims, noData, options);
    const bool skipStats = options.stats == StatsMode::Stale;

    // Walk the window one source chunk at a time, keeping that chunk pinned.
    const std::int64_t r0 = std::max<std::int64_t>(startRow, 0);
    const std::int64_t c0 = std::max<std::int64_t>(startCol, 0);
    const std::int64_t r1 = std::min<std::int64_t>(endRow, src.nRows() - 1);
    const std::int64_t c1 = std::min<std::int64_t>(endCol, src.nCols() - 1);
    if (r0 > r1 || c0 > c1)
        return dst;

    const int cr0 = src.cellToChunk(r0, c0).id.row;
    const int cr1 = src.cellToChunk(r1, c1).id.row;
    const int cc0 = src.cellToChunk(r0, c0).id.col;
    const int cc1 = src.cellToChunk(r1, c1).id.col;
    for (int cr = cr0; cr <= cr1; ++cr) {
        for (int cc = cc0; cc <= cc1; ++cc) {
            const ChunkID id{cr, cc};
            if (!src.hasChunk(id))
                continue;  // never written: all no-data
            auto pin = src.pinChunk(id);
            const CellID first = src.chunkToCell(id, 0, 0);
            const std::int64_t rr0 = std::max(r0, first.row);
            const std::int64_t rr1 = std::min(r1, first.row + src.chunkRowsAt(cr) - 1);
            const std::int64_t cc0b = std::max(c0, first.col);
            const std::int64_t cc1b = std::min(c1, first.col + src.chunkColsAt(cc) - 1);
            for (std::int64_t r = rr0; r <= rr1; ++r) {
                for (std::int64_t c = cc0b; c <= cc1b; ++c) {
                    T v = detail::convertCell<T, U>(src.getCell(r, c), src.noData(), noData);
                    if (v != noData)
                        dst->initCell(r - startRow, c - startCol, v, skipStats);
                }
            }
        }
    }
    return dst;
}

template<typename T>
template<typename U>
bool Grid<T>::equalsByDimensionsAndValues(Grid<U>& other)
{
    if (_nRows != other.nRows() || _nCols != other.nCols() || !(_dims == other.dimensions()))
        return false;

    for (std::int64_t r = 0; r < _nRows; ++r) {
        for (std::int64_t c = 0; c < _nCols; ++c) {
            const T a = getCell(r, c);
            const U b = other.getCell(r, c);
            const bool aNoData = a == _noData;
            const bool bNoData = b == other.noData();
            if (aNoData != bNoData)
                return false;
            if (!aNoData && static_cast<double>(a) != static_cast<double>(b))
                return false;
        }
    }
    return true;
}

extern template class Grid<std::int32_t>;
extern template class Grid<float>;
extern template class Grid<double>;

} // namespace rg
