#include "rg/core/types/Grid.hpp"
#include "rg/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>

namespace rg {

namespace {

std::int64_t floorDiv(std::int64_t a, std::int64_t b)
{
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

std::int64_t ceilToIndex(const Decimal& v)
{
    return -floorToIndex(-v);
}

std::int64_t chebyshev(const CellID& a, std::int64_t row, std::int64_t col)
{
    return std::max(std::llabs(a.row - row), std::llabs(a.col - col));
}

struct TraversalScope {
    explicit TraversalScope(int& depth) : _depth(depth) { ++_depth; }
    ~TraversalScope() { --_depth; }
    TraversalScope(const TraversalScope&) = delete;
    TraversalScope& operator=(const TraversalScope&) = delete;

    int& _depth;
};

} // namespace

// ============ construction ============

template<typename T>
Grid<T>::Grid(EvictionRegistry& registry, std::int64_t nRows, std::int64_t nCols,
              const Dimensions& dims, T noData, const GridOptions& options)
    : _registry(registry), _nRows(nRows), _nCols(nCols), _dims(dims), _noData(noData),
      _options(options), _stats(*this, options.stats)
{
    _options.validate();
    if (nRows <= 0 || nCols <= 0) {
        throw std::invalid_argument("grid extents must be positive, got " +
                                    std::to_string(nRows) + "x" + std::to_string(nCols));
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(noData)) {
            throw std::invalid_argument("no-data value must be finite");
        }
    }
    if (dims.cellSize <= 0) {
        throw std::invalid_argument("cell size must be positive, got " + toString(dims.cellSize));
    }

    const std::int64_t chunkRows = (nRows + _options.chunkRows - 1) / _options.chunkRows;
    const std::int64_t chunkCols = (nCols + _options.chunkCols - 1) / _options.chunkCols;
    if (chunkRows > std::numeric_limits<int>::max() || chunkCols > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("grid needs too many chunks; increase the chunk size");
    }
    _nChunkRows = static_cast<int>(chunkRows);
    _nChunkCols = static_cast<int>(chunkCols);

    _id = _registry.registerGrid(*this);
    Logger()->debug("grid {} created: {}x{} {} cells, {}x{} chunks of {}x{}",
                    _id, _nRows, _nCols, CellType<T>::name,
                    _nChunkRows, _nChunkCols, _options.chunkRows, _options.chunkCols);
}

template<typename T>
std::unique_ptr<Grid<T>> Grid<T>::create(EvictionRegistry& registry,
                                         std::int64_t nRows, std::int64_t nCols,
                                         const Dimensions& dims, T noData,
                                         const GridOptions& options)
{
    return std::unique_ptr<Grid>(new Grid(registry, nRows, nCols, dims, noData, options));
}

template<typename T>
Grid<T>::~Grid()
{
    _registry.unregisterGrid(*this);
    try {
        _registry.store().remove(_id);
    } catch (const Exception& e) {
        Logger()->error("grid {}: failed to remove stored chunks: {}", _id, e.what());
    }
}

// ============ geometry ============

template<typename T>
int Grid<T>::chunkRowsAt(int chunkRow) const
{
    if (chunkRow == _nChunkRows - 1)
        return static_cast<int>(_nRows - std::int64_t(_nChunkRows - 1) * _options.chunkRows);
    return _options.chunkRows;
}

template<typename T>
int Grid<T>::chunkColsAt(int chunkCol) const
{
    if (chunkCol == _nChunkCols - 1)
        return static_cast<int>(_nCols - std::int64_t(_nChunkCols - 1) * _options.chunkCols);
    return _options.chunkCols;
}

template<typename T>
typename Grid<T>::ChunkAddress Grid<T>::cellToChunk(std::int64_t row, std::int64_t col) const
{
    const std::int64_t cr = floorDiv(row, _options.chunkRows);
    const std::int64_t cc = floorDiv(col, _options.chunkCols);
    return {ChunkID{static_cast<int>(cr), static_cast<int>(cc)},
            static_cast<int>(row - cr * _options.chunkRows),
            static_cast<int>(col - cc * _options.chunkCols)};
}

template<typename T>
CellID Grid<T>::chunkToCell(const ChunkID& id, int localRow, int localCol) const
{
    return {std::int64_t(id.row) * _options.chunkRows + localRow,
            std::int64_t(id.col) * _options.chunkCols + localCol};
}

template<typename T>
std::int64_t Grid<T>::rowAt(const Decimal& y) const
{
    return floorToIndex((y - _dims.yMin) / _dims.cellSize);
}

template<typename T>
std::int64_t Grid<T>::colAt(const Decimal& x) const
{
    return floorToIndex((x - _dims.xMin) / _dims.cellSize);
}

template<typename T>
Decimal Grid<T>::cellX(std::int64_t col) const
{
    return _dims.xMin + (Decimal(col) + Decimal("0.5")) * _dims.cellSize;
}

template<typename T>
Decimal Grid<T>::cellY(std::int64_t row) const
{
    return _dims.yMin + (Decimal(row) + Decimal("0.5")) * _dims.cellSize;
}

// ============ chunk table ============

template<typename T>
typename Grid<T>::Slot& Grid<T>::materialize(const ChunkID& id)
{
    auto it = _chunks.find(id);
    if (it != _chunks.end() && it->second.chunk) {
        it->second.lastAccess = _registry.nextAccessTick();
        return it->second;
    }

    const int rows = chunkRowsAt(id.row);
    const int cols = chunkColsAt(id.col);
    const auto exclusion = EvictionExclusion::of(*this, {id});

    if (it == _chunks.end()) {
        _registry.withHeadroom(exclusion, sizeof(Chunk<T>), [&] {
            it = _chunks.try_emplace(id).first;
            it->second.chunk.emplace(rows, cols, _noData);
        });
    } else {
        _registry.withHeadroom(exclusion, it->second.evictedBytes, [&] {
            Blob blob = _registry.store().load(_id, id);
            it->second.chunk.emplace(Chunk<T>::deserialize(blob, rows, cols));
        });
        it->second.dirty = false;
        Logger()->trace("grid {} reloaded chunk {} ({})", _id, id.str(),
                        encodingName(it->second.chunk->encoding()));
    }

    Slot& slot = it->second;
    _residentBytes += slot.chunk->memoryBytes();
    if (slot.chunk->encoding() != ChunkEncoding::Uniform)
        _worthEvicting.insert(id);
    slot.lastAccess = _registry.nextAccessTick();
    return slot;
}

template<typename T>
void Grid<T>::accountResize(Slot& slot, const ChunkID& id, std::size_t before)
{
    _residentBytes = _residentBytes - before + slot.chunk->memoryBytes();
    if (slot.chunk->encoding() != ChunkEncoding::Uniform)
        _worthEvicting.insert(id);
}

template<typename T>
void Grid<T>::convert(Slot& slot, const ChunkID& id, ChunkEncoding target)
{
    Chunk<T>& chunk = *slot.chunk;
    const ChunkEncoding from = chunk.encoding();
    const std::size_t before = chunk.memoryBytes();
    _registry.withHeadroom(EvictionExclusion::of(*this, {id}), chunk.bytesAs(target),
                           [&] { chunk.promote(target); });
    accountResize(slot, id, before);
    slot.dirty = true;
    Logger()->trace("grid {} chunk {}: {} -> {}", _id, id.str(), encodingName(from), encodingName(target));
}

template<typename T>
void Grid<T>::collectEvictionCandidates(std::vector<EvictionCandidate>& out)
{
    for (const auto& id : _worthEvicting) {
        const Slot& slot = _chunks.at(id);
        if (slot.chunk)
            out.push_back({this, id, slot.lastAccess, slot.chunk->memoryBytes()});
    }
}

template<typename T>
std::size_t Grid<T>::evictChunk(const ChunkID& id)
{
    auto it = _chunks.find(id);
    if (it == _chunks.end() || !it->second.chunk)
        return 0;

    Slot& slot = it->second;
    if (slot.dirty || !slot.stored) {
        _registry.store().save(_id, id, slot.chunk->serialize());
        slot.stored = true;
        slot.dirty = false;
    }
    const std::size_t bytes = slot.chunk->memoryBytes();
    slot.evictedBytes = bytes;
    slot.chunk.reset();
    _residentBytes -= bytes;
    _worthEvicting.erase(id);
    Logger()->trace("grid {} evicted chunk {} ({} bytes)", _id, id.str(), bytes);
    return bytes;
}

template<typename T>
bool Grid<T>::isResident(const ChunkID& id) const
{
    auto it = _chunks.find(id);
    return it != _chunks.end() && it->second.chunk.has_value();
}

template<typename T>
std::optional<ChunkEncoding> Grid<T>::chunkEncoding(const ChunkID& id) const
{
    auto it = _chunks.find(id);
    if (it == _chunks.end() || !it->second.chunk)
        return std::nullopt;
    return it->second.chunk->encoding();
}

template<typename T>
std::size_t Grid<T>::residentChunkCount() const
{
    std::size_t n = 0;
    for (const auto& [id, slot] : _chunks)
        if (slot.chunk)
            ++n;
    return n;
}

// ============ cell access ============

template<typename T>
T Grid<T>::getCell(std::int64_t row, std::int64_t col)
{
    if (!inGrid(row, col))
        return _noData;
    const auto addr = cellToChunk(row, col);
    if (!hasChunk(addr.id))
        return _noData;
    auto pin = pinChunk(addr.id);
    return materialize(addr.id).chunk->get(addr.row, addr.col);
}

template<typename T>
T Grid<T>::write(std::int64_t row, std::int64_t col, T value, bool trackStats, bool initializing)
{
    if (_traversals > 0) {
        throw std::logic_error("grid " + std::to_string(_id) + " written during a cell traversal");
    }
    if (!inGrid(row, col))
        return _noData;
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value))
            value = _noData;
    }

    const auto addr = cellToChunk(row, col);
    if (!hasChunk(addr.id) && value == _noData)
        return _noData;

    auto pin = pinChunk(addr.id);
    Slot& slot = materialize(addr.id);
    Chunk<T>& chunk = *slot.chunk;

    if (chunk.wouldPromote(addr.row, addr.col, value))
        convert(slot, addr.id, _options.promotion);

    const std::size_t before = chunk.memoryBytes();
    // Sparse writes may allocate a map node.
    const T prev = _registry.retryOnAllocFailure(EvictionExclusion::of(*this, {addr.id}), [&] {
        return initializing ? chunk.initialize(addr.row, addr.col, value, _options.promotion)
                            : chunk.set(addr.row, addr.col, value, _options.promotion);
    });
    accountResize(slot, addr.id, before);
    if (chunk.prefersDense())
        convert(slot, addr.id, ChunkEncoding::Dense);

    if (prev != value) {
        slot.dirty = true;
        if (trackStats)
            _stats.apply(value, prev);
        else
            _stats.invalidate();
    }
    return prev;
}

template<typename T>
T Grid<T>::setCell(std::int64_t row, std::int64_t col, T value)
{
    return write(row, col, value, true, false);
}

template<typename T>
void Grid<T>::initCell(std::int64_t row, std::int64_t col, T value, bool skipStats)
{
    write(row, col, value, !skipStats, true);
}

template<typename T>
void Grid<T>::addToCell(std::int64_t row, std::int64_t col, T delta)
{
    if (!inGrid(row, col))
        return;
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(delta))
            return;
    }
    if (delta == _noData)
        return;

    const T current = getCell(row, col);
    if (current == _noData) {
        setCell(row, col, delta);
        return;
    }
    if constexpr (std::is_integral_v<T>) {
        const std::int64_t sum = std::int64_t(current) + std::int64_t(delta);
        if (sum < std::numeric_limits<T>::min() || sum > std::numeric_limits<T>::max()) {
            throw ArithmeticDomainError("addToCell overflows the cell type at (" +
                                        std::to_string(row) + ", " + std::to_string(col) + ")");
        }
        setCell(row, col, static_cast<T>(sum));
    } else {
        setCell(row, col, current + delta);
    }
}

// ============ traversal ============

template<typename T>
void Grid<T>::forEachCell(const std::function<void(std::int64_t, std::int64_t, T)>& fn)
{
    TraversalScope scope(_traversals);
    for (int cr = 0; cr < _nChunkRows; ++cr) {
        for (int cc = 0; cc < _nChunkCols; ++cc) {
            const ChunkID id{cr, cc};
            const CellID base = chunkToCell(id, 0, 0);
            if (!hasChunk(id)) {
                for (int r = 0; r < chunkRowsAt(cr); ++r)
                    for (int c = 0; c < chunkColsAt(cc); ++c)
                        fn(base.row + r, base.col + c, _noData);
                continue;
            }
            auto pin = pinChunk(id);
            materialize(id).chunk->forEach([&](int r, int c, T v) {
                fn(base.row + r, base.col + c, v);
            });
        }
    }
}

template<typename T>
void Grid<T>::forEachValueRun(const std::function<void(T, std::int64_t)>& fn)
{
    TraversalScope scope(_traversals);
    for (int cr = 0; cr < _nChunkRows; ++cr) {
        for (int cc = 0; cc < _nChunkCols; ++cc) {
            const ChunkID id{cr, cc};
            const std::int64_t cells = std::int64_t(chunkRowsAt(cr)) * chunkColsAt(cc);
            if (!hasChunk(id)) {
                fn(_noData, cells);
                continue;
            }
            auto pin = pinChunk(id);
            const Chunk<T>& chunk = *materialize(id).chunk;
            if (chunk.encoding() == ChunkEncoding::Uniform) {
                fn(chunk.get(0, 0), cells);
            } else {
                chunk.forEach([&](int, int, T v) { fn(v, 1); });
            }
        }
    }
}

// ============ spatial queries ============

template<typename T>
std::vector<typename Grid<T>::RadiusHit> Grid<T>::radiusHits(const Decimal& x, const Decimal& y,
                                                             const Decimal& radius,
                                                             int dp, RoundingMode rm)
{
    std::vector<RadiusHit> hits;
    if (radius < 0)
        return hits;

    const std::int64_t row = rowAt(y);
    const std::int64_t col = colAt(x);
    // One extra cell absorbs the rounding of the distance at dp places.
    const std::int64_t delta = ceilToIndex(radius / _dims.cellSize) + 1;

    const std::int64_t rLo = std::max<std::int64_t>(row - delta, 0);
    const std::int64_t rHi = std::min<std::int64_t>(row + delta, _nRows - 1);
    const std::int64_t cLo = std::max<std::int64_t>(col - delta, 0);
    const std::int64_t cHi = std::min<std::int64_t>(col + delta, _nCols - 1);

    for (std::int64_t r = rLo; r <= rHi; ++r) {
        const Decimal cy = cellY(r);
        for (std::int64_t c = cLo; c <= cHi; ++c) {
            Decimal d = distance(x, y, cellX(c), cy, dp, rm);
            if (d <= radius)
                hits.push_back({CellID{r, c}, std::move(d)});
        }
    }
    return hits;
}

template<typename T>
std::vector<T> Grid<T>::cellsWithinRadius(const Decimal& x, const Decimal& y, const Decimal& radius,
                                          int dp, RoundingMode rm)
{
    std::vector<T> values;
    for (const auto& hit : radiusHits(x, y, radius, dp, rm))
        values.push_back(getCell(hit.cell.row, hit.cell.col));
    return values;
}

template<typename T>
std::vector<CellID> Grid<T>::cellIDsWithinRadius(const Decimal& x, const Decimal& y, const Decimal& radius,
                                                 int dp, RoundingMode rm)
{
    std::vector<CellID> ids;
    for (const auto& hit : radiusHits(x, y, radius, dp, rm))
        ids.push_back(hit.cell);
    return ids;
}

template<typename T>
NearestCells Grid<T>::nearestDataCells(const Decimal& x, const Decimal& y, int dp, RoundingMode rm)
{
    NearestCells result;
    const std::int64_t row = rowAt(y);
    const std::int64_t col = colAt(x);

    if (inGrid(row, col) && !isNoData(getCell(row, col))) {
        result.cells.push_back({row, col});
        result.distance = Decimal(0);
        return result;
    }
    if (_stats.count() == 0)
        return result;

    // Rings closer than the grid edge hold no cells; start at the first that does.
    const std::int64_t dRow = row < 0 ? -row : (row >= _nRows ? row - (_nRows - 1) : 0);
    const std::int64_t dCol = col < 0 ? -col : (col >= _nCols ? col - (_nCols - 1) : 0);
    std::int64_t ring = std::max<std::int64_t>({1, dRow, dCol});

    std::vector<CellID> found;
    auto probe = [&](std::int64_t r, std::int64_t c) {
        if (inGrid(r, c) && !isNoData(getCell(r, c)))
            found.push_back({r, c});
    };

    for (;; ++ring) {
        const std::int64_t rLo = std::max<std::int64_t>(row - ring, 0);
        const std::int64_t rHi = std::min<std::int64_t>(row + ring, _nRows - 1);
        const std::int64_t cLo = std::max<std::int64_t>(col - ring, 0);
        const std::int64_t cHi = std::min<std::int64_t>(col + ring, _nCols - 1);
        for (std::int64_t r = rLo; r <= rHi; ++r) {
            if (r == row - ring || r == row + ring) {
                for (std::int64_t c = cLo; c <= cHi; ++c)
                    probe(r, c);
            } else {
                probe(r, col - ring);
                probe(r, col + ring);
            }
        }
        if (!found.empty())
            break;
    }

    Decimal dmin;
    std::vector<CellID> best;
    auto consider = [&](const CellID& cell, const Decimal& d) {
        if (best.empty() || d < dmin) {
            dmin = d;
            best.assign(1, cell);
        } else if (d == dmin) {
            best.push_back(cell);
        }
    };
    for (const auto& cell : found)
        consider(cell, distance(x, y, cellX(cell.col), cellY(cell.row), dp, rm));

    // Ring distance is not Euclidean distance: cells beyond the ring may still be closer.
    for (const auto& hit : radiusHits(x, y, dmin, dp, rm)) {
        if (chebyshev(hit.cell, row, col) <= ring)
            continue;
        if (!isNoData(getCell(hit.cell.row, hit.cell.col)))
            consider(hit.cell, hit.distance);
    }

    std::sort(best.begin(), best.end());
    result.cells = std::move(best);
    result.distance = dmin;
    return result;
}

template<typename T>
NearestCells Grid<T>::nearestDataCells(std::int64_t row, std::int64_t col, int dp, RoundingMode rm)
{
    return nearestDataCells(cellX(col), cellY(row), dp, rm);
}

// ============ reporting ============

template<typename T>
nlohmann::json Grid<T>::toJson()
{
    nlohmann::json j;
    j["id"] = _id;
    j["cell_type"] = CellType<T>::name;
    j["n_rows"] = _nRows;
    j["n_cols"] = _nCols;
    j["chunk_rows"] = _options.chunkRows;
    j["chunk_cols"] = _options.chunkCols;
    j["n_chunk_rows"] = _nChunkRows;
    j["n_chunk_cols"] = _nChunkCols;
    j["x_min"] = toString(_dims.xMin);
    j["y_min"] = toString(_dims.yMin);
    j["cell_size"] = toString(_dims.cellSize);
    j["no_data"] = _noData;
    j["resident_chunks"] = residentChunkCount();
    j["resident_bytes"] = _residentBytes;
    j["stats"] = _stats.toJson();
    return j;
}

template class Grid<std::int32_t>;
template class Grid<float>;
template class Grid<double>;

} // namespace rg
