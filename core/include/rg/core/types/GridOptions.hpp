#pragma once

#include "rg/core/types/Chunk.hpp"
#include "rg/core/util/Decimal.hpp"

#include <nlohmann/json_fwd.hpp>

namespace rg {

// Origin and cell size of a grid. Row 0 is the bottom row.
struct Dimensions {
    Decimal xMin = 0;
    Decimal yMin = 0;
    Decimal cellSize = 1;

    bool operator==(const Dimensions& o) const
    {
        return xMin == o.xMin && yMin == o.yMin && cellSize == o.cellSize;
    }
};

enum class StatsMode {
    Updated,  // aggregates maintained on every write
    Stale     // aggregates recomputed by a full scan when read
};

const char* statsModeName(StatsMode m);

struct GridOptions {
    int chunkRows = 512;
    int chunkCols = 512;
    // Encoding a Uniform chunk is promoted to on its first differing write.
    ChunkEncoding promotion = ChunkEncoding::Dense;
    StatsMode stats = StatsMode::Updated;

    // Throws ConfigError for non-positive or oversized chunk extents.
    void validate() const;

    static GridOptions fromJson(const nlohmann::json* j);
};

} // namespace rg
