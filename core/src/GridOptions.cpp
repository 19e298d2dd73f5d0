#include "rg/core/types/GridOptions.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace rg {

const char* statsModeName(StatsMode m)
{
    return m == StatsMode::Updated ? "updated" : "stale";
}

void GridOptions::validate() const
{
    if (chunkRows <= 0 || chunkCols <= 0) {
        throw ConfigError("chunk extents must be positive, got " +
                          std::to_string(chunkRows) + "x" + std::to_string(chunkCols));
    }
    // Sparse chunks address cells with 32-bit offsets.
    if (std::uint64_t(chunkRows) * std::uint64_t(chunkCols) > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigError("chunk of " + std::to_string(chunkRows) + "x" + std::to_string(chunkCols) +
                          " cells is too large");
    }
    if (promotion == ChunkEncoding::Uniform) {
        throw ConfigError("promotion target must be dense or sparse");
    }
}

GridOptions GridOptions::fromJson(const nlohmann::json* j)
{
    GridOptions o;
    if (!j) return o;

    auto asInt = [](std::int64_t v, const char* key) {
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw ConfigError(std::string("grid '") + key + "' out of range");
        }
        return static_cast<int>(v);
    };
    o.chunkRows = asInt(json::integer_or(j, "chunk_rows", o.chunkRows), "chunk_rows");
    o.chunkCols = asInt(json::integer_or(j, "chunk_cols", o.chunkCols), "chunk_cols");

    const std::string promotion = json::string_or(j, "promotion", "dense");
    if (promotion == "dense")
        o.promotion = ChunkEncoding::Dense;
    else if (promotion == "sparse")
        o.promotion = ChunkEncoding::Sparse;
    else
        throw ConfigError("unknown promotion target: " + promotion);

    const std::string stats = json::string_or(j, "stats", "updated");
    if (stats == "updated")
        o.stats = StatsMode::Updated;
    else if (stats == "stale")
        o.stats = StatsMode::Stale;
    else
        throw ConfigError("unknown stats mode: " + stats);

    o.validate();
    return o;
}

} // namespace rg
