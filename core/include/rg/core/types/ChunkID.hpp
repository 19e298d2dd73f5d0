#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rg {

// Chunk address within a grid: (chunk row, chunk column). Ordered row-major.
struct ChunkID {
    int row = 0;
    int col = 0;

    auto operator<=>(const ChunkID&) const = default;

    [[nodiscard]] std::string str() const
    {
        return std::to_string(row) + "," + std::to_string(col);
    }
};

// Cell address within a grid. Rows count upwards from the bottom of the raster.
struct CellID {
    std::int64_t row = 0;
    std::int64_t col = 0;

    auto operator<=>(const CellID&) const = default;
};

} // namespace rg
