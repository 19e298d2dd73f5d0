#pragma once

/**
 * @file AsciiGrid.hpp
 * @brief ESRI ASCII grid import and export.
 *
 * The header carries ncols, nrows, xllcorner/xllcenter, yllcorner/yllcenter,
 * cellsize and an optional NODATA_value (keys are case-insensitive). The body
 * lists rows top to bottom, so the first row read is the grid's last row.
 */

#include "rg/core/types/Grid.hpp"
#include "rg/core/util/Decimal.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

namespace rg {

struct AsciiHeader {
    std::int64_t nCols = 0;
    std::int64_t nRows = 0;
    Decimal xllCorner = 0;
    Decimal yllCorner = 0;
    Decimal cellSize = 0;
    std::optional<double> noData;  // absent when the file has no NODATA_value line

    [[nodiscard]] Dimensions dimensions() const { return {xllCorner, yllCorner, cellSize}; }
};

class AsciiGridReader
{
public:
    // Opens the file and parses the header. Throws IOError / ConfigError.
    explicit AsciiGridReader(const std::filesystem::path& path);

    [[nodiscard]] const AsciiHeader& header() const { return _header; }

    // Next value in file order. Throws IOError when the file ends early or a token is not a number.
    double readValue();

    [[nodiscard]] bool isNoData(double v) const { return _header.noData && v == *_header.noData; }

private:
    std::string nextToken();

    std::filesystem::path _path;
    std::ifstream _in;
    AsciiHeader _header;
    std::optional<std::string> _pending;  // first body token, consumed while parsing the header
    std::int64_t _valuesRead = 0;
};

/**
 * @brief Import an ASCII grid into a new grid.
 *
 * The file's NODATA value maps to @p noData. Rows are written from the last
 * internal row down to row 0 and headroom is ensured once per row.
 */
template<typename T>
std::unique_ptr<Grid<T>> loadAsciiGrid(EvictionRegistry& registry,
                                       const std::filesystem::path& path,
                                       T noData, const GridOptions& options = {});

// Write the grid top row first, with its no-data value as NODATA_value.
template<typename T>
void writeAsciiGrid(Grid<T>& grid, const std::filesystem::path& path);

} // namespace rg
