#include "rg/core/util/AsciiGrid.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <format>
#include <limits>

namespace rg {

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::int64_t parseCount(const std::string& key, const std::string& text)
{
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || v <= 0) {
        throw ConfigError("ASCII grid header: invalid " + key + " '" + text + "'");
    }
    return v;
}

} // namespace

AsciiGridReader::AsciiGridReader(const std::filesystem::path& path)
    : _path(path), _in(path)
{
    if (!_in) {
        throw IOError("cannot open ASCII grid " + path.string());
    }

    std::optional<Decimal> xCorner, yCorner, xCenter, yCenter, cellSize;
    std::optional<std::int64_t> nCols, nRows;

    for (;;) {
        std::string key;
        if (!(_in >> key)) {
            break;
        }
        if (!std::isalpha(static_cast<unsigned char>(key.front()))) {
            _pending = key;
            break;
        }
        std::string value;
        if (!(_in >> value)) {
            throw ConfigError("ASCII grid header: missing value for " + key);
        }
        key = lower(key);
        if (key == "ncols") nCols = parseCount(key, value);
        else if (key == "nrows") nRows = parseCount(key, value);
        else if (key == "xllcorner") xCorner = parseDecimal(value);
        else if (key == "yllcorner") yCorner = parseDecimal(value);
        else if (key == "xllcenter") xCenter = parseDecimal(value);
        else if (key == "yllcenter") yCenter = parseDecimal(value);
        else if (key == "cellsize") cellSize = parseDecimal(value);
        else if (key == "nodata_value") {
            char* end = nullptr;
            const double nd = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0') {
                throw ConfigError("ASCII grid header: invalid NODATA_value '" + value + "'");
            }
            _header.noData = nd;
        } else {
            throw ConfigError("ASCII grid header: unknown key " + key);
        }
    }

    if (!nCols || !nRows || !cellSize) {
        throw ConfigError("ASCII grid header in " + path.string() + " needs ncols, nrows and cellsize");
    }
    if (*cellSize <= 0) {
        throw ConfigError("ASCII grid header: cellsize must be positive");
    }
    if (!(xCorner || xCenter) || !(yCorner || yCenter)) {
        throw ConfigError("ASCII grid header in " + path.string() + " needs an x and y origin");
    }

    const Decimal half = *cellSize / 2;
    _header.nCols = *nCols;
    _header.nRows = *nRows;
    _header.cellSize = *cellSize;
    _header.xllCorner = xCorner ? *xCorner : Decimal(*xCenter - half);
    _header.yllCorner = yCorner ? *yCorner : Decimal(*yCenter - half);
}

std::string AsciiGridReader::nextToken()
{
    if (_pending) {
        std::string t = std::move(*_pending);
        _pending.reset();
        return t;
    }
    std::string t;
    if (!(_in >> t)) {
        throw IOError("ASCII grid " + _path.string() + " ended after " +
                      std::to_string(_valuesRead) + " values");
    }
    return t;
}

double AsciiGridReader::readValue()
{
    const std::string token = nextToken();
    char* end = nullptr;
    const double v = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        throw IOError("ASCII grid " + _path.string() + ": malformed value '" + token +
                      "' at position " + std::to_string(_valuesRead));
    }
    ++_valuesRead;
    return v;
}

template<typename T>
std::unique_ptr<Grid<T>> loadAsciiGrid(EvictionRegistry& registry,
                                       const std::filesystem::path& path,
                                       T noData, const GridOptions& options)
{
    AsciiGridReader reader(path);
    const AsciiHeader& h = reader.header();

    auto grid = Grid<T>::create(registry, h.nRows, h.nCols, h.dimensions(), noData, options);
    const bool skipStats = options.stats == StatsMode::Stale;
    const std::int64_t reportEvery = std::max<std::int64_t>(1, h.nRows / 10);
    const double fileNoData = h.noData.value_or(std::numeric_limits<double>::quiet_NaN());

    Logger()->info("importing {}: {}x{} cells", path.string(), h.nRows, h.nCols);

    // File rows run top to bottom; internal row 0 is the bottom row.
    for (std::int64_t row = h.nRows - 1; row >= 0; --row) {
        registry.ensureHeadroom();
        for (std::int64_t col = 0; col < h.nCols; ++col) {
            const double v = reader.readValue();
            grid->initCell(row, col, detail::convertCell<T, double>(v, fileNoData, noData), skipStats);
        }
        if ((h.nRows - 1 - row) % reportEvery == 0) {
            Logger()->debug("Done row {}", row);
        }
    }
    return grid;
}

template<typename T>
void writeAsciiGrid(Grid<T>& grid, const std::filesystem::path& path)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw IOError("cannot open " + path.string() + " for writing");
    }

    const auto& d = grid.dimensions();
    out << std::format("ncols {}\nnrows {}\nxllcorner {}\nyllcorner {}\ncellsize {}\nNODATA_value {}\n",
                       grid.nCols(), grid.nRows(), toString(d.xMin), toString(d.yMin),
                       toString(d.cellSize), grid.noData());

    for (std::int64_t row = grid.nRows() - 1; row >= 0; --row) {
        for (std::int64_t col = 0; col < grid.nCols(); ++col) {
            if (col > 0) out << ' ';
            out << std::format("{}", grid.getCell(row, col));
        }
        out << '\n';
    }
    out.flush();
    if (!out) {
        throw IOError("write failed: " + path.string());
    }
}

template std::unique_ptr<Grid<std::int32_t>> loadAsciiGrid(EvictionRegistry&, const std::filesystem::path&, std::int32_t, const GridOptions&);
template std::unique_ptr<Grid<float>> loadAsciiGrid(EvictionRegistry&, const std::filesystem::path&, float, const GridOptions&);
template std::unique_ptr<Grid<double>> loadAsciiGrid(EvictionRegistry&, const std::filesystem::path&, double, const GridOptions&);

template void writeAsciiGrid(Grid<std::int32_t>&, const std::filesystem::path&);
template void writeAsciiGrid(Grid<float>&, const std::filesystem::path&);
template void writeAsciiGrid(Grid<double>&, const std::filesystem::path&);

} // namespace rg
