#include "rg/core/types/BlobStore.hpp"
#include "rg/core/types/Grid.hpp"
#include "rg/core/util/AsciiGrid.hpp"
#include "rg/core/util/Decimal.hpp"
#include "rg/core/util/EvictionRegistry.hpp"
#include "rg/core/util/Logging.hpp"
#include "rg/core/util/ToolConfig.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace po = boost::program_options;

struct Query {
    rg::Decimal x;
    rg::Decimal y;
    int dp;
    rg::RoundingMode rm;
};

template<typename T>
static nlohmann::json findNearest(rg::EvictionRegistry& registry,
                                  const std::filesystem::path& input,
                                  double noData, const rg::GridOptions& options,
                                  const Query& q)
{
    auto grid = rg::loadAsciiGrid<T>(registry, input, static_cast<T>(noData), options);
    const auto nearest = grid->nearestDataCells(q.x, q.y, q.dp, q.rm);

    nlohmann::json out;
    out["x"] = rg::toString(q.x);
    out["y"] = rg::toString(q.y);
    out["distance"] = nearest.distance ? nlohmann::json(rg::toString(*nearest.distance)) : nlohmann::json(nullptr);
    out["cells"] = nlohmann::json::array();
    for (const auto& cell : nearest.cells) {
        out["cells"].push_back({
            {"row", cell.row},
            {"col", cell.col},
            {"x", rg::toString(grid->cellX(cell.col))},
            {"y", rg::toString(grid->cellY(cell.row))},
            {"value", grid->getCell(cell.row, cell.col)},
        });
    }
    return out;
}

int main(int argc, char* argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("input-file", po::value<std::string>(), "ESRI ASCII grid")
        ("x", po::value<std::string>()->required(), "query x coordinate")
        ("y", po::value<std::string>()->required(), "query y coordinate")
        ("dp", po::value<int>()->default_value(10), "decimal places of distances")
        ("rounding", po::value<std::string>()->default_value("half_even"), "rounding mode of distances")
        ("type,t", po::value<std::string>()->default_value("float64"), "cell type: int32, float32 or float64")
        ("no-data", po::value<double>()->default_value(-9999), "no-data value of the grid")
        ("config,c", po::value<std::string>(), "JSON configuration (registry, grid, store)")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error");

    po::positional_options_description p;
    p.add("input-file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);

        if (vm.count("help")) {
            std::cout << "usage: " << argv[0] << " <grid.asc> --x X --y Y [options]\n" << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        std::cerr << "usage: " << argv[0] << " <grid.asc> --x X --y Y [options]\n" << desc << std::endl;
        return EXIT_FAILURE;
    }

    if (!vm.count("input-file")) {
        std::cerr << "Error: No input grid specified." << std::endl;
        return EXIT_FAILURE;
    }

    rg::SetLogLevel(vm["log-level"].as<std::string>());

    const std::filesystem::path input = vm["input-file"].as<std::string>();
    const std::string type = vm["type"].as<std::string>();
    const double noData = vm["no-data"].as<double>();

    try {
        const Query q{rg::parseDecimal(vm["x"].as<std::string>()),
                      rg::parseDecimal(vm["y"].as<std::string>()),
                      vm["dp"].as<int>(),
                      rg::roundingModeFromString(vm["rounding"].as<std::string>())};

        std::optional<std::filesystem::path> configPath;
        if (vm.count("config")) configPath = vm["config"].as<std::string>();
        const auto cfg = rg::ToolConfig::load(configPath);

        rg::EvictionRegistry registry(cfg.registry, rg::makeBlobStore(cfg.store));

        nlohmann::json out;
        if (type == "int32")
            out = findNearest<std::int32_t>(registry, input, noData, cfg.grid, q);
        else if (type == "float32")
            out = findNearest<float>(registry, input, noData, cfg.grid, q);
        else if (type == "float64")
            out = findNearest<double>(registry, input, noData, cfg.grid, q);
        else {
            std::cerr << "Error: unknown cell type " << type << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << out.dump(2) << std::endl;
    } catch (const std::exception& e) {
        rg::Logger()->error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
