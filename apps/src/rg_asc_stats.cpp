#include "rg/core/types/BlobStore.hpp"
#include "rg/core/types/Grid.hpp"
#include "rg/core/util/AsciiGrid.hpp"
#include "rg/core/util/Errors.hpp"
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

template<typename T>
static nlohmann::json importAndSummarize(rg::EvictionRegistry& registry,
                                         const std::filesystem::path& input,
                                         double noData, const rg::GridOptions& options)
{
    auto grid = rg::loadAsciiGrid<T>(registry, input, static_cast<T>(noData), options);
    nlohmann::json out = grid->stats().toJson();
    out["n_rows"] = grid->nRows();
    out["n_cols"] = grid->nCols();
    out["cell_type"] = rg::CellType<T>::name;
    return out;
}

int main(int argc, char* argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("input-file", po::value<std::string>(), "ESRI ASCII grid")
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
            std::cout << "usage: " << argv[0] << " <grid.asc> [options]\n" << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        std::cerr << "usage: " << argv[0] << " <grid.asc> [options]\n" << desc << std::endl;
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
        std::optional<std::filesystem::path> configPath;
        if (vm.count("config")) configPath = vm["config"].as<std::string>();
        const auto cfg = rg::ToolConfig::load(configPath);

        rg::EvictionRegistry registry(cfg.registry, rg::makeBlobStore(cfg.store));

        nlohmann::json out;
        if (type == "int32")
            out = importAndSummarize<std::int32_t>(registry, input, noData, cfg.grid);
        else if (type == "float32")
            out = importAndSummarize<float>(registry, input, noData, cfg.grid);
        else if (type == "float64")
            out = importAndSummarize<double>(registry, input, noData, cfg.grid);
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
