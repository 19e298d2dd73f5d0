#include "rg/core/types/BlobStore.hpp"
#include "rg/core/types/Grid.hpp"
#include "rg/core/util/AsciiGrid.hpp"
#include "rg/core/util/EvictionRegistry.hpp"
#include "rg/core/util/Logging.hpp"
#include "rg/core/util/ToolConfig.hpp"

#include <boost/program_options.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace po = boost::program_options;

struct Window {
    std::int64_t startRow, startCol, endRow, endCol;
};

template<typename T>
static void cutWindow(rg::EvictionRegistry& registry,
                      const std::filesystem::path& input, const std::filesystem::path& output,
                      double noData, const rg::GridOptions& options, const Window& w)
{
    auto src = rg::loadAsciiGrid<T>(registry, input, static_cast<T>(noData), options);
    auto dst = rg::Grid<T>::copyWindow(registry, *src, w.startRow, w.startCol, w.endRow, w.endCol,
                                       static_cast<T>(noData), options);
    rg::writeAsciiGrid(*dst, output);
    rg::Logger()->info("wrote {}x{} window to {}", dst->nRows(), dst->nCols(), output.string());
}

int main(int argc, char* argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("input-file", po::value<std::string>(), "ESRI ASCII grid")
        ("output-file", po::value<std::string>(), "ESRI ASCII grid to write")
        ("start-row", po::value<std::int64_t>()->required(), "first row (0 is the bottom row)")
        ("start-col", po::value<std::int64_t>()->required(), "first column")
        ("end-row", po::value<std::int64_t>()->required(), "last row, inclusive")
        ("end-col", po::value<std::int64_t>()->required(), "last column, inclusive")
        ("type,t", po::value<std::string>()->default_value("float64"), "cell type: int32, float32 or float64")
        ("no-data", po::value<double>()->default_value(-9999), "no-data value of both grids")
        ("config,c", po::value<std::string>(), "JSON configuration (registry, grid, store)")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error");

    po::positional_options_description p;
    p.add("input-file", 1);
    p.add("output-file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);

        if (vm.count("help")) {
            std::cout << "usage: " << argv[0] << " <in.asc> <out.asc> --start-row R0 --start-col C0 --end-row R1 --end-col C1\n"
                      << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        std::cerr << "usage: " << argv[0] << " <in.asc> <out.asc> --start-row R0 --start-col C0 --end-row R1 --end-col C1\n"
                  << desc << std::endl;
        return EXIT_FAILURE;
    }

    if (!vm.count("input-file") || !vm.count("output-file")) {
        std::cerr << "Error: input and output grids are required." << std::endl;
        return EXIT_FAILURE;
    }

    rg::SetLogLevel(vm["log-level"].as<std::string>());

    const std::filesystem::path input = vm["input-file"].as<std::string>();
    const std::filesystem::path output = vm["output-file"].as<std::string>();
    const std::string type = vm["type"].as<std::string>();
    const double noData = vm["no-data"].as<double>();
    const Window w{vm["start-row"].as<std::int64_t>(), vm["start-col"].as<std::int64_t>(),
                   vm["end-row"].as<std::int64_t>(), vm["end-col"].as<std::int64_t>()};

    try {
        std::optional<std::filesystem::path> configPath;
        if (vm.count("config")) configPath = vm["config"].as<std::string>();
        const auto cfg = rg::ToolConfig::load(configPath);

        rg::EvictionRegistry registry(cfg.registry, rg::makeBlobStore(cfg.store));

        if (type == "int32")
            cutWindow<std::int32_t>(registry, input, output, noData, cfg.grid, w);
        else if (type == "float32")
            cutWindow<float>(registry, input, output, noData, cfg.grid, w);
        else if (type == "float64")
            cutWindow<double>(registry, input, output, noData, cfg.grid, w);
        else {
            std::cerr << "Error: unknown cell type " << type << std::endl;
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        rg::Logger()->error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
