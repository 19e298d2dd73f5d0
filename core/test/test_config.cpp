#include "test.hpp"
#include "fixtures.hpp"

#include "rg/core/types/GridOptions.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/EvictionRegistry.hpp"
#include "rg/core/util/LoadJson.hpp"
#include "rg/core/util/Logging.hpp"
#include "rg/core/util/ToolConfig.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <string>

using nlohmann::json;

// --- helpers ---------------------------------------------------------------------

TEST(LoadJson, FieldHelpers)
{
    const json j = json::parse(R"({"a": 3, "b": "x", "c": 1.5, "d": {"e": 1}, "f": [1]})");
    EXPECT_EQ(rg::json::integer_or(&j, "a", 0), 3);
    EXPECT_EQ(rg::json::integer_or(&j, "missing", 9), 9);
    EXPECT_THROW(rg::json::integer_or(&j, "b", 0), rg::ConfigError);
    EXPECT_EQ(rg::json::string_or(&j, "b", "y"), "x");
    EXPECT_FLOAT_EQ(rg::json::number_or(&j, "c", 0.0), 1.5);
    EXPECT_TRUE(rg::json::object_or_null(&j, "d") != nullptr);
    EXPECT_TRUE(rg::json::object_or_null(&j, "missing") == nullptr);
    EXPECT_THROW(rg::json::object_or_null(&j, "f"), rg::ConfigError);
    EXPECT_THROW(rg::json::require_fields(j, {"a", "zz"}, "test"), rg::ConfigError);
    EXPECT_NO_THROW(rg::json::require_fields(j, {"a", "b"}, "test"));
}

TEST(LoadJson, FileErrors)
{
    rg_test::TempDir dir("cfg");
    EXPECT_THROW(rg::json::load_json_file(dir.path() / "nope.json"), rg::ConfigError);
    const auto bad = dir.path() / "bad.json";
    {
        std::ofstream out(bad);
        out << "{ not json";
    }
    EXPECT_THROW(rg::json::load_json_file(bad), rg::ConfigError);
}

// --- sections --------------------------------------------------------------------

TEST(RegistryConfig, DefaultsAndOverrides)
{
    const auto d = rg::RegistryConfig::fromJson(nullptr);
    EXPECT_EQ(d.memoryThreshold, 10'000'000u);
    EXPECT_FALSE(d.memoryBudget.has_value());
    EXPECT_EQ(d.maxAllocRetries, 1);

    const json j = json::parse(R"({"memory_threshold": 64, "memory_budget": 4096, "reserve_bytes": 8, "max_alloc_retries": 3})");
    const auto c = rg::RegistryConfig::fromJson(&j);
    EXPECT_EQ(c.memoryThreshold, 64u);
    EXPECT_EQ(*c.memoryBudget, 4096u);
    EXPECT_EQ(c.reserveBytes, 8u);
    EXPECT_EQ(c.maxAllocRetries, 3);

    const json neg = json::parse(R"({"memory_threshold": -1})");
    EXPECT_THROW(rg::RegistryConfig::fromJson(&neg), rg::ConfigError);
}

TEST(GridOptions, DefaultsAndOverrides)
{
    const auto d = rg::GridOptions::fromJson(nullptr);
    EXPECT_EQ(d.chunkRows, 512);
    EXPECT_TRUE(d.promotion == rg::ChunkEncoding::Dense);
    EXPECT_TRUE(d.stats == rg::StatsMode::Updated);

    const json j = json::parse(R"({"chunk_rows": 16, "chunk_cols": 8, "promotion": "sparse", "stats": "stale"})");
    const auto o = rg::GridOptions::fromJson(&j);
    EXPECT_EQ(o.chunkRows, 16);
    EXPECT_EQ(o.chunkCols, 8);
    EXPECT_TRUE(o.promotion == rg::ChunkEncoding::Sparse);
    EXPECT_TRUE(o.stats == rg::StatsMode::Stale);

    for (const char* bad : {R"({"chunk_rows": 0})", R"({"promotion": "uniform"})", R"({"stats": "lazy"})",
                            R"({"chunk_rows": 100000, "chunk_cols": 100000})"}) {
        const json b = json::parse(bad);
        EXPECT_THROW(rg::GridOptions::fromJson(&b), rg::ConfigError);
    }
}

TEST(ToolConfig, LoadsAllSections)
{
    rg_test::TempDir dir("cfg");
    const auto path = dir.path() / "tool.json";
    {
        std::ofstream out(path);
        out << R"({
            "registry": {"memory_budget": 1048576, "memory_threshold": 0},
            "grid": {"chunk_rows": 32, "chunk_cols": 32},
            "store": {"type": "memory"}
        })";
    }
    const auto cfg = rg::ToolConfig::load(path);
    EXPECT_EQ(*cfg.registry.memoryBudget, 1048576u);
    EXPECT_EQ(cfg.grid.chunkRows, 32);
    EXPECT_EQ(cfg.store["type"].get<std::string>(), "memory");

    const auto defaults = rg::ToolConfig::load(std::nullopt);
    EXPECT_TRUE(defaults.store.is_null());
    EXPECT_THROW(rg::ToolConfig::fromJson(json::array()), rg::ConfigError);
    EXPECT_THROW(rg::ToolConfig::fromJson(json::parse(R"({"grid": 3})")), rg::ConfigError);
}

// --- logging ---------------------------------------------------------------------

TEST(Logging, LevelFilterAndFileSink)
{
    rg_test::TempDir dir("log");
    const auto path = dir.path() / "rg.log";
    rg::AddLogFile(path);
    rg::SetLogLevel("warn");
    rg::Logger()->info("hidden {}", 1);
    rg::Logger()->warn("shown {} of {}", 2, "three");
    rg::SetLogLevel("info");

    std::ifstream in(path);
    std::string all((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(all.find("hidden"), std::string::npos);
    EXPECT_NE(all.find("shown 2 of three"), std::string::npos);
}
