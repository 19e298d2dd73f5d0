#include "test.hpp"
#include "fixtures.hpp"

#include "rg/core/util/AsciiGrid.hpp"
#include "rg/core/util/Errors.hpp"

#include <cstdint>
#include <fstream>
#include <string>

using rg::Decimal;
using rg::GridOptions;

namespace {

std::filesystem::path writeFile(const rg_test::TempDir& dir, const std::string& name, const std::string& text)
{
    auto path = dir.path() / name;
    std::ofstream out(path);
    out << text;
    return path;
}

const char* kThreeByThree =
    "ncols 3\n"
    "nrows 3\n"
    "xllcorner 0\n"
    "yllcorner 0\n"
    "cellsize 1\n"
    "NODATA_value -9999\n"
    "1 2 3\n"
    "4 -9999 6\n"
    "7 8 9\n";

GridOptions twoByTwo()
{
    GridOptions o;
    o.chunkRows = 2;
    o.chunkCols = 2;
    return o;
}

} // namespace

TEST(AsciiGrid, ReadsHeader)
{
    rg_test::TempDir dir("ascii");
    auto path = writeFile(dir, "g.asc", kThreeByThree);
    rg::AsciiGridReader reader(path);
    EXPECT_EQ(reader.header().nCols, 3);
    EXPECT_EQ(reader.header().nRows, 3);
    EXPECT_EQ(reader.header().cellSize, Decimal(1));
    ASSERT_TRUE(reader.header().noData.has_value());
    EXPECT_EQ(*reader.header().noData, -9999.0);
    EXPECT_EQ(reader.readValue(), 1.0);
    EXPECT_TRUE(reader.isNoData(-9999.0));
}

TEST(AsciiGrid, FirstFileRowIsTopGridRow)
{
    rg_test::TempDir dir("ascii");
    auto path = writeFile(dir, "g.asc", kThreeByThree);
    rg_test::RegistryFixture fx;
    auto g = rg::loadAsciiGrid<double>(fx.registry, path, -9999.0, twoByTwo());

    EXPECT_EQ(g->getCell(0, 0), 7.0);
    EXPECT_EQ(g->getCell(2, 0), 1.0);
    EXPECT_EQ(g->getCell(2, 2), 3.0);
    EXPECT_EQ(g->getCell(1, 1), -9999.0);
    EXPECT_EQ(g->stats().count(), 8);
    EXPECT_EQ(g->stats().sum(), Decimal(40));
    EXPECT_EQ(*g->stats().min(), 1.0);
    EXPECT_EQ(*g->stats().max(), 9.0);
}

TEST(AsciiGrid, FileNoDataMapsToGridNoData)
{
    rg_test::TempDir dir("ascii");
    auto path = writeFile(dir, "g.asc", kThreeByThree);
    rg_test::RegistryFixture fx;
    auto g = rg::loadAsciiGrid<std::int32_t>(fx.registry, path, -1, twoByTwo());
    EXPECT_EQ(g->getCell(1, 1), -1);
    EXPECT_EQ(g->stats().count(), 8);
}

TEST(AsciiGrid, StaleStatsImport)
{
    rg_test::TempDir dir("ascii");
    auto path = writeFile(dir, "g.asc", kThreeByThree);
    rg_test::RegistryFixture fx;
    GridOptions o = twoByTwo();
    o.stats = rg::StatsMode::Stale;
    auto g = rg::loadAsciiGrid<float>(fx.registry, path, -9999.0f, o);
    EXPECT_FALSE(g->stats().upToDate());
    EXPECT_EQ(g->stats().count(), 8);
    EXPECT_EQ(g->stats().sum(), Decimal(40));
}

TEST(AsciiGrid, CenterOriginAndCaseInsensitiveKeys)
{
    rg_test::TempDir dir("ascii");
    auto path = writeFile(dir, "c.asc",
                          "NCOLS 2\nNROWS 1\nXLLCENTER 10.5\nYLLCENTER 20.5\nCELLSIZE 1\n"
                          "5 6\n");
    rg_test::RegistryFixture fx;
    auto g = rg::loadAsciiGrid<double>(fx.registry, path, -9999.0);
    EXPECT_EQ(g->dimensions().xMin, Decimal(10));
    EXPECT_EQ(g->dimensions().yMin, Decimal(20));
    EXPECT_EQ(g->getCell(Decimal("11.5"), Decimal("20.5")), 6.0);
}

TEST(AsciiGrid, MalformedFilesAreRejected)
{
    rg_test::TempDir dir("ascii");
    rg_test::RegistryFixture fx;

    auto missing = writeFile(dir, "m.asc", "ncols 2\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2\n");
    EXPECT_THROW(rg::loadAsciiGrid<double>(fx.registry, missing, -9999.0), rg::ConfigError);

    auto unknown = writeFile(dir, "u.asc", "ncols 1\nnrows 1\nxllcorner 0\nyllcorner 0\ncellsize 1\ncolour red\n1\n");
    EXPECT_THROW(rg::loadAsciiGrid<double>(fx.registry, unknown, -9999.0), rg::ConfigError);

    auto shortBody = writeFile(dir, "s.asc", "ncols 2\nnrows 2\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2 3\n");
    EXPECT_THROW(rg::loadAsciiGrid<double>(fx.registry, shortBody, -9999.0), rg::IOError);

    auto badValue = writeFile(dir, "b.asc", "ncols 2\nnrows 1\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 x\n");
    EXPECT_THROW(rg::loadAsciiGrid<double>(fx.registry, badValue, -9999.0), rg::IOError);

    EXPECT_THROW(rg::loadAsciiGrid<double>(fx.registry, dir.path() / "absent.asc", -9999.0), rg::IOError);
    EXPECT_EQ(fx.registry.gridCount(), 0u);
}

TEST(AsciiGrid, ExportReimportsEqual)
{
    rg_test::TempDir dir("ascii");
    auto path = writeFile(dir, "g.asc", kThreeByThree);
    rg_test::RegistryFixture fx;
    auto g = rg::loadAsciiGrid<double>(fx.registry, path, -9999.0, twoByTwo());
    g->setCell(1, 1, 2.5);

    auto out = dir.path() / "out.asc";
    rg::writeAsciiGrid(*g, out);
    auto back = rg::loadAsciiGrid<double>(fx.registry, out, -9999.0);
    EXPECT_TRUE(g->equalsByDimensionsAndValues(*back));
    EXPECT_EQ(back->getCell(1, 1), 2.5);
}
