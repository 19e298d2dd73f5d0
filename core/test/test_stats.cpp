#include "test.hpp"
#include "fixtures.hpp"

#include "rg/core/types/Grid.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <utility>

using rg::Decimal;
using rg::Dimensions;
using rg::Grid;
using rg::GridOptions;
using rg::RoundingMode;
using rg::StatsMode;

namespace {

GridOptions smallChunks(StatsMode mode = StatsMode::Updated)
{
    GridOptions o;
    o.chunkRows = 2;
    o.chunkCols = 2;
    o.stats = mode;
    return o;
}

} // namespace

TEST(GridStats, EmptyGridHasNoAggregates)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<double>::create(fx.registry, 4, 4, Dimensions{}, -9999.0, smallChunks());
    EXPECT_EQ(g->stats().count(), 0);
    EXPECT_EQ(g->stats().sum(), Decimal(0));
    EXPECT_FALSE(g->stats().min().has_value());
    EXPECT_FALSE(g->stats().max().has_value());
    EXPECT_FALSE(g->stats().mean(4, RoundingMode::HalfEven).has_value());
}

TEST(GridStats, SetThenClearSingleCell)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<double>::create(fx.registry, 4, 4, Dimensions{}, -9999.0, smallChunks());

    g->setCell(0, 0, 5.0);
    EXPECT_EQ(g->stats().count(), 1);
    EXPECT_EQ(g->stats().sum(), Decimal(5));
    EXPECT_EQ(*g->stats().min(), 5.0);
    EXPECT_EQ(*g->stats().max(), 5.0);

    g->setCell(0, 0, -9999.0);
    EXPECT_EQ(g->stats().count(), 0);
    EXPECT_EQ(g->stats().sum(), Decimal(0));
    EXPECT_FALSE(g->stats().min().has_value());
    EXPECT_FALSE(g->stats().max().has_value());
}

TEST(GridStats, OverwriteTracksExtremes)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<std::int32_t>::create(fx.registry, 4, 4, Dimensions{}, -1, smallChunks());
    g->setCell(0, 0, 3);
    g->setCell(1, 1, 10);
    g->setCell(3, 3, 1);
    EXPECT_EQ(*g->stats().min(), 1);
    EXPECT_EQ(*g->stats().max(), 10);

    // The only maximum goes away; the next read rescans
    g->setCell(1, 1, 4);
    EXPECT_EQ(*g->stats().max(), 4);
    EXPECT_EQ(g->stats().nMax(), 1);

    g->setCell(2, 2, 1);
    EXPECT_EQ(g->stats().nMin(), 2);
    g->setCell(3, 3, 2);
    EXPECT_EQ(*g->stats().min(), 1);
    EXPECT_EQ(g->stats().nMin(), 1);

    EXPECT_EQ(g->stats().count(), 4);
    EXPECT_EQ(g->stats().sum(), Decimal(3 + 4 + 1 + 2));
}

TEST(GridStats, MeanIsRounded)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<std::int32_t>::create(fx.registry, 2, 2, Dimensions{}, -1, smallChunks());
    g->setCell(0, 0, 1);
    g->setCell(0, 1, 1);
    g->setCell(1, 0, 2);
    // 4 / 3 = 1.333...
    EXPECT_EQ(*g->stats().mean(2, RoundingMode::HalfEven), Decimal("1.33"));
    EXPECT_EQ(*g->stats().mean(2, RoundingMode::Ceiling), Decimal("1.34"));
}

TEST(GridStats, StaleModeRescansOnRead)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<double>::create(fx.registry, 4, 4, Dimensions{}, -9999.0, smallChunks(StatsMode::Stale));
    g->setCell(0, 0, 2.0);
    g->setCell(3, 3, 6.0);
    EXPECT_FALSE(g->stats().upToDate());
    EXPECT_EQ(g->stats().count(), 2);
    EXPECT_TRUE(g->stats().upToDate());
    EXPECT_EQ(g->stats().sum(), Decimal(8));
    g->setCell(3, 3, -9999.0);
    EXPECT_EQ(*g->stats().max(), 2.0);
}

TEST(GridStats, SkippedInitCellMarksStale)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<double>::create(fx.registry, 4, 4, Dimensions{}, -9999.0, smallChunks());
    g->initCell(1, 2, 7.5, true);
    EXPECT_FALSE(g->stats().upToDate());
    EXPECT_EQ(g->stats().count(), 1);
    EXPECT_EQ(*g->stats().min(), 7.5);
}

TEST(GridStats, VanishedMaximumReplacedByLargerWrite)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<std::int32_t>::create(fx.registry, 4, 4, Dimensions{}, -1, smallChunks());
    g->setCell(0, 0, 3);
    g->setCell(1, 1, 10);
    g->setCell(1, 1, 12);
    EXPECT_EQ(*g->stats().max(), 12);
    EXPECT_EQ(g->stats().nMax(), 1);

    g->setCell(2, 2, 0);
    g->setCell(2, 2, -5);
    EXPECT_EQ(*g->stats().min(), -5);
    EXPECT_EQ(g->stats().nMin(), 1);

    // Same value as the vanished extremum
    g->setCell(2, 2, 7);
    g->setCell(3, 3, -5);
    EXPECT_EQ(*g->stats().min(), -5);
    EXPECT_EQ(g->stats().nMin(), 1);
    EXPECT_EQ(g->stats().count(), 4);
}

namespace {

template<typename T>
void checkRandomWrites(unsigned seed)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<T>::create(fx.registry, 9, 7, Dimensions{}, T(-1), smallChunks());

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> row(0, 8), col(0, 6), val(-1, 20);
    std::map<std::pair<int, int>, int> expected;
    for (int i = 0; i < 500; ++i) {
        const int r = row(rng), c = col(rng), v = val(rng);
        g->setCell(r, c, T(v));
        if (v == -1)
            expected.erase({r, c});
        else
            expected[{r, c}] = v;

        if (i % 50 != 49)
            continue;

        std::int64_t sum = 0;
        std::map<int, std::int64_t> histogram;
        for (const auto& [k, x] : expected) {
            sum += x;
            ++histogram[x];
        }
        EXPECT_EQ(g->stats().count(), static_cast<std::int64_t>(expected.size()));
        EXPECT_EQ(g->stats().sum(), Decimal(sum));
        if (histogram.empty()) {
            EXPECT_FALSE(g->stats().min().has_value());
            EXPECT_FALSE(g->stats().max().has_value());
            continue;
        }
        EXPECT_TRUE(g->stats().min() == std::optional<T>(T(histogram.begin()->first)));
        EXPECT_TRUE(g->stats().max() == std::optional<T>(T(histogram.rbegin()->first)));
        EXPECT_EQ(g->stats().nMin(), histogram.begin()->second);
        EXPECT_EQ(g->stats().nMax(), histogram.rbegin()->second);
    }

    const auto count = g->stats().count();
    const auto sum = g->stats().sum();
    const auto mn = g->stats().min();
    const auto mx = g->stats().max();
    const auto nMin = g->stats().nMin();
    const auto nMax = g->stats().nMax();

    g->stats().update();
    EXPECT_EQ(g->stats().count(), count);
    EXPECT_EQ(g->stats().sum(), sum);
    EXPECT_TRUE(g->stats().min() == mn);
    EXPECT_TRUE(g->stats().max() == mx);
    EXPECT_EQ(g->stats().nMin(), nMin);
    EXPECT_EQ(g->stats().nMax(), nMax);
}

} // namespace

TEST(GridStats, RandomWritesMatchModelInt32)
{
    checkRandomWrites<std::int32_t>(1234);
}

TEST(GridStats, RandomWritesMatchModelDouble)
{
    checkRandomWrites<double>(4321);
}

TEST(GridStats, JsonReport)
{
    rg_test::RegistryFixture fx;
    auto g = Grid<double>::create(fx.registry, 2, 2, Dimensions{}, -9999.0, smallChunks());
    g->setCell(0, 0, 1.5);
    g->setCell(1, 1, 2.5);
    auto j = g->stats().toJson();
    EXPECT_EQ(j["count"].get<std::int64_t>(), 2);
    EXPECT_EQ(j["sum"].get<std::string>(), "4");
    EXPECT_EQ(j["min"].get<double>(), 1.5);
    EXPECT_EQ(j["max"].get<double>(), 2.5);
    EXPECT_EQ(j["mean"].get<std::string>(), "2");
    EXPECT_EQ(j["mode"].get<std::string>(), "updated");
}
