#include "test.hpp"
#include "fixtures.hpp"

#include "rg/core/types/BlobStore.hpp"
#include "rg/core/types/Grid.hpp"
#include "rg/core/util/BlobCodecs.hpp"
#include "rg/core/util/Errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>

using rg::Blob;
using rg::ChunkID;
using rg::CodecPipeline;

namespace {

Blob sampleBlob(std::size_t n)
{
    Blob b(n);
    for (std::size_t i = 0; i < n; ++i)
        b[i] = static_cast<std::uint8_t>((i * 7) % 13);
    return b;
}

} // namespace

// --- codecs ----------------------------------------------------------------------

TEST(BlobCodecs, PipelineRestoresInput)
{
    const Blob raw = sampleBlob(5000);
    for (const char* codecs : {R"([])", R"([{"name": "gzip"}])", R"([{"name": "zstd", "configuration": {"level": 5}}])",
                             R"([{"name": "zstd"}, {"name": "crc32c"}])", R"([{"name": "gzip"}, {"name": "crc32c"}])"}) {
        auto pipeline = CodecPipeline::fromJson(nlohmann::json::parse(codecs));
        auto stored = pipeline.encode(raw);
        EXPECT_TRUE(pipeline.decode(stored, raw.size()) == raw);
    }
}

TEST(BlobCodecs, CompressionShrinksRepetitiveData)
{
    const Blob raw = sampleBlob(64 * 1024);
    auto zstd = CodecPipeline::fromJson(nlohmann::json::parse(R"([{"name": "zstd"}])"));
    auto gzip = CodecPipeline::fromJson(nlohmann::json::parse(R"([{"name": "gzip"}])"));
    EXPECT_LT(zstd.encode(raw).size(), raw.size() / 4);
    EXPECT_LT(gzip.encode(raw).size(), raw.size() / 4);
}

TEST(BlobCodecs, ChecksumDetectsCorruption)
{
    const Blob raw = sampleBlob(100);
    auto pipeline = CodecPipeline::fromJson(nlohmann::json::parse(R"([{"name": "crc32c"}])"));
    auto stored = pipeline.encode(raw);
    EXPECT_EQ(stored.size(), raw.size() + 4);
    stored[10] ^= 0x01;
    EXPECT_THROW(pipeline.decode(stored, raw.size()), rg::CorruptChunkError);
}

TEST(BlobCodecs, WrongRawLengthIsCorrupt)
{
    const Blob raw = sampleBlob(100);
    CodecPipeline none;
    EXPECT_THROW(none.decode(raw, 99), rg::CorruptChunkError);
}

TEST(BlobCodecs, ConfigRoundTripAndErrors)
{
    auto pipeline = CodecPipeline::fromJson(nlohmann::json::parse(R"([{"name": "gzip", "configuration": {"level": 9}}])"));
    auto j = pipeline.toJson();
    EXPECT_EQ(j[0]["name"].get<std::string>(), "gzip");
    EXPECT_EQ(j[0]["configuration"]["level"].get<int>(), 9);

    EXPECT_THROW(CodecPipeline::fromJson(nlohmann::json::parse(R"([{"name": "lz4"}])")), rg::ConfigError);
    EXPECT_THROW(CodecPipeline::fromJson(nlohmann::json::parse(R"({"name": "gzip"})")), rg::ConfigError);
}

// --- stores ----------------------------------------------------------------------

TEST(MemoryBlobStore, SaveLoadRemove)
{
    rg::MemoryBlobStore store;
    store.save(1, {0, 0}, {1, 2, 3});
    store.save(1, {0, 1}, {4});
    store.save(2, {0, 0}, {5});
    EXPECT_TRUE(store.exists(1, {0, 1}));
    EXPECT_TRUE(store.load(1, {0, 0}) == (Blob{1, 2, 3}));
    EXPECT_EQ(store.blobCount(), 3u);

    store.remove(1);
    EXPECT_FALSE(store.exists(1, {0, 0}));
    EXPECT_EQ(store.blobCount(), 1u);
    EXPECT_THROW(store.load(1, {0, 0}), rg::IOError);
    store.remove(42);
}

TEST(FileBlobStore, SaveLoadRemove)
{
    rg_test::TempDir dir("blobs");
    rg::FileBlobStore store(dir.path(), CodecPipeline::fromJson(nlohmann::json::parse(R"([{"name": "zstd"}, {"name": "crc32c"}])")));
    const Blob raw = sampleBlob(3000);
    store.save(7, {2, 3}, raw);
    EXPECT_TRUE(store.exists(7, {2, 3}));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "grid_7" / "2_3.chunk"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "grid_7" / "2_3.chunk.tmp"));
    EXPECT_TRUE(store.load(7, {2, 3}) == raw);

    // Overwrite in place
    const Blob other = sampleBlob(10);
    store.save(7, {2, 3}, other);
    EXPECT_TRUE(store.load(7, {2, 3}) == other);

    store.remove(7);
    EXPECT_FALSE(store.exists(7, {2, 3}));
    EXPECT_THROW(store.load(7, {2, 3}), rg::IOError);
}

TEST(FileBlobStore, DamagedFilesAreCorrupt)
{
    rg_test::TempDir dir("blobs");
    rg::FileBlobStore store(dir.path(), CodecPipeline{});
    store.save(1, {0, 0}, sampleBlob(64));
    const auto path = dir.path() / "grid_1" / "0_0.chunk";

    {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f << "RG";
    }
    EXPECT_THROW(store.load(1, {0, 0}), rg::CorruptChunkError);

    {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f << "not a blob file at all";
    }
    EXPECT_THROW(store.load(1, {0, 0}), rg::CorruptChunkError);
}

TEST(FileBlobStore, DamagedLengthFieldIsCorrupt)
{
    rg_test::TempDir dir("blobs");
    for (const char* codecs : {R"([])", R"([{"name": "zstd"}, {"name": "crc32c"}])",
                               R"([{"name": "gzip"}, {"name": "crc32c"}])", R"([{"name": "zstd"}])"}) {
        rg::FileBlobStore store(dir.path(), CodecPipeline::fromJson(nlohmann::json::parse(codecs)));
        store.save(3, {1, 1}, sampleBlob(2000));
        const auto path = dir.path() / "grid_3" / "1_1.chunk";

        // Bytes 8..15 hold the decoded length, outside any checksum
        for (const std::uint64_t bad : {~std::uint64_t(0), std::uint64_t(1) << 40, std::uint64_t(1999)}) {
            {
                std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
                f.seekp(8);
                for (int shift = 56; shift >= 0; shift -= 8)
                    f.put(static_cast<char>((bad >> shift) & 0xFF));
            }
            EXPECT_THROW(store.load(3, {1, 1}), rg::CorruptChunkError);
        }
        store.remove(3);
    }
}

TEST(FileBlobStore, GridEvictsThroughFiles)
{
    rg_test::TempDir dir("blobs");
    auto cfg = nlohmann::json{{"type", "file"},
                              {"path", dir.path().string()},
                              {"codecs", nlohmann::json::parse(R"([{"name": "gzip"}, {"name": "crc32c"}])")}};
    rg::RegistryConfig rc;
    rc.memoryBudget = std::size_t(1) << 30;
    rg::EvictionRegistry registry(rc, rg::makeBlobStore(cfg));

    rg::GridOptions o;
    o.chunkRows = 4;
    o.chunkCols = 4;
    auto g = rg::Grid<float>::create(registry, 8, 8, rg::Dimensions{}, -1.0f, o);
    for (int r = 0; r < 8; ++r)
        g->setCell(r, r, float(r) + 0.5f);
    EXPECT_EQ(registry.evictAll(), 2u);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / ("grid_" + std::to_string(g->gridId())) / "1_1.chunk"));
    EXPECT_EQ(g->getCell(5, 5), 5.5f);
    EXPECT_EQ(g->getCell(0, 0), 0.5f);
}

TEST(BlobStoreFactory, Selection)
{
    EXPECT_TRUE(dynamic_cast<rg::MemoryBlobStore*>(rg::makeBlobStore(nullptr).get()) != nullptr);
    EXPECT_TRUE(dynamic_cast<rg::MemoryBlobStore*>(rg::makeBlobStore({{"type", "memory"}}).get()) != nullptr);
    EXPECT_THROW(rg::makeBlobStore({{"type", "file"}}), rg::ConfigError);
    EXPECT_THROW(rg::makeBlobStore({{"type", "s3"}}), rg::ConfigError);
    EXPECT_THROW(rg::makeBlobStore(nlohmann::json(3)), rg::ConfigError);
}
