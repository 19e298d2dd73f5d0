#include "rg/core/types/BlobStore.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace rg {

// ============ MemoryBlobStore ============

void MemoryBlobStore::save(GridId grid, const ChunkID& id, const Blob& blob)
{
    _blobs[grid][id] = blob;
}

Blob MemoryBlobStore::load(GridId grid, const ChunkID& id) const
{
    auto g = _blobs.find(grid);
    if (g != _blobs.end()) {
        auto c = g->second.find(id);
        if (c != g->second.end())
            return c->second;
    }
    throw IOError("no stored blob for grid " + std::to_string(grid) + " chunk " + id.str());
}

bool MemoryBlobStore::exists(GridId grid, const ChunkID& id) const
{
    auto g = _blobs.find(grid);
    return g != _blobs.end() && g->second.contains(id);
}

void MemoryBlobStore::remove(GridId grid)
{
    _blobs.erase(grid);
}

std::size_t MemoryBlobStore::blobCount() const
{
    std::size_t n = 0;
    for (const auto& [grid, chunks] : _blobs)
        n += chunks.size();
    return n;
}

// ============ FileBlobStore ============

namespace {

constexpr uint32_t FILEBLOB_MAGIC = 0x5247424C; // "RGBL"
constexpr uint32_t FILEBLOB_VERSION = 1;
constexpr std::size_t FILEBLOB_HEADER = 16;

void put_u32(char* p, uint32_t v)
{
    uint32_t n = htonl(v);
    std::memcpy(p, &n, sizeof(n));
}

uint32_t get_u32(const char* p)
{
    uint32_t n;
    std::memcpy(&n, p, sizeof(n));
    return ntohl(n);
}

} // namespace

FileBlobStore::FileBlobStore(std::filesystem::path root, CodecPipeline codecs)
    : _root(std::move(root)), _codecs(std::move(codecs))
{
    std::error_code ec;
    std::filesystem::create_directories(_root, ec);
    if (ec) {
        throw IOError("cannot create blob store directory " + _root.string() + ": " + ec.message());
    }
}

std::filesystem::path FileBlobStore::gridDir(GridId grid) const
{
    return _root / ("grid_" + std::to_string(grid));
}

std::filesystem::path FileBlobStore::chunkPath(GridId grid, const ChunkID& id) const
{
    return gridDir(grid) / (std::to_string(id.row) + "_" + std::to_string(id.col) + ".chunk");
}

void FileBlobStore::save(GridId grid, const ChunkID& id, const Blob& blob)
{
    const auto dir = gridDir(grid);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw IOError("cannot create " + dir.string() + ": " + ec.message());
    }

    const std::vector<uint8_t> encoded = _codecs.encode(blob);

    char header[FILEBLOB_HEADER];
    const uint64_t rawLen = blob.size();
    put_u32(header, FILEBLOB_MAGIC);
    put_u32(header + 4, FILEBLOB_VERSION);
    put_u32(header + 8, static_cast<uint32_t>(rawLen >> 32));
    put_u32(header + 12, static_cast<uint32_t>(rawLen & 0xFFFFFFFFu));

    const auto path = chunkPath(grid, id);
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IOError("cannot open " + tmp.string() + " for writing");
        }
        file.write(header, sizeof(header));
        file.write(reinterpret_cast<const char*>(encoded.data()),
                   static_cast<std::streamsize>(encoded.size()));
        file.flush();
        if (!file) {
            throw IOError("write failed: " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        throw IOError("cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message());
    }
}

Blob FileBlobStore::load(GridId grid, const ChunkID& id) const
{
    const auto path = chunkPath(grid, id);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("no stored blob at " + path.string());
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("read failed: " + path.string());
    }

    if (bytes.size() < FILEBLOB_HEADER) {
        throw CorruptChunkError("blob file too short: " + path.string());
    }
    if (get_u32(bytes.data()) != FILEBLOB_MAGIC) {
        throw CorruptChunkError("blob file magic mismatch: " + path.string());
    }
    const uint32_t version = get_u32(bytes.data() + 4);
    if (version > FILEBLOB_VERSION) {
        throw CorruptChunkError("blob file version " + std::to_string(version) +
                                " is newer than supported version " + std::to_string(FILEBLOB_VERSION));
    }
    const uint64_t rawLen = (uint64_t(get_u32(bytes.data() + 8)) << 32) | get_u32(bytes.data() + 12);

    std::vector<uint8_t> encoded(bytes.begin() + FILEBLOB_HEADER, bytes.end());
    return _codecs.decode(encoded, static_cast<std::size_t>(rawLen));
}

bool FileBlobStore::exists(GridId grid, const ChunkID& id) const
{
    std::error_code ec;
    return std::filesystem::exists(chunkPath(grid, id), ec);
}

void FileBlobStore::remove(GridId grid)
{
    std::error_code ec;
    std::filesystem::remove_all(gridDir(grid), ec);
    if (ec) {
        throw IOError("cannot remove " + gridDir(grid).string() + ": " + ec.message());
    }
}

// ============ factory ============

std::unique_ptr<BlobStore> makeBlobStore(const nlohmann::json& config)
{
    if (config.is_null()) {
        return std::make_unique<MemoryBlobStore>();
    }
    if (!config.is_object()) {
        throw ConfigError("store config must be an object");
    }
    const std::string type = json::string_or(&config, "type", "memory");
    if (type == "memory") {
        return std::make_unique<MemoryBlobStore>();
    }
    if (type == "file") {
        json::require_fields(config, {"path"}, "store");
        if (!config["path"].is_string()) {
            throw ConfigError("store 'path' must be a string");
        }
        auto codecs = CodecPipeline::fromJson(config.contains("codecs") ? config["codecs"] : nlohmann::json());
        return std::make_unique<FileBlobStore>(config["path"].get<std::string>(), std::move(codecs));
    }
    throw ConfigError("unknown store type: " + type);
}

} // namespace rg
