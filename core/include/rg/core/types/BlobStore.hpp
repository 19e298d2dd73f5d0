#pragma once

#include "rg/core/types/ChunkID.hpp"
#include "rg/core/util/BlobCodecs.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <vector>

namespace rg {

using GridId = std::uint64_t;
using Blob = std::vector<std::uint8_t>;

/**
 * @brief Secondary storage for evicted chunks, keyed by (grid, chunk).
 *
 * The blob contents are opaque to the store. load() of a key that was never
 * saved throws IOError.
 */
class BlobStore
{
public:
    virtual ~BlobStore() = default;

    virtual void save(GridId grid, const ChunkID& id, const Blob& blob) = 0;
    virtual Blob load(GridId grid, const ChunkID& id) const = 0;
    virtual bool exists(GridId grid, const ChunkID& id) const = 0;
    // Drop every blob of a grid. Unknown grids are a no-op.
    virtual void remove(GridId grid) = 0;
};

class MemoryBlobStore : public BlobStore
{
public:
    void save(GridId grid, const ChunkID& id, const Blob& blob) override;
    Blob load(GridId grid, const ChunkID& id) const override;
    bool exists(GridId grid, const ChunkID& id) const override;
    void remove(GridId grid) override;

    [[nodiscard]] std::size_t blobCount() const;

private:
    std::map<GridId, std::map<ChunkID, Blob>> _blobs;
};

/**
 * @brief One directory per grid, one file per chunk.
 *
 * Files are written to a temporary name and renamed into place. The chunk
 * bytes pass through the configured codec pipeline and are prefixed with a
 * small header carrying the raw length.
 */
class FileBlobStore : public BlobStore
{
public:
    FileBlobStore(std::filesystem::path root, CodecPipeline codecs);

    void save(GridId grid, const ChunkID& id, const Blob& blob) override;
    Blob load(GridId grid, const ChunkID& id) const override;
    bool exists(GridId grid, const ChunkID& id) const override;
    void remove(GridId grid) override;

    [[nodiscard]] const std::filesystem::path& root() const { return _root; }
    [[nodiscard]] const CodecPipeline& codecs() const { return _codecs; }

private:
    std::filesystem::path gridDir(GridId grid) const;
    std::filesystem::path chunkPath(GridId grid, const ChunkID& id) const;

    std::filesystem::path _root;
    CodecPipeline _codecs;
};

// {"type": "memory"} or {"type": "file", "path": ..., "codecs": [...]}. A null
// config gives a memory store.
std::unique_ptr<BlobStore> makeBlobStore(const nlohmann::json& config);

} // namespace rg
