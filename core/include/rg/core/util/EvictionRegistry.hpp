#pragma once

#include "rg/core/types/BlobStore.hpp"
#include "rg/core/types/ChunkID.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/MemoryProbe.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <new>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rg {

struct RegistryConfig {
    std::size_t memoryThreshold = 10'000'000;
    // When set, free memory is this budget minus resident chunk bytes.
    std::optional<std::size_t> memoryBudget;
    std::size_t reserveBytes = 0;
    int maxAllocRetries = 1;

    static RegistryConfig fromJson(const nlohmann::json* j);
};

class EvictableGrid;

struct EvictionCandidate {
    EvictableGrid* grid;
    ChunkID id;
    std::uint64_t lastAccess;
    std::size_t bytes;
};

/// Chunks an eviction pass must leave alone, on top of pinned ones.
struct EvictionExclusion {
    const EvictableGrid* grid = nullptr;
    bool wholeGrid = false;
    std::set<ChunkID> chunks;

    static EvictionExclusion none() { return {}; }
    static EvictionExclusion of(const EvictableGrid& g) { return {&g, true, {}}; }
    static EvictionExclusion of(const EvictableGrid& g, std::set<ChunkID> ids) { return {&g, false, std::move(ids)}; }

    [[nodiscard]] bool excludes(const EvictableGrid* g, const ChunkID& id) const
    {
        return g == grid && (wholeGrid || chunks.contains(id));
    }
};

/// A grid whose chunks the registry may swap out.
class EvictableGrid
{
public:
    virtual ~EvictableGrid() = default;

    [[nodiscard]] virtual GridId gridId() const = 0;
    [[nodiscard]] virtual std::size_t residentBytes() const = 0;
    // Append resident chunks that are worth evicting (never Uniform ones).
    virtual void collectEvictionCandidates(std::vector<EvictionCandidate>& out) = 0;
    // Write the chunk to the store when needed and drop it. Returns bytes freed.
    virtual std::size_t evictChunk(const ChunkID& id) = 0;
};

using EvictionDetail = std::map<GridId, std::set<ChunkID>>;

/**
 * @brief Tracks every live grid and drives chunk eviction under memory pressure.
 *
 * One registry is created per process (or per test) and handed to every grid
 * at construction; it must outlive them. Grids pin the chunks an operation is
 * using, and ensureHeadroom() evicts the least recently accessed unpinned
 * chunks until free memory is back above the threshold.
 */
class EvictionRegistry
{
public:
    EvictionRegistry(RegistryConfig config,
                     std::shared_ptr<BlobStore> store,
                     std::unique_ptr<MemoryProbe> probe = nullptr);
    ~EvictionRegistry();

    EvictionRegistry(const EvictionRegistry&) = delete;
    EvictionRegistry& operator=(const EvictionRegistry&) = delete;

    [[nodiscard]] const RegistryConfig& config() const { return _config; }
    [[nodiscard]] BlobStore& store() { return *_store; }

    GridId registerGrid(EvictableGrid& grid);
    void unregisterGrid(const EvictableGrid& grid);
    [[nodiscard]] std::size_t gridCount() const { return _grids.size(); }

    [[nodiscard]] std::size_t residentBytes() const;
    [[nodiscard]] std::size_t freeBytes() const;

    // Pins are counted; every pin needs a matching unpin.
    void pin(const EvictableGrid& grid, const ChunkID& id);
    // Throws std::logic_error if the chunk is not pinned.
    void unpin(const EvictableGrid& grid, const ChunkID& id);
    [[nodiscard]] bool isPinned(const EvictableGrid& grid, const ChunkID& id) const;

    class PinGuard
    {
    public:
        PinGuard(EvictionRegistry& registry, const EvictableGrid& grid, const ChunkID& id);
        ~PinGuard();
        PinGuard(PinGuard&& other) noexcept;
        PinGuard(const PinGuard&) = delete;
        PinGuard& operator=(const PinGuard&) = delete;
        PinGuard& operator=(PinGuard&&) = delete;

    private:
        EvictionRegistry* _registry;
        const EvictableGrid* _grid;
        ChunkID _id;
    };

    [[nodiscard]] PinGuard pinScoped(const EvictableGrid& grid, const ChunkID& id)
    {
        return PinGuard(*this, grid, id);
    }

    /**
     * @brief Evict until free memory is at least threshold + bytesNeeded.
     * @return number of chunks evicted
     * @throws ResourceExhaustedError if no eligible chunk remains while still below
     */
    std::size_t ensureHeadroom(const EvictionExclusion& exclusion = {}, std::size_t bytesNeeded = 0);

    /// As ensureHeadroom(), reporting which chunks of which grids were evicted.
    EvictionDetail ensureHeadroomDetail(const EvictionExclusion& exclusion = {}, std::size_t bytesNeeded = 0);

    /// Evict every eligible chunk regardless of memory pressure.
    std::size_t evictAll(const EvictionExclusion& exclusion = {});

    /// Evict the single least recently used eligible chunk. False if none is eligible.
    bool evictOne(const EvictionExclusion& exclusion = {});

    /**
     * @brief Run an allocating operation under memory pressure control.
     *
     * Headroom is ensured first, then @p fn runs under retryOnAllocFailure().
     */
    template<typename F>
    auto withHeadroom(const EvictionExclusion& exclusion, std::size_t bytesNeeded, F&& fn) -> decltype(fn())
    {
        ensureHeadroom(exclusion, bytesNeeded);
        return retryOnAllocFailure(exclusion, std::forward<F>(fn));
    }

    /**
     * @brief Run @p fn, recovering from std::bad_alloc.
     *
     * On failure the memory reserve is released, one more chunk is evicted
     * and @p fn is retried, at most config().maxAllocRetries times.
     */
    template<typename F>
    auto retryOnAllocFailure(const EvictionExclusion& exclusion, F&& fn) -> decltype(fn())
    {
        for (int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const std::bad_alloc&) {
                if (attempt >= _config.maxAllocRetries) {
                    throw ResourceExhaustedError("allocation failed after " +
                                                 std::to_string(attempt) + " retries");
                }
                recoverFromAllocFailure(exclusion);
            }
        }
    }

    [[nodiscard]] std::uint64_t nextAccessTick() { return ++_tick; }

    void initMemoryReserve();
    void clearMemoryReserve();
    [[nodiscard]] std::size_t reserveHeld() const { return _reserve.size(); }

private:
    std::vector<EvictionCandidate> candidates(const EvictionExclusion& exclusion) const;
    void recoverFromAllocFailure(const EvictionExclusion& exclusion);
    [[nodiscard]] bool isPinned(GridId grid, const ChunkID& id) const;

    RegistryConfig _config;
    std::shared_ptr<BlobStore> _store;
    std::unique_ptr<MemoryProbe> _probe;

    GridId _nextId = 1;
    std::map<GridId, EvictableGrid*> _grids;
    std::map<GridId, std::map<ChunkID, int>> _pins;
    std::uint64_t _tick = 0;
    std::vector<std::uint8_t> _reserve;
};

} // namespace rg
