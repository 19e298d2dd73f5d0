#include "rg/core/util/EvictionRegistry.hpp"
#include "rg/core/util/LoadJson.hpp"
#include "rg/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace rg {

RegistryConfig RegistryConfig::fromJson(const nlohmann::json* j)
{
    RegistryConfig cfg;
    if (!j) return cfg;

    auto nonNegative = [](std::int64_t v, const char* key) {
        if (v < 0) {
            throw ConfigError(std::string("registry '") + key + "' must not be negative");
        }
        return static_cast<std::size_t>(v);
    };

    cfg.memoryThreshold = nonNegative(
        json::integer_or(j, "memory_threshold", static_cast<std::int64_t>(cfg.memoryThreshold)),
        "memory_threshold");
    if (j->contains("memory_budget")) {
        cfg.memoryBudget = nonNegative(json::integer_or(j, "memory_budget", 0), "memory_budget");
    }
    cfg.reserveBytes = nonNegative(json::integer_or(j, "reserve_bytes", 0), "reserve_bytes");
    cfg.maxAllocRetries = static_cast<int>(nonNegative(
        json::integer_or(j, "max_alloc_retries", cfg.maxAllocRetries), "max_alloc_retries"));
    return cfg;
}

EvictionRegistry::EvictionRegistry(RegistryConfig config,
                                   std::shared_ptr<BlobStore> store,
                                   std::unique_ptr<MemoryProbe> probe)
    : _config(std::move(config)), _store(std::move(store)), _probe(std::move(probe))
{
    if (!_store) {
        throw std::invalid_argument("EvictionRegistry requires a blob store");
    }
    if (!_probe) {
        if (_config.memoryBudget)
            _probe = std::make_unique<BudgetMemoryProbe>(*_config.memoryBudget);
        else
            _probe = std::make_unique<SystemMemoryProbe>();
    }
    initMemoryReserve();
}

EvictionRegistry::~EvictionRegistry()
{
    if (!_grids.empty()) {
        Logger()->error("EvictionRegistry destroyed with {} live grid(s)", _grids.size());
    }
}

GridId EvictionRegistry::registerGrid(EvictableGrid& grid)
{
    const GridId id = _nextId++;
    _grids[id] = &grid;
    return id;
}

void EvictionRegistry::unregisterGrid(const EvictableGrid& grid)
{
    _grids.erase(grid.gridId());
    _pins.erase(grid.gridId());
}

std::size_t EvictionRegistry::residentBytes() const
{
    std::size_t total = 0;
    for (const auto& [id, grid] : _grids)
        total += grid->residentBytes();
    return total;
}

std::size_t EvictionRegistry::freeBytes() const
{
    return _probe->freeBytes(*this);
}

// ============ pins ============

void EvictionRegistry::pin(const EvictableGrid& grid, const ChunkID& id)
{
    ++_pins[grid.gridId()][id];
}

void EvictionRegistry::unpin(const EvictableGrid& grid, const ChunkID& id)
{
    auto g = _pins.find(grid.gridId());
    if (g == _pins.end() || !g->second.contains(id)) {
        throw std::logic_error("unpin of chunk " + id.str() + " in grid " +
                               std::to_string(grid.gridId()) + " that is not pinned");
    }
    auto c = g->second.find(id);
    if (--c->second == 0) {
        g->second.erase(c);
        if (g->second.empty())
            _pins.erase(g);
    }
}

bool EvictionRegistry::isPinned(const EvictableGrid& grid, const ChunkID& id) const
{
    return isPinned(grid.gridId(), id);
}

bool EvictionRegistry::isPinned(GridId grid, const ChunkID& id) const
{
    auto g = _pins.find(grid);
    return g != _pins.end() && g->second.contains(id);
}

EvictionRegistry::PinGuard::PinGuard(EvictionRegistry& registry, const EvictableGrid& grid, const ChunkID& id)
    : _registry(&registry), _grid(&grid), _id(id)
{
    _registry->pin(*_grid, _id);
}

EvictionRegistry::PinGuard::PinGuard(PinGuard&& other) noexcept
    : _registry(other._registry), _grid(other._grid), _id(other._id)
{
    other._registry = nullptr;
}

EvictionRegistry::PinGuard::~PinGuard()
{
    if (!_registry) return;
    try {
        _registry->unpin(*_grid, _id);
    } catch (const std::logic_error& e) {
        Logger()->error("PinGuard release failed: {}", e.what());
    }
}

// ============ eviction ============

std::vector<EvictionCandidate> EvictionRegistry::candidates(const EvictionExclusion& exclusion) const
{
    std::vector<EvictionCandidate> all;
    for (const auto& [id, grid] : _grids) {
        if (exclusion.grid == grid && exclusion.wholeGrid)
            continue;
        grid->collectEvictionCandidates(all);
    }

    std::vector<EvictionCandidate> eligible;
    eligible.reserve(all.size());
    for (const auto& c : all) {
        if (exclusion.excludes(c.grid, c.id) || isPinned(c.grid->gridId(), c.id))
            continue;
        eligible.push_back(c);
    }
    std::sort(eligible.begin(), eligible.end(),
              [](const EvictionCandidate& a, const EvictionCandidate& b) { return a.lastAccess < b.lastAccess; });
    return eligible;
}

EvictionDetail EvictionRegistry::ensureHeadroomDetail(const EvictionExclusion& exclusion, std::size_t bytesNeeded)
{
    EvictionDetail detail;
    const std::size_t target = _config.memoryThreshold + bytesNeeded;

    std::size_t free = freeBytes();
    if (free >= target)
        return detail;

    Logger()->debug("eviction pass: {} bytes free, {} wanted", free, target);

    std::size_t evicted = 0;
    std::size_t freed = 0;
    for (const auto& c : candidates(exclusion)) {
        freed += c.grid->evictChunk(c.id);
        detail[c.grid->gridId()].insert(c.id);
        ++evicted;
        free = freeBytes();
        if (free >= target)
            break;
    }

    if (free < target) {
        Logger()->warn("memory exhausted: {} bytes free after evicting {} chunk(s), {} wanted",
                       free, evicted, target);
        throw ResourceExhaustedError("cannot free memory: " + std::to_string(free) +
                                     " bytes free, " + std::to_string(target) +
                                     " required, no evictable chunk left");
    }

    Logger()->debug("eviction pass done: {} chunk(s), {} bytes released", evicted, freed);
    return detail;
}

std::size_t EvictionRegistry::ensureHeadroom(const EvictionExclusion& exclusion, std::size_t bytesNeeded)
{
    std::size_t n = 0;
    for (const auto& [grid, ids] : ensureHeadroomDetail(exclusion, bytesNeeded))
        n += ids.size();
    return n;
}

std::size_t EvictionRegistry::evictAll(const EvictionExclusion& exclusion)
{
    std::size_t n = 0;
    for (const auto& c : candidates(exclusion)) {
        c.grid->evictChunk(c.id);
        ++n;
    }
    Logger()->debug("evicted all: {} chunk(s)", n);
    return n;
}

bool EvictionRegistry::evictOne(const EvictionExclusion& exclusion)
{
    auto list = candidates(exclusion);
    if (list.empty())
        return false;
    list.front().grid->evictChunk(list.front().id);
    return true;
}

void EvictionRegistry::recoverFromAllocFailure(const EvictionExclusion& exclusion)
{
    const bool hadReserve = reserveHeld() > 0;
    clearMemoryReserve();
    const bool evicted = evictOne(exclusion);
    Logger()->warn("allocation failed, released reserve: {}, evicted a chunk: {}", hadReserve, evicted);
    if (!hadReserve && !evicted) {
        throw ResourceExhaustedError("allocation failed and nothing is left to evict");
    }
    try {
        initMemoryReserve();
    } catch (const std::bad_alloc&) {
        Logger()->warn("could not re-establish memory reserve of {} bytes", _config.reserveBytes);
    }
}

void EvictionRegistry::initMemoryReserve()
{
    if (_config.reserveBytes > 0 && _reserve.size() != _config.reserveBytes) {
        _reserve.assign(_config.reserveBytes, 0);
    }
}

void EvictionRegistry::clearMemoryReserve()
{
    std::vector<std::uint8_t>().swap(_reserve);
}

} // namespace rg
