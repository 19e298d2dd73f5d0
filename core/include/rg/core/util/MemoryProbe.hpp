#pragma once

#include <cstddef>

namespace rg {

class EvictionRegistry;

// Source of the free-memory figure the registry compares against its threshold.
class MemoryProbe
{
public:
    virtual ~MemoryProbe() = default;
    virtual std::size_t freeBytes(const EvictionRegistry& registry) const = 0;
};

// Free memory is a fixed budget minus the bytes held by resident chunks.
class BudgetMemoryProbe : public MemoryProbe
{
public:
    explicit BudgetMemoryProbe(std::size_t budget) : _budget(budget) {}

    std::size_t freeBytes(const EvictionRegistry& registry) const override;
    [[nodiscard]] std::size_t budget() const { return _budget; }

private:
    std::size_t _budget;
};

// MemAvailable from /proc/meminfo.
class SystemMemoryProbe : public MemoryProbe
{
public:
    std::size_t freeBytes(const EvictionRegistry& registry) const override;
};

} // namespace rg
