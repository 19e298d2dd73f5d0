#include "rg/core/util/MemoryProbe.hpp"
#include "rg/core/util/EvictionRegistry.hpp"
#include "rg/core/util/Errors.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace rg {

std::size_t BudgetMemoryProbe::freeBytes(const EvictionRegistry& registry) const
{
    const std::size_t used = registry.residentBytes();
    return used >= _budget ? 0 : _budget - used;
}

std::size_t SystemMemoryProbe::freeBytes(const EvictionRegistry&) const
{
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo) {
        throw IOError("cannot read /proc/meminfo");
    }
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.rfind("MemAvailable:", 0) == 0) {
            std::istringstream ss(line.substr(13));
            std::size_t kb = 0;
            ss >> kb;
            return kb * 1024;
        }
    }
    throw IOError("MemAvailable not found in /proc/meminfo");
}

} // namespace rg
