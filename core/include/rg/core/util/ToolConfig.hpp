#pragma once

#include "rg/core/types/GridOptions.hpp"
#include "rg/core/util/EvictionRegistry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace rg {

// Configuration document of the command-line tools:
// {"registry": {...}, "grid": {...}, "store": {...}}. Every section is optional.
struct ToolConfig {
    RegistryConfig registry;
    GridOptions grid;
    nlohmann::json store;  // null selects the in-memory store

    static ToolConfig fromJson(const nlohmann::json& j);
    static ToolConfig load(const std::optional<std::filesystem::path>& path);
};

} // namespace rg
