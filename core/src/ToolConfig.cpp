#include "rg/core/util/ToolConfig.hpp"
#include "rg/core/util/Errors.hpp"
#include "rg/core/util/LoadJson.hpp"

namespace rg {

ToolConfig ToolConfig::fromJson(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }
    ToolConfig cfg;
    cfg.registry = RegistryConfig::fromJson(json::object_or_null(&j, "registry"));
    cfg.grid = GridOptions::fromJson(json::object_or_null(&j, "grid"));
    if (const auto* store = json::object_or_null(&j, "store")) {
        cfg.store = *store;
    }
    return cfg;
}

ToolConfig ToolConfig::load(const std::optional<std::filesystem::path>& path)
{
    if (!path) {
        return ToolConfig{};
    }
    return fromJson(json::load_json_file(*path));
}

} // namespace rg
