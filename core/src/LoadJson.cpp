#include "rg/core/util/LoadJson.hpp"
#include "rg/core/util/Errors.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace rg::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw ConfigError("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw ConfigError(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

std::int64_t integer_or(const nlohmann::json* m, const char* key, std::int64_t def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("field '") + key + "' must be an integer");
    }
    return it->get<std::int64_t>();
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

const nlohmann::json* object_or_null(const nlohmann::json* m, const char* key) {
    if (!m || !m->is_object()) return nullptr;
    auto it = m->find(key);
    if (it == m->end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("field '") + key + "' must be an object");
    }
    return &*it;
}

} // namespace rg::json
