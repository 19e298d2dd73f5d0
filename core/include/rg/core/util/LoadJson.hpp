// LoadJson.hpp - JSON loading and validation utilities for rastergrid configs
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <initializer_list>

namespace rg::json {

nlohmann::json load_json_file(const std::filesystem::path& path);

// ============ VALIDATION ============

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path)
 * @throws rg::ConfigError naming the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Returns an integer if present and integral, else def. Throws ConfigError
// for a present value of the wrong type.
std::int64_t integer_or(const nlohmann::json* m, const char* key, std::int64_t def);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

// Returns the named sub-object, or nullptr when absent.
const nlohmann::json* object_or_null(const nlohmann::json* m, const char* key);

} // namespace rg::json
