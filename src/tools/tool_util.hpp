#pragma once
#include "../tool.hpp"
#include "../cache/response_cache.hpp"
#include "../util.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace crancache {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object"};
    }
    return std::nullopt;
}

// Check that a required string field exists and is not blank.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    if (trim(args[field].get<std::string>()).empty()) {
        return ToolResult{false, std::string("Parameter must not be empty: ") + field};
    }
    return std::nullopt;
}

// Read an optional boolean; absent or null keeps the default.
inline std::optional<ToolResult> optional_bool(const nlohmann::json& args, const char* field,
                                               bool& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_boolean()) {
        return ToolResult{false, std::string("Parameter must be a boolean: ") + field};
    }
    out = args[field].get<bool>();
    return std::nullopt;
}

// String field of a DESCRIPTION record, empty when missing.
inline std::string string_field(const nlohmann::json& info, const char* field) {
    if (info.contains(field) && info[field].is_string()) return info[field].get<std::string>();
    return {};
}

// First github.com entry of the comma-separated URL field.
inline std::optional<std::string> github_url(const nlohmann::json& info) {
    for (const auto& url : split(string_field(info, "URL"), ',')) {
        std::string u = trim(url);
        if (u.find("github.com") != std::string::npos) return u;
    }
    return std::nullopt;
}

// Upstream text (READMEs especially) is not guaranteed to be valid UTF-8.
inline std::string dump_response(const nlohmann::json& response) {
    return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline std::optional<nlohmann::json> cached_response(ResponseCache& cache,
                                                     const std::string& key) {
    auto hit = cache.get(key);
    if (!hit) return std::nullopt;
    return (*hit)->to_json();
}

inline void store_response(ResponseCache& cache, const std::string& key,
                           const nlohmann::json& response, uint64_t ttl_ms) {
    cache.set(key, Value::from_json(response), ttl_ms);
}

} // namespace crancache
