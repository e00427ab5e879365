#include "package_search.hpp"
#include "tool_util.hpp"
#include "../cache/cache_keys.hpp"
#include "../registries/cran_api.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace crancache {

std::vector<std::string> PackageSearchTool::package_names() {
    std::string key = cache_keys::package_list();
    if (auto cached = ctx_.cache.get(key)) {
        std::vector<std::string> names;
        names.reserve((*cached)->items().size());
        for (const auto& item : (*cached)->items()) {
            if (item && item->type() == Value::Type::String) names.push_back(item->as_string());
        }
        return names;
    }

    auto names = ctx_.cran.all_packages();

    auto list = Value::array();
    list->items().reserve(names.size());
    for (const auto& name : names) list->push(Value::string(name));
    ctx_.cache.set(key, list, kPackageListTtlMs);
    return names;
}

// Position-based scores: crandb has no quality or popularity signal.
static nlohmann::json search_entry(const nlohmann::json& info, const std::string& name,
                                   size_t index, size_t count) {
    std::string description = string_field(info, "Description");
    std::string author = string_field(info, "Author");
    std::string maintainer = string_field(info, "Maintainer");

    double base = std::max(0.1, 1.0 - static_cast<double>(index) / static_cast<double>(count));
    double quality = std::min(1.0, base + (description.size() > 100 ? 0.1 : 0.0));
    double popularity = std::min(1.0, base + (name.size() < 10 ? 0.1 : 0.0));
    double maintenance = std::min(1.0, base + 0.1);

    return {
        {"name", name},
        {"version", string_field(info, "Version")},
        {"description", description},
        {"keywords", nlohmann::json::array()},
        {"author", author.empty() ? "Unknown" : author},
        {"publisher", maintainer},
        {"maintainers", nlohmann::json::array({maintainer})},
        {"score", {
            {"final", (quality + popularity + maintenance) / 3.0},
            {"detail", {
                {"quality", quality},
                {"popularity", popularity},
                {"maintenance", maintenance}
            }}
        }},
        {"searchScore", base}
    };
}

static std::optional<ToolResult> optional_score(const nlohmann::json& args, const char* field,
                                                std::optional<double>& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_number()) {
        return ToolResult{false, std::string("Parameter must be a number: ") + field};
    }
    double v = args[field].get<double>();
    if (v < 0.0 || v > 1.0) {
        return ToolResult{false, std::string("Parameter must be between 0 and 1: ") + field};
    }
    out = v;
    return std::nullopt;
}

ToolResult PackageSearchTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "query")) return *err;

    std::string query = trim(args["query"].get<std::string>());
    if (query.size() > kMaxQueryLength) {
        return ToolResult{false, "Query is too long (max " +
                                 std::to_string(kMaxQueryLength) + " characters)"};
    }

    uint32_t limit = kDefaultLimit;
    if (args.contains("limit") && !args["limit"].is_null()) {
        const auto& l = args["limit"];
        if (!l.is_number()) return ToolResult{false, "Parameter must be a number: limit"};
        double v = l.get<double>();
        if (std::floor(v) != v) return ToolResult{false, "Parameter must be an integer: limit"};
        if (v < 1 || v > kMaxLimit) {
            return ToolResult{false, "Parameter limit must be between 1 and " +
                                     std::to_string(kMaxLimit)};
        }
        limit = static_cast<uint32_t>(v);
    }

    std::optional<double> min_quality;
    std::optional<double> min_popularity;
    if (auto err = optional_score(args, "quality", min_quality)) return *err;
    if (auto err = optional_score(args, "popularity", min_popularity)) return *err;

    // Filters are applied after the cache so the key stays (query, limit).
    std::string key = cache_keys::search_results(query, limit);
    nlohmann::json packages;
    if (auto cached = cached_response(ctx_.cache, key)) {
        packages = std::move(*cached);
    } else {
        std::vector<std::string> matches;
        try {
            std::string needle = to_lower(query);
            for (const auto& name : package_names()) {
                if (to_lower(name).find(needle) == std::string::npos) continue;
                matches.push_back(name);
                if (matches.size() >= limit) break;
            }
        } catch (const std::exception& e) {
            return ToolResult{false, "Failed to search packages for \"" + query + "\": " + e.what()};
        }

        std::vector<std::pair<std::string, nlohmann::json>> found;
        for (const auto& name : matches) {
            try {
                if (auto info = ctx_.cran.package_info(name)) found.emplace_back(name, std::move(*info));
            } catch (const std::exception& e) {
                std::cerr << "[cran] Skipping " << name << ": " << e.what() << "\n";
            }
        }

        packages = nlohmann::json::array();
        for (size_t i = 0; i < found.size(); ++i) {
            packages.push_back(search_entry(found[i].second, found[i].first, i, found.size()));
        }
        store_response(ctx_.cache, key, packages, kCacheTtlMs);
    }

    nlohmann::json filtered = nlohmann::json::array();
    for (const auto& pkg : packages) {
        const auto& detail = pkg["score"]["detail"];
        if (min_quality && detail["quality"].get<double>() < *min_quality) continue;
        if (min_popularity && detail["popularity"].get<double>() < *min_popularity) continue;
        filtered.push_back(pkg);
    }

    nlohmann::json result = {
        {"query", query},
        {"total", filtered.size()},
        {"packages", filtered}
    };
    return ToolResult{true, dump_response(result)};
}

std::string PackageSearchTool::description() const {
    return "Search for packages in CRAN by name";
}

std::string PackageSearchTool::parameters_json() const {
    return R"json({"type":"object","properties":{)json"
           R"json("query":{"type":"string","description":"The search query"},)json"
           R"json("limit":{"type":"integer","description":"Maximum number of results to return (default: 20)","default":20,"minimum":1,"maximum":100},)json"
           R"json("quality":{"type":"number","description":"Minimum quality score (0-1)","minimum":0,"maximum":1},)json"
           R"json("popularity":{"type":"number","description":"Minimum popularity score (0-1)","minimum":0,"maximum":1})json"
           R"json(},"required":["query"]})json";
}

} // namespace crancache
