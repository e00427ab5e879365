#include "package_info.hpp"
#include "tool_util.hpp"
#include "../cache/cache_keys.hpp"
#include "../registries/cran_api.hpp"
#include <iostream>

namespace crancache {

static nlohmann::json dependency_map(const std::vector<std::string>& names) {
    nlohmann::json deps = nlohmann::json::object();
    for (const auto& name : names) deps[name] = "*"; // crandb has no resolved constraints
    return deps;
}

static nlohmann::json not_found_response(const std::string& package_name) {
    return {
        {"package_name", package_name},
        {"latest_version", ""},
        {"description", ""},
        {"author", ""},
        {"license", ""},
        {"keywords", nlohmann::json::array()},
        {"download_stats", {{"last_day", 0}, {"last_week", 0}, {"last_month", 0}}},
        {"exists", false}
    };
}

// Full response with both dependency maps; execute() drops what the caller
// did not ask for, so one cache entry serves every flag combination.
static nlohmann::json build_response(const std::string& package_name,
                                     const nlohmann::json& info) {
    nlohmann::json result = {
        {"package_name", package_name},
        {"latest_version", string_field(info, "Version")},
        {"description", string_field(info, "Description")},
        {"author", string_field(info, "Author")},
        {"license", string_field(info, "License")},
        {"keywords", nlohmann::json::array()},
        {"download_stats", {{"last_day", 0}, {"last_week", 0}, {"last_month", 0}}},
        {"exists", true}
    };

    auto deps = CranApi::dependencies(info);
    if (!deps.empty()) result["dependencies"] = dependency_map(deps);

    if (info.contains("Suggests")) {
        auto suggests = CranApi::field_dependencies(info["Suggests"]);
        if (!suggests.empty()) result["dev_dependencies"] = dependency_map(suggests);
    }

    if (auto url = github_url(info)) {
        nlohmann::json repo = {{"type", "git"}, {"url", *url}};
        std::string bugs = string_field(info, "BugReports");
        if (!bugs.empty()) repo["bugreports"] = bugs;
        result["repository"] = repo;
    }
    return result;
}

ToolResult PackageInfoTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "package_name")) return *err;

    bool include_deps = true;
    bool include_dev_deps = false;
    if (auto err = optional_bool(args, "include_dependencies", include_deps)) return *err;
    if (auto err = optional_bool(args, "include_dev_dependencies", include_dev_deps)) return *err;

    std::string package_name = trim(args["package_name"].get<std::string>());
    std::string key = cache_keys::package_info(package_name);

    nlohmann::json result;
    if (auto cached = cached_response(ctx_.cache, key)) {
        result = std::move(*cached);
    } else {
        std::optional<nlohmann::json> info;
        try {
            info = ctx_.cran.package_info(package_name);
        } catch (const std::exception& e) {
            return ToolResult{false, "Failed to get package info for " + package_name +
                                     ": " + e.what()};
        }

        if (!info) {
            std::cerr << "[cran] Package '" << package_name << "' not found\n";
            return ToolResult{true, dump_response(not_found_response(package_name))};
        }

        result = build_response(package_name, *info);
        store_response(ctx_.cache, key, result, kCacheTtlMs);
    }

    if (!include_deps) result.erase("dependencies");
    if (!include_dev_deps) result.erase("dev_dependencies");
    return ToolResult{true, dump_response(result)};
}

std::string PackageInfoTool::description() const {
    return "Get package basic information and dependencies from CRAN";
}

std::string PackageInfoTool::parameters_json() const {
    return R"json({"type":"object","properties":{)json"
           R"json("package_name":{"type":"string","description":"The name of the CRAN package (e.g. \"ggplot2\", \"dplyr\")"},)json"
           R"json("include_dependencies":{"type":"boolean","description":"Whether to include dependencies (default: true)","default":true},)json"
           R"json("include_dev_dependencies":{"type":"boolean","description":"Whether to include Suggests as development dependencies (default: false)","default":false})json"
           R"json(},"required":["package_name"]})json";
}

} // namespace crancache
