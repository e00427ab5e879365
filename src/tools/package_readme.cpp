#include "package_readme.hpp"
#include "tool_util.hpp"
#include "../cache/cache_keys.hpp"
#include "../registries/cran_api.hpp"
#include "../registries/github_api.hpp"
#include <iostream>

namespace crancache {

std::string basic_readme(const std::string& package_name, const std::string& version,
                         const std::string& title, const std::string& description) {
    std::string out;
    out += "# " + package_name + ": " + title + "\n\n";
    out += description + "\n\n";
    out += "## Installation\n\n";
    out += "You can install the released version of " + package_name +
           " from [CRAN](https://CRAN.R-project.org) with:\n\n";
    out += "```r\ninstall.packages(\"" + package_name + "\")\n```\n\n";
    out += "## Usage\n\n";
    out += "```r\nlibrary(" + package_name + ")\n```\n\n";
    out += "## Version\n\n";
    out += "Current version: " + version + "\n";
    return out;
}

static nlohmann::json installation(const std::string& package_name,
                                   const std::optional<std::string>& repo_url) {
    nlohmann::json inst = {
        {"cran", "install.packages(\"" + package_name + "\")"},
        {"remotes", "remotes::install_cran(\"" + package_name + "\")"}
    };
    if (repo_url) {
        if (auto repo = GitHubApi::parse_repo(*repo_url))
            inst["devtools"] = "devtools::install_github(\"" + *repo + "\")";
    }
    return inst;
}

static nlohmann::json not_found_response(const std::string& package_name,
                                         const std::string& version) {
    return {
        {"package_name", package_name},
        {"version", version},
        {"description", ""},
        {"readme_content", ""},
        {"installation", installation(package_name, std::nullopt)},
        {"basic_info", {
            {"name", package_name}, {"version", version}, {"title", ""},
            {"description", ""}, {"author", ""}, {"maintainer", ""}, {"license", ""}
        }},
        {"exists", false}
    };
}

ToolResult PackageReadmeTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "package_name")) return *err;

    std::string package_name = trim(args["package_name"].get<std::string>());
    std::string version = "latest";
    if (args.contains("version") && !args["version"].is_null()) {
        if (!args["version"].is_string())
            return ToolResult{false, "Parameter must be a string: version"};
        std::string v = trim(args["version"].get<std::string>());
        if (!v.empty()) version = v;
    }

    std::string key = cache_keys::package_readme(package_name, version);
    if (auto cached = cached_response(ctx_.cache, key)) {
        return ToolResult{true, dump_response(*cached)};
    }

    std::optional<nlohmann::json> info;
    try {
        info = ctx_.cran.package_info(package_name, version);
    } catch (const std::exception& e) {
        return ToolResult{false, "Failed to get README for " + package_name + ": " + e.what()};
    }

    if (!info) {
        std::cerr << "[cran] Package '" << package_name << "' (" << version << ") not found\n";
        return ToolResult{true, dump_response(not_found_response(package_name, version))};
    }

    const auto& pkg = *info;
    std::string pkg_version = string_field(pkg, "Version");
    std::string description = string_field(pkg, "Description");
    auto repo_url = github_url(pkg);

    std::string readme;
    if (repo_url) {
        if (auto content = ctx_.github.readme(*repo_url)) readme = std::move(*content);
    }
    if (readme.empty()) {
        readme = basic_readme(package_name, pkg_version, string_field(pkg, "Title"), description);
    }

    nlohmann::json result = {
        {"package_name", package_name},
        {"version", pkg_version},
        {"description", description},
        {"readme_content", readme},
        {"installation", installation(package_name, repo_url)},
        {"basic_info", {
            {"name", package_name},
            {"version", pkg_version},
            {"title", string_field(pkg, "Title")},
            {"description", description},
            {"author", string_field(pkg, "Author")},
            {"maintainer", string_field(pkg, "Maintainer")},
            {"license", string_field(pkg, "License")}
        }},
        {"exists", true}
    };
    if (repo_url) {
        nlohmann::json repo = {{"type", "git"}, {"url", *repo_url}};
        std::string bugs = string_field(pkg, "BugReports");
        if (!bugs.empty()) repo["bugreports"] = bugs;
        result["repository"] = repo;
    }

    store_response(ctx_.cache, key, result, kCacheTtlMs);
    return ToolResult{true, dump_response(result)};
}

std::string PackageReadmeTool::description() const {
    return "Get package README from CRAN (GitHub README when the package links one)";
}

std::string PackageReadmeTool::parameters_json() const {
    return R"json({"type":"object","properties":{)json"
           R"json("package_name":{"type":"string","description":"The name of the CRAN package (e.g. \"ggplot2\", \"dplyr\")"},)json"
           R"json("version":{"type":"string","description":"Version to retrieve (default: \"latest\")"})json"
           R"json(},"required":["package_name"]})json";
}

} // namespace crancache
