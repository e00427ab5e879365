#pragma once
#include "registry.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace crancache {

// Thin client for the crandb CRAN metadata service.
class CranApi {
public:
    static constexpr const char* kDefaultBaseUrl = "https://crandb.r-pkg.org";

    CranApi(HttpClient& http, std::string base_url = kDefaultBaseUrl,
            long timeout_seconds = 10);

    // DESCRIPTION metadata for one package; "latest" or an explicit version.
    // Returns nullopt when the registry answers 404. The package name is
    // added as a "name" field. Throws RegistryError on any other failure.
    std::optional<nlohmann::json> package_info(const std::string& package_name,
                                               const std::string& version = "latest");

    // Every package name known to crandb.
    std::vector<std::string> all_packages();

    // Depends + Imports + LinkingTo, first occurrence wins, "R" dropped.
    static std::vector<std::string> dependencies(const nlohmann::json& info);

    // Package names of one dependency field. crandb serves these either as
    // a DESCRIPTION string or as an object of name -> version constraint.
    static std::vector<std::string> field_dependencies(const nlohmann::json& field);

    // "R (>= 3.5.0), methods, utils" -> {"R", "methods", "utils"}
    static std::vector<std::string> parse_dependency_string(const std::string& deps);

private:
    nlohmann::json fetch_json(const std::string& url, bool allow_not_found, bool& not_found);

    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace crancache
