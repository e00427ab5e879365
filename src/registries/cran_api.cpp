#include "cran_api.hpp"
#include "../util.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace crancache {

CranApi::CranApi(HttpClient& http, std::string base_url, long timeout_seconds)
    : http_(http), base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

nlohmann::json CranApi::fetch_json(const std::string& url, bool allow_not_found,
                                   bool& not_found) {
    not_found = false;
    auto response = http_.get(url, json_request_headers(), timeout_seconds_);

    if (response.status_code == 0) {
        std::cerr << "[cran] Request failed: " << url << "\n";
        throw RegistryError("CRAN request failed: " + url);
    }
    if (response.status_code == 404 && allow_not_found) {
        not_found = true;
        return nullptr;
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[cran] HTTP " << response.status_code << " from " << url << "\n";
        throw RegistryError("CRAN returned HTTP " + std::to_string(response.status_code),
                            response.status_code);
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw RegistryError(std::string("Invalid JSON from CRAN: ") + e.what(),
                            response.status_code);
    }
}

std::optional<nlohmann::json> CranApi::package_info(const std::string& package_name,
                                                    const std::string& version) {
    std::string url = base_url_ + "/" + url_encode(package_name);
    if (!version.empty() && version != "latest") url += "/" + url_encode(version);

    bool not_found = false;
    nlohmann::json info = fetch_json(url, true, not_found);
    if (not_found) return std::nullopt;

    if (!info.is_object())
        throw RegistryError("Unexpected CRAN response for " + package_name);

    info["name"] = package_name;
    return info;
}

std::vector<std::string> CranApi::all_packages() {
    bool not_found = false;
    nlohmann::json all = fetch_json(base_url_ + "/-/all", false, not_found);
    if (!all.is_object())
        throw RegistryError("Unexpected CRAN package list response");

    std::vector<std::string> names;
    names.reserve(all.size());
    for (auto it = all.begin(); it != all.end(); ++it) {
        names.push_back(it.key());
    }
    return names;
}

std::vector<std::string> CranApi::parse_dependency_string(const std::string& deps) {
    std::vector<std::string> names;
    for (const auto& part : split(deps, ',')) {
        std::istringstream words(trim(part));
        std::string name;
        if (words >> name) names.push_back(name);
    }
    return names;
}

std::vector<std::string> CranApi::field_dependencies(const nlohmann::json& field) {
    if (field.is_string()) return parse_dependency_string(field.get<std::string>());

    std::vector<std::string> names;
    if (field.is_object()) {
        for (auto it = field.begin(); it != field.end(); ++it) names.push_back(it.key());
    }
    return names;
}

std::vector<std::string> CranApi::dependencies(const nlohmann::json& info) {
    std::vector<std::string> result;
    for (const char* field : {"Depends", "Imports", "LinkingTo"}) {
        if (!info.contains(field)) continue;
        for (auto& dep : field_dependencies(info[field])) {
            if (dep == "R") continue;
            if (std::find(result.begin(), result.end(), dep) == result.end())
                result.push_back(std::move(dep));
        }
    }
    return result;
}

} // namespace crancache
