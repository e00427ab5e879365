#pragma once
#include <cstdint>
#include <string>

namespace crancache {
namespace cache_keys {

// pkg_info:<name>
std::string package_info(const std::string& package_name);

// pkg_readme:<base64(name)>:<base64(version)>
std::string package_readme(const std::string& package_name,
                           const std::string& version = "latest");

// search:<base64(query)>:<limit>. The query is encoded because it may
// contain the ':' delimiter.
std::string search_results(const std::string& query, uint32_t limit);

// pkg_list:all
std::string package_list();

} // namespace cache_keys
} // namespace crancache
