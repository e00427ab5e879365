#include "cache_keys.hpp"
#include "../util.hpp"

namespace crancache {
namespace cache_keys {

std::string package_info(const std::string& package_name) {
    return "pkg_info:" + package_name;
}

std::string package_readme(const std::string& package_name, const std::string& version) {
    return "pkg_readme:" + base64_encode(package_name) + ":" + base64_encode(version);
}

std::string search_results(const std::string& query, uint32_t limit) {
    return "search:" + base64_encode(query) + ":" + std::to_string(limit);
}

std::string package_list() {
    return "pkg_list:all";
}

} // namespace cache_keys
} // namespace crancache
