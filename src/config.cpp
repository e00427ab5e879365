#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace crancache {

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"ttl_ms", 3600 * 1000},
            {"max_size_bytes", 100 * 1024 * 1024},
            {"sweep_interval_ms", 5 * 60 * 1000}
        }},
        {"registry", {
            {"cran_base_url", "https://crandb.r-pkg.org"},
            {"github_api_url", "https://api.github.com"},
            {"request_timeout", 10}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Unsigned integer from the environment; malformed values are ignored.
static bool env_u64(const char* name, uint64_t& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    unsigned long long n = std::strtoull(v, &end, 10);
    if (*end != '\0' || v[0] == '-') {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
        return false;
    }
    out = n;
    return true;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.crancache/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    // Parse JSON into Config struct
    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("ttl_ms") && c["ttl_ms"].is_number_unsigned())
            cfg.cache.ttl_ms = c["ttl_ms"].get<uint64_t>();
        if (c.contains("max_size_bytes") && c["max_size_bytes"].is_number_unsigned())
            cfg.cache.max_size_bytes = c["max_size_bytes"].get<uint64_t>();
        if (c.contains("sweep_interval_ms") && c["sweep_interval_ms"].is_number_unsigned())
            cfg.cache.sweep_interval_ms = c["sweep_interval_ms"].get<uint64_t>();
    }

    if (j.contains("registry") && j["registry"].is_object()) {
        auto& r = j["registry"];
        if (r.contains("cran_base_url") && r["cran_base_url"].is_string())
            cfg.registry.cran_base_url = r["cran_base_url"].get<std::string>();
        if (r.contains("github_api_url") && r["github_api_url"].is_string())
            cfg.registry.github_api_url = r["github_api_url"].get<std::string>();
        if (r.contains("request_timeout") && r["request_timeout"].is_number_unsigned())
            cfg.registry.request_timeout = r["request_timeout"].get<long>();
    }

    // Environment variables always override config file
    env_u64("CRANCACHE_CACHE_TTL_MS", cfg.cache.ttl_ms);
    env_u64("CRANCACHE_CACHE_MAX_SIZE", cfg.cache.max_size_bytes);
    if (const char* v = std::getenv("CRANDB_BASE_URL"))
        cfg.registry.cran_base_url = v;
    if (const char* v = std::getenv("GITHUB_TOKEN"))
        cfg.registry.github_token = v;

    return cfg;
}

CacheOptions Config::cache_options() const {
    CacheOptions options;
    options.ttl_ms = cache.ttl_ms;
    options.max_size_bytes = cache.max_size_bytes;
    options.sweep_interval_ms = cache.sweep_interval_ms;
    return options;
}

} // namespace crancache
