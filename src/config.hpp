#pragma once
#include "cache/response_cache.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace crancache {

struct CacheConfig {
    uint64_t ttl_ms = 3600 * 1000;
    uint64_t max_size_bytes = 100 * 1024 * 1024;
    uint64_t sweep_interval_ms = 5 * 60 * 1000;
};

struct RegistryConfig {
    std::string cran_base_url = "https://crandb.r-pkg.org";
    std::string github_api_url = "https://api.github.com";
    std::string github_token;  // env only, never written to disk
    long request_timeout = 10; // seconds
};

struct Config {
    CacheConfig cache;
    RegistryConfig registry;

    // Load from ~/.crancache/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Options for the shared response cache
    CacheOptions cache_options() const;
};

} // namespace crancache
