#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace crancache;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.cache.ttl_ms == 3600000);
    REQUIRE(cfg.cache.max_size_bytes == 104857600);
    REQUIRE(cfg.cache.sweep_interval_ms == 300000);
    REQUIRE(cfg.registry.cran_base_url == "https://crandb.r-pkg.org");
    REQUIRE(cfg.registry.github_api_url == "https://api.github.com");
    REQUIRE(cfg.registry.github_token.empty());
    REQUIRE(cfg.registry.request_timeout == 10);
}

TEST_CASE("Config::cache_options: copies the cache section", "[config]") {
    Config cfg;
    cfg.cache.ttl_ms = 1234;
    cfg.cache.max_size_bytes = 5678;
    cfg.cache.sweep_interval_ms = 0;

    auto options = cfg.cache_options();
    REQUIRE(options.ttl_ms == 1234);
    REQUIRE(options.max_size_bytes == 5678);
    REQUIRE(options.sweep_interval_ms == 0);
    REQUIRE_FALSE(options.clock);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "crancache_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("CRANCACHE_CACHE_TTL_MS");
        unsetenv("CRANCACHE_CACHE_MAX_SIZE");
        unsetenv("CRANDB_BASE_URL");
        unsetenv("GITHUB_TOKEN");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.crancache/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.crancache");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "cache": {
            "ttl_ms": 60000,
            "max_size_bytes": 2048,
            "sweep_interval_ms": 0
        },
        "registry": {
            "cran_base_url": "http://localhost:5984",
            "github_api_url": "http://localhost:8080",
            "request_timeout": 3
        }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.cache.ttl_ms == 60000);
    REQUIRE(cfg.cache.max_size_bytes == 2048);
    REQUIRE(cfg.cache.sweep_interval_ms == 0);
    REQUIRE(cfg.registry.cran_base_url == "http://localhost:5984");
    REQUIRE(cfg.registry.github_api_url == "http://localhost:8080");
    REQUIRE(cfg.registry.request_timeout == 3);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"ttl_ms": 60000, "max_size_bytes": 2048}})");
    setenv("CRANCACHE_CACHE_TTL_MS", "1000", 1);
    setenv("CRANCACHE_CACHE_MAX_SIZE", "4096", 1);
    setenv("CRANDB_BASE_URL", "http://mirror.example", 1);
    setenv("GITHUB_TOKEN", "ghp_test", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_ms == 1000);
    REQUIRE(cfg.cache.max_size_bytes == 4096);
    REQUIRE(cfg.registry.cran_base_url == "http://mirror.example");
    REQUIRE(cfg.registry.github_token == "ghp_test");

    unsetenv("CRANCACHE_CACHE_TTL_MS");
    unsetenv("CRANCACHE_CACHE_MAX_SIZE");
    unsetenv("CRANDB_BASE_URL");
    unsetenv("GITHUB_TOKEN");
}

TEST_CASE("Config::load: malformed numeric env var is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("CRANCACHE_CACHE_TTL_MS", "soon", 1);
    setenv("CRANCACHE_CACHE_MAX_SIZE", "-5", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_ms == 3600000);
    REQUIRE(cfg.cache.max_size_bytes == 104857600);

    unsetenv("CRANCACHE_CACHE_TTL_MS");
    unsetenv("CRANCACHE_CACHE_MAX_SIZE");
}

TEST_CASE("Config::load: wrongly typed values keep defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"ttl_ms": "long", "max_size_bytes": -1},
                       "registry": {"cran_base_url": 42}})");

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_ms == 3600000);
    REQUIRE(cfg.cache.max_size_bytes == 104857600);
    REQUIRE(cfg.registry.cran_base_url == "https://crandb.r-pkg.org");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_ms == 3600000);
    REQUIRE(cfg.registry.cran_base_url == "https://crandb.r-pkg.org");

    // Left untouched for the user to fix
    REQUIRE(g.read_config() == "not valid json {{{");
}

TEST_CASE("Config::load: github token is never written to disk", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("GITHUB_TOKEN", "ghp_secret", 1);
    Config::load();
    unsetenv("GITHUB_TOKEN");

    REQUIRE(g.read_config().find("ghp_secret") == std::string::npos);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j.contains("cache"));
    REQUIRE(j["cache"]["ttl_ms"] == 3600000);
    REQUIRE(j["cache"]["max_size_bytes"] == 104857600);
    REQUIRE(j.contains("registry"));
    REQUIRE(j["registry"]["cran_base_url"] == "https://crandb.r-pkg.org");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"ttl_ms": 5000}})");

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_ms == 5000);
    REQUIRE(cfg.cache.max_size_bytes == 104857600);

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["cache"]["ttl_ms"] == 5000);
    REQUIRE(j["cache"].contains("sweep_interval_ms"));
    REQUIRE(j.contains("registry"));
    REQUIRE(j["registry"]["request_timeout"] == 10);
}

TEST_CASE("Config::load: failed migration write is not reported as migrated", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"ttl_ms": 5000}})");
    // A directory in place of the temp file makes the write fail.
    std::filesystem::create_directories(g.config_path() + ".tmp");

    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
    Config cfg = Config::load();
    std::cerr.rdbuf(old);

    REQUIRE(cfg.cache.ttl_ms == 5000);
    REQUIRE(cfg.cache.max_size_bytes == 104857600);
    REQUIRE(captured.str().find("Migrated") == std::string::npos);
    REQUIRE(g.read_config() == R"({"cache": {"ttl_ms": 5000}})");
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["cache"]["ttl_ms"] = 1000;
    full["registry"]["cran_base_url"] = "http://localhost:5984";

    g.write_config(full.dump(4) + "\n");
    std::string before = g.read_config();

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_ms == 1000);
    REQUIRE(cfg.registry.cran_base_url == "http://localhost:5984");

    REQUIRE(g.read_config() == before);
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = g.read_config();
    Config::load();
    REQUIRE(g.read_config() == first);
}
