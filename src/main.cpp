#include "config.hpp"
#include "http.hpp"
#include "server.hpp"
#include "tool.hpp"
#include "cache/response_cache.hpp"
#include "registries/cran_api.hpp"
#include "registries/github_api.hpp"
#include <iostream>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: crancache [options]\n"
              << "\n"
              << "Reads one JSON request per line on stdin and writes one JSON\n"
              << "response per line on stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --call TOOL [ARGS]   Run a single tool call (ARGS is a JSON object) and exit\n"
              << "  --list               Print the tool list and exit\n"
              << "  --stats              Print cache statistics to stderr on exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Requests:\n"
              << "  {\"id\":1,\"method\":\"tools/list\"}\n"
              << "  {\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"get_package_info_from_cran\","
                 "\"arguments\":{\"package_name\":\"dplyr\"}}}\n"
              << "  {\"id\":3,\"method\":\"cache/stats\"}\n"
              << "  {\"id\":4,\"method\":\"cache/clear\"}\n"
              << "\n"
              << "Environment variables:\n"
              << "  CRANCACHE_CACHE_TTL_MS    Default cache entry lifetime (ms)\n"
              << "  CRANCACHE_CACHE_MAX_SIZE  Cache byte budget\n"
              << "  CRANDB_BASE_URL           crandb endpoint (default: https://crandb.r-pkg.org)\n"
              << "  GITHUB_TOKEN              Token for GitHub README lookups\n";
}

int main(int argc, char* argv[]) try {
    std::string call_tool;
    std::string call_args = "{}";
    bool list_only = false;
    bool print_stats = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--call") == 0 && i + 1 < argc) {
            call_tool = argv[++i];
            if (i + 1 < argc && argv[i + 1][0] != '-') call_args = argv[++i];
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list_only = true;
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            print_stats = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = crancache::Config::load();

    crancache::ResponseCache cache(config.cache_options());
    crancache::SocketHttpClient http_client;
    crancache::CranApi cran(http_client, config.registry.cran_base_url,
                            config.registry.request_timeout);
    crancache::GitHubApi github(http_client, config.registry.github_api_url,
                                config.registry.github_token,
                                config.registry.request_timeout);

    crancache::ToolContext ctx{cache, cran, github};
    crancache::ToolServer server(crancache::create_package_tools(ctx), cache);

    int rc = 0;
    if (list_only) {
        std::cout << server.handle({{"method", "tools/list"}})["result"].dump(2) << '\n';
    } else if (!call_tool.empty()) {
        auto result = crancache::dispatch_tool(call_tool, call_args, server.tools());
        (result.success ? std::cout : std::cerr) << result.output << '\n';
        rc = result.success ? 0 : 1;
    } else {
        server.serve(std::cin, std::cout);
    }

    if (print_stats) {
        auto s = cache.stats();
        std::cerr << "[cache] entries=" << s.size << " bytes=" << s.memory_usage
                  << " hit_rate=" << s.hit_rate << " evictions=" << s.evictions << "\n";
    }

    cache.destroy();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
