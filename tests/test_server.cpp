#include <catch2/catch_test_macros.hpp>
#include "server.hpp"
#include "cache/response_cache.hpp"
#include "registries/cran_api.hpp"
#include "registries/github_api.hpp"
#include "mock_http_client.hpp"
#include <sstream>

using namespace crancache;

static CacheOptions server_cache_options() {
    CacheOptions o;
    o.sweep_interval_ms = 0;
    return o;
}

struct ServerFixture {
    MockHttpClient http;
    ResponseCache cache{server_cache_options()};
    CranApi cran{http};
    GitHubApi github{http};
    ToolContext ctx{cache, cran, github};
    ToolServer server{create_package_tools(ctx), cache};

    ServerFixture() {
        http.routes["https://crandb.r-pkg.org/cli"] =
            {200, R"({"Package":"cli","Version":"3.6.2","Imports":"utils","License":"MIT"})"};
    }
};

TEST_CASE("ToolServer: tools/list describes every tool", "[server]") {
    ServerFixture f;
    auto resp = f.server.handle({{"id", 1}, {"method", "tools/list"}});

    REQUIRE(resp["id"] == 1);
    const auto& tools = resp["result"]["tools"];
    REQUIRE(tools.size() == 3);
    for (const auto& t : tools) {
        REQUIRE(t["name"].is_string());
        REQUIRE(t["description"].is_string());
        REQUIRE(t["inputSchema"]["type"] == "object");
    }
}

TEST_CASE("ToolServer: tools/call wraps the tool output", "[server]") {
    ServerFixture f;
    auto resp = f.server.handle({
        {"id", "a"},
        {"method", "tools/call"},
        {"params", {{"name", "get_package_info_from_cran"},
                    {"arguments", {{"package_name", "cli"}}}}}
    });

    REQUIRE(resp["id"] == "a");
    REQUIRE(resp["result"]["isError"] == false);
    const auto& content = resp["result"]["content"];
    REQUIRE(content.size() == 1);
    REQUIRE(content[0]["type"] == "text");

    auto info = nlohmann::json::parse(content[0]["text"].get<std::string>());
    REQUIRE(info["latest_version"] == "3.6.2");
    REQUIRE(info["dependencies"].contains("utils"));
}

TEST_CASE("ToolServer: tool failure sets isError", "[server]") {
    ServerFixture f;
    auto resp = f.server.handle({
        {"id", 2},
        {"method", "tools/call"},
        {"params", {{"name", "get_package_info_from_cran"}, {"arguments", nlohmann::json::object()}}}
    });
    REQUIRE(resp["result"]["isError"] == true);
    REQUIRE(resp["result"]["content"][0]["text"] == "Missing required parameter: package_name");
}

TEST_CASE("ToolServer: error codes", "[server]") {
    ServerFixture f;

    auto unknown_method = f.server.handle({{"id", 1}, {"method", "tools/delete"}});
    REQUIRE(unknown_method["error"]["code"] == ToolServer::kMethodNotFound);

    auto unknown_tool = f.server.handle({
        {"id", 2}, {"method", "tools/call"}, {"params", {{"name", "rm_rf"}}}});
    REQUIRE(unknown_tool["error"]["code"] == ToolServer::kMethodNotFound);
    REQUIRE(unknown_tool["error"]["message"] == "Unknown tool: rm_rf");

    auto no_name = f.server.handle({{"id", 3}, {"method", "tools/call"}, {"params", {{"x", 1}}}});
    REQUIRE(no_name["error"]["code"] == ToolServer::kInvalidParams);

    auto no_method = f.server.handle({{"id", 4}});
    REQUIRE(no_method["error"]["code"] == ToolServer::kInvalidRequest);
    REQUIRE(no_method["id"] == 4);

    auto not_object = f.server.handle(nlohmann::json::array({1, 2}));
    REQUIRE(not_object["error"]["code"] == ToolServer::kInvalidRequest);
    REQUIRE(not_object["id"].is_null());
}

TEST_CASE("ToolServer: cache/stats and cache/clear", "[server]") {
    ServerFixture f;
    nlohmann::json call = {
        {"id", 1},
        {"method", "tools/call"},
        {"params", {{"name", "get_package_info_from_cran"},
                    {"arguments", {{"package_name", "cli"}}}}}
    };
    f.server.handle(call);
    f.server.handle(call);

    auto stats = f.server.handle({{"id", 2}, {"method", "cache/stats"}})["result"];
    REQUIRE(stats["size"] == 1);
    REQUIRE(stats["hits"] == 1);
    REQUIRE(stats["misses"] == 1);
    REQUIRE(stats["hitRate"] == 0.5);
    REQUIRE(stats["memoryUsage"].get<size_t>() > 0);
    REQUIRE(stats["maxSize"] == 100 * 1024 * 1024);
    REQUIRE(stats.contains("evictions"));
    REQUIRE(stats.contains("expirations"));

    auto cleared = f.server.handle({{"id", 3}, {"method", "cache/clear"}});
    REQUIRE(cleared["result"]["cleared"] == true);
    REQUIRE(f.cache.size() == 0);

    f.server.handle(call);
    REQUIRE(f.http.count_requests("https://crandb.r-pkg.org/cli") == 2);
}

TEST_CASE("ToolServer::handle_line: malformed JSON is a parse error", "[server]") {
    ServerFixture f;
    auto resp = nlohmann::json::parse(f.server.handle_line("{oops"));
    REQUIRE(resp["error"]["code"] == ToolServer::kParseError);
    REQUIRE(resp["id"].is_null());
}

TEST_CASE("ToolServer::serve: one response per non-blank line", "[server]") {
    ServerFixture f;
    std::istringstream in(
        "{\"id\":1,\"method\":\"tools/list\"}\n"
        "\n"
        "{\"id\":2,\"method\":\"cache/stats\"}\n"
        "not json\n");
    std::ostringstream out;

    f.server.serve(in, out);

    std::istringstream lines(out.str());
    std::vector<nlohmann::json> responses;
    std::string line;
    while (std::getline(lines, line)) responses.push_back(nlohmann::json::parse(line));

    REQUIRE(responses.size() == 3);
    REQUIRE(responses[0]["id"] == 1);
    REQUIRE(responses[1]["id"] == 2);
    REQUIRE(responses[2]["error"]["code"] == ToolServer::kParseError);
}
