#include "server.hpp"
#include "cache/response_cache.hpp"
#include "util.hpp"

#include <iostream>

namespace crancache {

static nlohmann::json error_response(const nlohmann::json& id, int code,
                                     const std::string& message) {
    return {{"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

ToolServer::ToolServer(std::vector<std::unique_ptr<Tool>> tools, ResponseCache& cache)
    : tools_(std::move(tools)), cache_(cache) {}

nlohmann::json ToolServer::list_tools() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools_) {
        auto spec = tool->spec();
        list.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", nlohmann::json::parse(spec.parameters_json)}
        });
    }
    return {{"tools", list}};
}

nlohmann::json ToolServer::cache_stats() const {
    auto s = cache_.stats();
    return {
        {"size", s.size},
        {"memoryUsage", s.memory_usage},
        {"maxSize", s.max_size},
        {"hitRate", s.hit_rate},
        {"hits", s.hits},
        {"misses", s.misses},
        {"evictions", s.evictions},
        {"expirations", s.expirations}
    };
}

nlohmann::json ToolServer::handle(const nlohmann::json& request) {
    nlohmann::json id = nullptr;
    if (request.is_object() && request.contains("id")) id = request["id"];

    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        return error_response(id, kInvalidRequest, "Request must be an object with a method");
    }

    std::string method = request["method"].get<std::string>();
    nlohmann::json params = request.value("params", nlohmann::json::object());

    if (method == "tools/list") {
        return {{"id", id}, {"result", list_tools()}};
    }
    if (method == "cache/stats") {
        return {{"id", id}, {"result", cache_stats()}};
    }
    if (method == "cache/clear") {
        cache_.clear();
        std::cerr << "[server] Cache cleared\n";
        return {{"id", id}, {"result", {{"cleared", true}}}};
    }
    if (method != "tools/call") {
        return error_response(id, kMethodNotFound, "Unknown method: " + method);
    }

    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return error_response(id, kInvalidParams, "tools/call requires a tool name");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

    bool known = false;
    for (const auto& tool : tools_) known = known || tool->tool_name() == name;
    if (!known) return error_response(id, kMethodNotFound, "Unknown tool: " + name);

    ToolResult result = dispatch_tool(name, arguments.dump(), tools_);
    return {
        {"id", id},
        {"result", {
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", result.output}}})},
            {"isError", !result.success}
        }}
    };
}

std::string ToolServer::handle_line(const std::string& line) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return error_response(nullptr, kParseError, std::string("Parse error: ") + e.what()).dump();
    }
    return handle(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ToolServer::serve(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        out << handle_line(line) << '\n' << std::flush;
    }
}

} // namespace crancache
