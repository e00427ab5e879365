#pragma once
#include "tool.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace crancache {

class ResponseCache;

// JSON-RPC style request handling for the package tools.
//
// Request:  {"id": ..., "method": "tools/list" | "tools/call" | "cache/stats" | "cache/clear",
//            "params": {...}}
// Response: {"id": ..., "result": ...} or {"id": ..., "error": {"code", "message"}}
class ToolServer {
public:
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;

    ToolServer(std::vector<std::unique_ptr<Tool>> tools, ResponseCache& cache);

    nlohmann::json handle(const nlohmann::json& request);

    // Parse one line and handle it; malformed JSON yields a parse error response.
    std::string handle_line(const std::string& line);

    // One request per input line, one response per output line, until EOF.
    void serve(std::istream& in, std::ostream& out);

    const std::vector<std::unique_ptr<Tool>>& tools() const { return tools_; }

private:
    nlohmann::json list_tools() const;
    nlohmann::json cache_stats() const;

    std::vector<std::unique_ptr<Tool>> tools_;
    ResponseCache& cache_;
};

} // namespace crancache
