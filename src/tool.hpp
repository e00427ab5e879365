#pragma once
#include <string>
#include <memory>
#include <vector>

namespace crancache {

class ResponseCache;
class CranApi;
class GitHubApi;

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output; // response JSON on success, message on failure
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Collaborators shared by the package tools. Not owned.
struct ToolContext {
    ResponseCache& cache;
    CranApi& cran;
    GitHubApi& github;
};

// Create the CRAN lookup tools
std::vector<std::unique_ptr<Tool>> create_package_tools(const ToolContext& ctx);

// Execute a tool by name
ToolResult dispatch_tool(const std::string& name, const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools);

} // namespace crancache
