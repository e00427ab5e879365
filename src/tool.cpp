#include "tool.hpp"
#include "tools/package_info.hpp"
#include "tools/package_readme.hpp"
#include "tools/package_search.hpp"

namespace crancache {

std::vector<std::unique_ptr<Tool>> create_package_tools(const ToolContext& ctx) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<PackageReadmeTool>(ctx));
    tools.push_back(std::make_unique<PackageInfoTool>(ctx));
    tools.push_back(std::make_unique<PackageSearchTool>(ctx));
    return tools;
}

ToolResult dispatch_tool(const std::string& name, const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) {
            return tool->execute(args_json);
        }
    }
    return ToolResult{false, "Unknown tool: " + name};
}

} // namespace crancache
