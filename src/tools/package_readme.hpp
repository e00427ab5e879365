#pragma once
#include "../tool.hpp"
#include <cstdint>

namespace crancache {

class PackageReadmeTool : public Tool {
public:
    static constexpr uint64_t kCacheTtlMs = 60 * 60 * 1000;

    explicit PackageReadmeTool(const ToolContext& ctx) : ctx_(ctx) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_readme_from_cran"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ToolContext ctx_;
};

// Markdown README assembled from DESCRIPTION metadata when no repository README exists.
std::string basic_readme(const std::string& package_name, const std::string& version,
                         const std::string& title, const std::string& description);

} // namespace crancache
