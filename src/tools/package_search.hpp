#pragma once
#include "../tool.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace crancache {

class PackageSearchTool : public Tool {
public:
    static constexpr uint64_t kCacheTtlMs = 15 * 60 * 1000;
    static constexpr uint64_t kPackageListTtlMs = 60 * 60 * 1000;
    static constexpr uint32_t kDefaultLimit = 20;
    static constexpr uint32_t kMaxLimit = 100;
    static constexpr size_t kMaxQueryLength = 200;

    explicit PackageSearchTool(const ToolContext& ctx) : ctx_(ctx) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "search_packages_from_cran"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    // Every CRAN package name, served from the cache when possible.
    std::vector<std::string> package_names();

    ToolContext ctx_;
};

} // namespace crancache
