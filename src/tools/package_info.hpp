#pragma once
#include "../tool.hpp"
#include <cstdint>

namespace crancache {

class PackageInfoTool : public Tool {
public:
    static constexpr uint64_t kCacheTtlMs = 30 * 60 * 1000;

    explicit PackageInfoTool(const ToolContext& ctx) : ctx_(ctx) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_package_info_from_cran"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ToolContext ctx_;
};

} // namespace crancache
