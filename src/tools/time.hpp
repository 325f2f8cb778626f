#pragma once
#include "../tool.hpp"

namespace tether {

class TimeTool : public Tool {
public:
    std::string execute(const nlohmann::json& args) override;
    ToolDefinition definition() const override;
};

} // namespace tether
