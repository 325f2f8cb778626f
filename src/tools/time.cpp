#include "time.hpp"
#include "../util.hpp"

namespace tether {

std::string TimeTool::execute(const nlohmann::json& /*args*/) {
    return local_time_string("%Y-%m-%d %H:%M:%S");
}

ToolDefinition TimeTool::definition() const {
    return ToolDefinition{
        "tool_time",
        "Return current local time string in format YYYY-MM-DD HH:MM:SS.",
        {}
    };
}

} // namespace tether
