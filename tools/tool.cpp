#include "tool.h"

#include <stdexcept>

nlohmann::json ToolDefinition::to_json() const {
    nlohmann::json tool_json;
    tool_json["type"] = type;
    tool_json["function"]["name"] = name;
    tool_json["function"]["description"] = description;
    tool_json["function"]["parameters"] = parameters;
    return tool_json;
}

ToolDefinition ToolDefinition::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("tool definition must be a JSON object");
    }

    // OpenAI nests the function under "function", bare definitions don't
    const nlohmann::json& fn = (j.contains("function") && j["function"].is_object()) ? j["function"] : j;

    if (!fn.contains("name") || !fn["name"].is_string()) {
        throw std::invalid_argument("tool definition is missing a function name");
    }

    ToolDefinition tool;
    tool.name = fn["name"].get<std::string>();
    if (j.contains("type") && j["type"].is_string()) {
        tool.type = j["type"].get<std::string>();
    }
    if (fn.contains("description") && fn["description"].is_string()) {
        tool.description = fn["description"].get<std::string>();
    }
    if (fn.contains("parameters") && fn["parameters"].is_object()) {
        tool.parameters = fn["parameters"];
    }
    return tool;
}

namespace tool_utils {

std::vector<ToolDefinition> tools_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("tools must be a JSON array");
    }
    std::vector<ToolDefinition> tools;
    tools.reserve(j.size());
    for (const auto& entry : j) {
        tools.push_back(ToolDefinition::from_json(entry));
    }
    return tools;
}

} // namespace tool_utils
