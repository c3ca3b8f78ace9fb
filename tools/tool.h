#pragma once

#include <string>
#include <vector>
#include "nlohmann/json.hpp"

/// @brief A callable function offered to the model, as supplied by the gateway's caller
/// Order of a tool list is significant and is preserved by every template.
struct ToolDefinition {
    std::string type = "function";
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();  // JSON schema object

    ToolDefinition() = default;
    ToolDefinition(const std::string& n, const std::string& d,
                   const nlohmann::json& p = nlohmann::json::object())
        : name(n), description(d), parameters(p) {}

    /// @brief OpenAI wire form: {"type":"function","function":{"name","description","parameters"}}
    nlohmann::json to_json() const;

    /// @brief Decode either the OpenAI wire form or a bare {"name","description","parameters"} object
    /// @throws std::invalid_argument if no function name is present
    static ToolDefinition from_json(const nlohmann::json& j);
};

namespace tool_utils {
    /// @brief Decode a tools array, preserving order
    /// @throws std::invalid_argument if the value is not an array or an entry has no name
    std::vector<ToolDefinition> tools_from_json(const nlohmann::json& j);
}
