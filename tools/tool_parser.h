#pragma once

#include <string>
#include <vector>
#include <optional>
#include "nlohmann/json.hpp"

namespace ToolParser {

/// @brief Canonical tool call, independent of the JSON shape the model emitted
struct ToolCall {
    std::optional<std::string> tool_call_id;  // Only set when the model supplied one
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    ToolCall() = default;
    ToolCall(const std::string& n, const nlohmann::json& args,
             const std::optional<std::string>& id = std::nullopt)
        : tool_call_id(id), name(n), arguments(args) {}

    /// @brief Chat-completion wire form: {"id"?, "type":"function","function":{"name","arguments"}}
    nlohmann::json to_json() const;

    bool operator==(const ToolCall& other) const {
        return tool_call_id == other.tool_call_id && name == other.name && arguments == other.arguments;
    }
};

using ToolCallList = std::vector<ToolCall>;

/// @brief Output of extract_tool_calls
/// content is always the complete raw text, whether or not calls were found.
struct ExtractionResult {
    std::string content;
    std::optional<ToolCallList> tool_calls;

    bool has_tool_calls() const { return tool_calls.has_value() && !tool_calls->empty(); }
};

/// @brief One shape matcher: parsed JSON in, calls out (nullopt = shape not present)
using ShapeMatcher = std::optional<ToolCallList> (*)(const nlohmann::json&);

struct Strategy {
    const char* name;
    ShapeMatcher match;
};

// Individual shapes, tried in the order of strategies()

/// {"tool_calls": [{"function": {...}} | {"name": ..., "arguments": ...}, ...]}
std::optional<ToolCallList> match_tool_calls_object(const nlohmann::json& j);

/// [{"name": ..., "arguments": ...}, ...]
std::optional<ToolCallList> match_call_array(const nlohmann::json& j);

/// {"name": ..., "arguments": ...}
std::optional<ToolCallList> match_single_call(const nlohmann::json& j);

/// {"get_weather": {"location": "NYC"}}
std::optional<ToolCallList> match_name_as_key(const nlohmann::json& j);

/// {"function": {"name": ..., "arguments": ...}}
std::optional<ToolCallList> match_function_object(const nlohmann::json& j);

/// @brief The ordered strategy chain; first match wins
const std::vector<Strategy>& strategies();

/// @brief Run the strategy chain against one parsed JSON value
std::optional<ToolCallList> match_json(const nlohmann::json& j);

/// @brief Parse text as JSON, retrying with single quotes/backticks normalized to double quotes
/// @return nullopt if the text is not JSON in either form
std::optional<nlohmann::json> parse_json(const std::string& text);

/// @brief Find the first brace-delimited substring that parses as a JSON object
/// @param response Text possibly containing JSON surrounded by prose
/// @return The substring, or empty string if there is none
std::string extract_json(const std::string& response);

/// @brief Separate structured tool calls from raw generated text
/// Never throws; malformed or partial JSON is treated as "no tool call".
ExtractionResult extract_tool_calls(const std::string& text);

} // namespace ToolParser
