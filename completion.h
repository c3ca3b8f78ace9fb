#pragma once

#include <string>
#include <optional>
#include "nlohmann/json.hpp"
#include "tools/tool_parser.h"

/// @brief Completion payload handed back to the gateway after generation
/// content always carries the complete generated text, tool calls or not.
struct CompletionResponse {
    std::string content;
    bool done = true;
    std::string done_reason = "stop";               // "tool_calls" when calls were found
    std::optional<ToolParser::ToolCallList> tool_calls;

    /// @brief Build a response from raw generated text
    /// Runs the tool-call extractor; calls without an id are numbered call_1, call_2, ...
    static CompletionResponse from_generation(const std::string& raw);

    /// {"content", "done", "done_reason", "tool_calls"?}
    nlohmann::json to_json() const;
};
