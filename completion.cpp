#include "modelgate.h"
#include "completion.h"

CompletionResponse CompletionResponse::from_generation(const std::string& raw) {
    ToolParser::ExtractionResult extracted = ToolParser::extract_tool_calls(raw);

    CompletionResponse response;
    response.content = extracted.content;

    if (extracted.has_tool_calls()) {
        ToolParser::ToolCallList calls = *extracted.tool_calls;
        for (size_t i = 0; i < calls.size(); i++) {
            if (!calls[i].tool_call_id) {
                calls[i].tool_call_id = "call_" + std::to_string(i + 1);
            }
        }
        response.tool_calls = std::move(calls);
        response.done_reason = "tool_calls";
        LOG_DEBUG("Completion carries " + std::to_string(response.tool_calls->size()) + " tool call(s)");
    }

    return response;
}

nlohmann::json CompletionResponse::to_json() const {
    nlohmann::json j;
    j["content"] = content;
    j["done"] = done;
    j["done_reason"] = done_reason;

    if (tool_calls) {
        j["tool_calls"] = nlohmann::json::array();
        for (const auto& call : *tool_calls) {
            j["tool_calls"].push_back(call.to_json());
        }
    }
    return j;
}
