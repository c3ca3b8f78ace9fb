#include "modelgate.h"
#include "chat_template.h"
#include "system_prompt.h"
#include "nlohmann/json.hpp"

namespace ChatTemplates {

namespace {

// {"name": "...", "<args_key>": {...}}, the form the tool blocks ask the model to reply in
std::string call_json(const ToolParser::ToolCall& call, const char* args_key) {
    return "{\"name\": " + nlohmann::json(call.name).dump() +
           ", \"" + args_key + "\": " + call.arguments.dump() + "}";
}

std::string join_calls(const ToolParser::ToolCallList& calls, const char* args_key) {
    std::string out;
    for (size_t i = 0; i < calls.size(); i++) {
        if (i > 0) out += "\n";
        out += call_json(calls[i], args_key);
    }
    return out;
}

// Shared by Mistral and Gemma: the definitions as one JSON array
std::string json_array_tool_block(const std::vector<ToolDefinition>& tools) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& tool : tools) {
        array.push_back(tool.to_json());
    }
    return "Available tools:\n" + array.dump() +
           "\n\nTo call a tool, respond with JSON: {\"name\": \"tool_name\", \"arguments\": {...}}";
}

bool is_conversation_turn(const ChatMessage& msg) {
    return msg.role == ChatMessage::USER || msg.role == ChatMessage::ASSISTANT;
}

} // namespace

// ==================== ChatTemplate ====================

ChatTemplate::ChatTemplate(const std::string& model_id, const std::string& system_prompt)
    : model_id(model_id), system_prompt(system_prompt) {}

std::string ChatTemplate::render(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolDefinition>& tools) const {
    std::string prompt = get_prefix();
    prompt += format_system_message(tools);

    bool first_user = true;
    for (const auto& msg : messages) {
        prompt += format_message(msg, tools, first_user);
        if (msg.role == ChatMessage::USER) {
            first_user = false;
        }
    }

    prompt += get_generation_prompt();

    LOG_DEBUG("Rendered " + Models::family_name(get_family()) + " prompt: " +
              std::to_string(messages.size()) + " messages, " + std::to_string(tools.size()) +
              " tools, " + std::to_string(prompt.length()) + " chars");
    return prompt;
}

std::string ChatTemplate::format_tool_calls(const ToolParser::ToolCallList& calls) const {
    return join_calls(calls, "arguments");
}

std::string ChatTemplate::format_images(const ChatMessage& msg) const {
    std::string out;
    for (size_t i = 0; i < msg.images.size(); i++) {
        out += Models::image_token(model_id, i) + "\n";
    }
    return out;
}

std::string ChatTemplate::format_body(const ChatMessage& msg) const {
    std::string body = msg.content;
    if (msg.role == ChatMessage::ASSISTANT && msg.has_tool_calls()) {
        if (!body.empty()) body += "\n";
        body += format_tool_calls(*msg.tool_calls);
    }
    return body;
}

std::string ChatTemplate::system_content(const std::vector<ToolDefinition>& tools) const {
    if (tools.empty()) {
        return system_prompt;
    }
    return system_prompt + "\n\n" + format_tools(tools);
}

// ==================== ChatMLTemplate ====================

std::string ChatMLTemplate::format_system_message(const std::vector<ToolDefinition>& tools) const {
    return "<|im_start|>system\n" + system_content(tools) + "<|im_end|>\n";
}

std::string ChatMLTemplate::format_message(const ChatMessage& msg, const std::vector<ToolDefinition>&,
                                           bool) const {
    return "<|im_start|>" + msg.get_role() + "\n" + format_images(msg) + format_body(msg) + "<|im_end|>\n";
}

std::string ChatMLTemplate::format_tools(const std::vector<ToolDefinition>& tools) const {
    if (tools.empty()) return "";

    std::string formatted = "# Tools\n\nYou may call one or more functions to assist with the user query.\n\n";
    formatted += "You are provided with function signatures within <tools></tools> XML tags:\n<tools>\n";
    for (const auto& tool : tools) {
        formatted += tool.to_json().dump() + "\n";
    }
    formatted += "</tools>\n\n";
    formatted += "For each function call, return a json object with function name and arguments within <tool_call></tool_call> XML tags:\n";
    formatted += "<tool_call>\n{\"name\": <function-name>, \"arguments\": <args-json-object>}\n</tool_call>";
    return formatted;
}

std::string ChatMLTemplate::format_tool_calls(const ToolParser::ToolCallList& calls) const {
    std::string out;
    for (size_t i = 0; i < calls.size(); i++) {
        if (i > 0) out += "\n";
        out += "<tool_call>\n" + call_json(calls[i], "arguments") + "\n</tool_call>";
    }
    return out;
}

std::string ChatMLTemplate::get_generation_prompt() const {
    return "<|im_start|>assistant\n";
}

ModelFamily ChatMLTemplate::get_family() const {
    return ModelFamily::CHATML;
}

ModelFamily QwenTemplate::get_family() const {
    return ModelFamily::QWEN;
}

// ==================== Llama2Template ====================

std::string Llama2Template::format_system_message(const std::vector<ToolDefinition>& tools) const {
    // Left open: the first user turn completes this [INST]
    return "[INST] <<SYS>>\n" + system_content(tools) + "\n<</SYS>>\n\n";
}

std::string Llama2Template::format_message(const ChatMessage& msg, const std::vector<ToolDefinition>&,
                                           bool first_user) const {
    if (!is_conversation_turn(msg)) {
        LOG_DEBUG("Llama2Template: skipping " + msg.get_role() + " message");
        return "";
    }

    if (msg.role == ChatMessage::USER) {
        std::string open = first_user ? "" : "[INST] ";
        return open + format_images(msg) + msg.content + " [/INST]";
    }

    return " " + format_images(msg) + format_body(msg) + " </s><s>";
}

std::string Llama2Template::format_tools(const std::vector<ToolDefinition>& tools) const {
    if (tools.empty()) return "";

    std::string formatted = "Available tools:\n";
    for (const auto& tool : tools) {
        formatted += "- " + tool.name + ": " + tool.description + "\n";
    }
    formatted += "\nTo use a tool, respond with JSON: {\"name\": \"tool_name\", \"arguments\": {...}}";
    return formatted;
}

std::string Llama2Template::get_generation_prompt() const {
    return "";  // Generation follows directly after [/INST]
}

ModelFamily Llama2Template::get_family() const {
    return ModelFamily::LLAMA_2;
}

// ==================== Llama3Template ====================

std::string Llama3Template::get_prefix() const {
    return "<|begin_of_text|>";
}

std::string Llama3Template::format_system_message(const std::vector<ToolDefinition>& tools) const {
    return "<|start_header_id|>system<|end_header_id|>\n\n" + system_content(tools) + "<|eot_id|>";
}

std::string Llama3Template::format_message(const ChatMessage& msg, const std::vector<ToolDefinition>&,
                                           bool) const {
    return "<|start_header_id|>" + msg.get_role() + "<|end_header_id|>\n\n" +
           format_images(msg) + format_body(msg) + "<|eot_id|>";
}

std::string Llama3Template::format_tools(const std::vector<ToolDefinition>& tools) const {
    if (tools.empty()) return "";

    // BFCL-style schema listing
    std::string formatted = "The following functions are available IF needed to answer the user's request:\n\n";
    formatted += "IMPORTANT: Only call a function if you actually need external information or capabilities. ";
    formatted += "For greetings, casual conversation, or questions you can answer directly - respond normally without calling any function.\n\n";
    formatted += "When you DO need to call a function, respond with ONLY a JSON object in this format: ";
    formatted += "{\"name\": function name, \"parameters\": dictionary of argument name and its value}. Do not use variables.\n";

    for (const auto& tool : tools) {
        formatted += "\n- " + tool.name + ": " + tool.description;
        if (!tool.parameters.empty()) {
            formatted += "\n  Parameters: " + tool.parameters.dump();
        }
    }
    return formatted;
}

std::string Llama3Template::format_tool_calls(const ToolParser::ToolCallList& calls) const {
    return join_calls(calls, "parameters");
}

std::string Llama3Template::get_generation_prompt() const {
    return "<|start_header_id|>assistant<|end_header_id|>\n\n";
}

ModelFamily Llama3Template::get_family() const {
    return ModelFamily::LLAMA_3;
}

// ==================== MistralTemplate ====================

std::string MistralTemplate::get_prefix() const {
    return "<s>";
}

std::string MistralTemplate::format_system_message(const std::vector<ToolDefinition>&) const {
    return "";  // Carried inside the first [INST]
}

std::string MistralTemplate::format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                                            bool first_user) const {
    if (!is_conversation_turn(msg)) {
        LOG_DEBUG("MistralTemplate: skipping " + msg.get_role() + " message");
        return "";
    }

    if (msg.role == ChatMessage::USER) {
        std::string preamble = first_user ? system_content(tools) + "\n\n" : "";
        return "[INST] " + preamble + format_images(msg) + msg.content + " [/INST]";
    }

    return format_images(msg) + format_body(msg) + "</s>";
}

std::string MistralTemplate::format_tools(const std::vector<ToolDefinition>& tools) const {
    if (tools.empty()) return "";
    return json_array_tool_block(tools);
}

std::string MistralTemplate::get_generation_prompt() const {
    return "";
}

ModelFamily MistralTemplate::get_family() const {
    return ModelFamily::MISTRAL;
}

// ==================== GemmaTemplate ====================

std::string GemmaTemplate::format_system_message(const std::vector<ToolDefinition>&) const {
    return "";  // Gemma has no system turn
}

std::string GemmaTemplate::format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                                          bool) const {
    if (!is_conversation_turn(msg)) {
        LOG_DEBUG("GemmaTemplate: skipping " + msg.get_role() + " message");
        return "";
    }

    if (msg.role == ChatMessage::USER) {
        std::string formatted = "<start_of_turn>user\n" + format_images(msg) + msg.content;
        if (!tools.empty()) {
            formatted += "\n\n" + format_tools(tools);
        }
        return formatted + "<end_of_turn>\n";
    }

    return "<start_of_turn>model\n" + format_images(msg) + format_body(msg) + "<end_of_turn>\n";
}

std::string GemmaTemplate::format_tools(const std::vector<ToolDefinition>& tools) const {
    if (tools.empty()) return "";
    return json_array_tool_block(tools);
}

std::string GemmaTemplate::get_generation_prompt() const {
    return "<start_of_turn>model\n";
}

ModelFamily GemmaTemplate::get_family() const {
    return ModelFamily::GEMMA;
}

// ==================== ChatTemplateFactory ====================

std::unique_ptr<ChatTemplate> ChatTemplateFactory::create(ModelFamily family,
                                                          const std::string& model_id,
                                                          const std::string& system_prompt) {
    LOG_DEBUG("ChatTemplateFactory creating template for family: " + Models::family_name(family));

    switch (family) {
        case ModelFamily::QWEN:
            return std::make_unique<QwenTemplate>(model_id, system_prompt);
        case ModelFamily::LLAMA_2:
            return std::make_unique<Llama2Template>(model_id, system_prompt);
        case ModelFamily::LLAMA_3:
            return std::make_unique<Llama3Template>(model_id, system_prompt);
        case ModelFamily::MISTRAL:
            return std::make_unique<MistralTemplate>(model_id, system_prompt);
        case ModelFamily::GEMMA:
            return std::make_unique<GemmaTemplate>(model_id, system_prompt);
        case ModelFamily::CHATML:
            return std::make_unique<ChatMLTemplate>(model_id, system_prompt);
    }

    return std::make_unique<ChatMLTemplate>(model_id, system_prompt);
}

std::string render_prompt(const std::vector<ChatMessage>& messages,
                          const std::vector<ToolDefinition>& tools,
                          const std::string& model_id,
                          const std::string& system_prompt) {
    auto tmpl = ChatTemplateFactory::create(Models::detect_family(model_id), model_id, system_prompt);
    return tmpl->render(messages, tools);
}

std::string render_prompt(const std::vector<ChatMessage>& messages,
                          const std::vector<ToolDefinition>& tools,
                          const std::string& model_id) {
    return render_prompt(messages, tools, model_id, SYSTEM_PROMPT);
}

} // namespace ChatTemplates
