#pragma once

#include <string>
#include <memory>
#include <vector>
#include "models.h"
#include "message.h"
#include "tools/tool.h"

namespace ChatTemplates {

/// @brief Literal prompt markup of one model family
/// render() folds the message list into a single prompt string; subclasses
/// supply the per-family pieces. Templates hold no mutable state.
class ChatTemplate {
public:
    ChatTemplate(const std::string& model_id, const std::string& system_prompt);
    virtual ~ChatTemplate() = default;

    /// @brief Render the whole conversation, ending with the open assistant turn
    std::string render(const std::vector<ChatMessage>& messages,
                       const std::vector<ToolDefinition>& tools) const;

    // Markup emitted once before everything else (e.g. "<|begin_of_text|>")
    virtual std::string get_prefix() const { return ""; }

    // System block with the tool schema inserted; empty for families that carry it elsewhere
    virtual std::string format_system_message(const std::vector<ToolDefinition>& tools) const = 0;

    // One turn. first_user is true until the first user turn has been emitted.
    virtual std::string format_message(const ChatMessage& msg,
                                       const std::vector<ToolDefinition>& tools,
                                       bool first_user) const = 0;

    // Tool schema block, without leading separator; empty for an empty list
    virtual std::string format_tools(const std::vector<ToolDefinition>& tools) const = 0;

    // Resolved calls of an assistant turn, in the form format_tools() asks the model for
    virtual std::string format_tool_calls(const ToolParser::ToolCallList& calls) const;

    // Get the assistant generation prompt (e.g., "<|im_start|>assistant\n")
    virtual std::string get_generation_prompt() const = 0;

    virtual ModelFamily get_family() const = 0;

protected:
    /// One placeholder line per image, in image order
    std::string format_images(const ChatMessage& msg) const;

    /// Content followed by any resolved tool calls
    std::string format_body(const ChatMessage& msg) const;

    /// Preamble plus tool block
    std::string system_content(const std::vector<ToolDefinition>& tools) const;

    std::string model_id;
    std::string system_prompt;
};

class ChatMLTemplate : public ChatTemplate {
public:
    using ChatTemplate::ChatTemplate;

    std::string format_system_message(const std::vector<ToolDefinition>& tools) const override;
    std::string format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                               bool first_user) const override;
    std::string format_tools(const std::vector<ToolDefinition>& tools) const override;
    std::string format_tool_calls(const ToolParser::ToolCallList& calls) const override;
    std::string get_generation_prompt() const override;
    ModelFamily get_family() const override;
};

// Qwen uses ChatML markup verbatim
class QwenTemplate : public ChatMLTemplate {
public:
    using ChatMLTemplate::ChatMLTemplate;

    ModelFamily get_family() const override;
};

class Llama2Template : public ChatTemplate {
public:
    using ChatTemplate::ChatTemplate;

    std::string format_system_message(const std::vector<ToolDefinition>& tools) const override;
    std::string format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                               bool first_user) const override;
    std::string format_tools(const std::vector<ToolDefinition>& tools) const override;
    std::string get_generation_prompt() const override;
    ModelFamily get_family() const override;
};

class Llama3Template : public ChatTemplate {
public:
    using ChatTemplate::ChatTemplate;

    std::string get_prefix() const override;
    std::string format_system_message(const std::vector<ToolDefinition>& tools) const override;
    std::string format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                               bool first_user) const override;
    std::string format_tools(const std::vector<ToolDefinition>& tools) const override;
    std::string format_tool_calls(const ToolParser::ToolCallList& calls) const override;
    std::string get_generation_prompt() const override;
    ModelFamily get_family() const override;
};

class MistralTemplate : public ChatTemplate {
public:
    using ChatTemplate::ChatTemplate;

    std::string get_prefix() const override;
    std::string format_system_message(const std::vector<ToolDefinition>& tools) const override;
    std::string format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                               bool first_user) const override;
    std::string format_tools(const std::vector<ToolDefinition>& tools) const override;
    std::string get_generation_prompt() const override;
    ModelFamily get_family() const override;
};

class GemmaTemplate : public ChatTemplate {
public:
    using ChatTemplate::ChatTemplate;

    std::string format_system_message(const std::vector<ToolDefinition>& tools) const override;
    std::string format_message(const ChatMessage& msg, const std::vector<ToolDefinition>& tools,
                               bool first_user) const override;
    std::string format_tools(const std::vector<ToolDefinition>& tools) const override;
    std::string get_generation_prompt() const override;
    ModelFamily get_family() const override;
};

class ChatTemplateFactory {
public:
    static std::unique_ptr<ChatTemplate> create(ModelFamily family,
                                                const std::string& model_id,
                                                const std::string& system_prompt);
};

/// @brief Render a prompt for model_id: classify, pick the template, fold the turns
/// @param system_prompt Preamble of the system block (config "system_prompt")
std::string render_prompt(const std::vector<ChatMessage>& messages,
                          const std::vector<ToolDefinition>& tools,
                          const std::string& model_id,
                          const std::string& system_prompt);

/// @brief Same, with the built-in preamble
std::string render_prompt(const std::vector<ChatMessage>& messages,
                          const std::vector<ToolDefinition>& tools,
                          const std::string& model_id);

} // namespace ChatTemplates
