#include <gtest/gtest.h>
#include "message.h"
#include "tools/tool.h"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

// =============================================================================
// Role conversion tests
// =============================================================================

TEST(MessageTest, StringToRole) {
    EXPECT_EQ(ChatMessage::stringToRole("system"), ChatMessage::SYSTEM);
    EXPECT_EQ(ChatMessage::stringToRole("user"), ChatMessage::USER);
    EXPECT_EQ(ChatMessage::stringToRole("assistant"), ChatMessage::ASSISTANT);
    EXPECT_EQ(ChatMessage::stringToRole("tool"), ChatMessage::TOOL);
}

TEST(MessageTest, StringToRoleUnknown) {
    // Unknown role defaults to USER
    EXPECT_EQ(ChatMessage::stringToRole("unknown"), ChatMessage::USER);
    EXPECT_EQ(ChatMessage::stringToRole(""), ChatMessage::USER);
}

TEST(MessageTest, GetRole) {
    EXPECT_EQ(ChatMessage(ChatMessage::SYSTEM, "").get_role(), "system");
    EXPECT_EQ(ChatMessage(ChatMessage::USER, "").get_role(), "user");
    EXPECT_EQ(ChatMessage(ChatMessage::ASSISTANT, "").get_role(), "assistant");
    EXPECT_EQ(ChatMessage(ChatMessage::TOOL, "").get_role(), "tool");
}

// =============================================================================
// from_json tests
// =============================================================================

TEST(MessageTest, FromJsonBasic) {
    ChatMessage msg = ChatMessage::from_json(json::parse(R"({"role": "assistant", "content": "Hi there"})"));

    EXPECT_EQ(msg.role, ChatMessage::ASSISTANT);
    EXPECT_EQ(msg.content, "Hi there");
    EXPECT_TRUE(msg.images.empty());
    EXPECT_FALSE(msg.has_tool_calls());
}

TEST(MessageTest, FromJsonNullContentAndMissingRole) {
    ChatMessage msg = ChatMessage::from_json(json::parse(R"({"content": null})"));

    EXPECT_EQ(msg.role, ChatMessage::USER);
    EXPECT_EQ(msg.content, "");
}

TEST(MessageTest, FromJsonImagesKeepOrder) {
    ChatMessage msg = ChatMessage::from_json(
        json::parse(R"({"role": "user", "content": "look", "images": ["first.png", "second.png"]})"));

    ASSERT_EQ(msg.images.size(), 2u);
    EXPECT_EQ(msg.images[0], "first.png");
    EXPECT_EQ(msg.images[1], "second.png");
}

TEST(MessageTest, FromJsonAssistantToolCalls) {
    ChatMessage msg = ChatMessage::from_json(json::parse(R"({
        "role": "assistant",
        "content": null,
        "tool_calls": [
            {"id": "call_1", "type": "function",
             "function": {"name": "get_weather", "arguments": "{\"location\": \"SF\"}"}}
        ]
    })"));

    ASSERT_TRUE(msg.has_tool_calls());
    EXPECT_EQ((*msg.tool_calls)[0].name, "get_weather");
    EXPECT_EQ((*msg.tool_calls)[0].arguments["location"], "SF");
    EXPECT_EQ((*msg.tool_calls)[0].tool_call_id.value_or(""), "call_1");
}

TEST(MessageTest, FromJsonToolCallsOnlyForAssistant) {
    ChatMessage msg = ChatMessage::from_json(json::parse(
        R"({"role": "user", "content": "x", "tool_calls": [{"name": "f", "arguments": {}}]})"));

    EXPECT_FALSE(msg.has_tool_calls());
}

TEST(MessageTest, FromJsonRejectsBadTypes) {
    EXPECT_THROW(ChatMessage::from_json(json::array()), std::invalid_argument);
    EXPECT_THROW(ChatMessage::from_json(json::parse(R"({"role": 3})")), std::invalid_argument);
    EXPECT_THROW(ChatMessage::from_json(json::parse(R"({"content": 3})")), std::invalid_argument);
    EXPECT_THROW(ChatMessage::from_json(json::parse(R"({"images": "a.png"})")), std::invalid_argument);
    EXPECT_THROW(ChatMessage::from_json(json::parse(R"({"images": [1]})")), std::invalid_argument);
}

TEST(MessageTest, MessagesFromJson) {
    auto messages = messages_from_json(json::parse(R"([
        {"role": "system", "content": "rules"},
        {"role": "user", "content": "hello"}
    ])"));

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].role, ChatMessage::SYSTEM);
    EXPECT_EQ(messages[1].content, "hello");

    EXPECT_THROW(messages_from_json(json::object()), std::invalid_argument);
}

TEST(MessageTest, StreamOutput) {
    ChatMessage msg(ChatMessage::USER, "hello", {"a.png"});
    std::ostringstream os;
    os << msg;
    EXPECT_EQ(os.str(), "user: hello [images: 1]");
}

// =============================================================================
// ToolDefinition tests
// =============================================================================

TEST(ToolDefinitionTest, FromJsonOpenAIForm) {
    ToolDefinition tool = ToolDefinition::from_json(json::parse(R"({
        "type": "function",
        "function": {"name": "get_weather", "description": "Weather lookup",
                     "parameters": {"type": "object"}}
    })"));

    EXPECT_EQ(tool.type, "function");
    EXPECT_EQ(tool.name, "get_weather");
    EXPECT_EQ(tool.description, "Weather lookup");
    EXPECT_EQ(tool.parameters["type"], "object");
}

TEST(ToolDefinitionTest, FromJsonBareForm) {
    ToolDefinition tool = ToolDefinition::from_json(json::parse(R"({"name": "ping"})"));

    EXPECT_EQ(tool.name, "ping");
    EXPECT_EQ(tool.description, "");
    EXPECT_TRUE(tool.parameters.is_object());
}

TEST(ToolDefinitionTest, FromJsonRequiresName) {
    EXPECT_THROW(ToolDefinition::from_json(json::parse(R"({"function": {"description": "x"}})")),
                 std::invalid_argument);
    EXPECT_THROW(ToolDefinition::from_json(json("ping")), std::invalid_argument);
}

TEST(ToolDefinitionTest, ToJsonWireForm) {
    ToolDefinition tool("get_weather", "Weather lookup");
    json j = tool.to_json();

    EXPECT_EQ(j["type"], "function");
    EXPECT_EQ(j["function"]["name"], "get_weather");
    EXPECT_EQ(j["function"]["description"], "Weather lookup");
    EXPECT_TRUE(j["function"]["parameters"].is_object());
}

TEST(ToolDefinitionTest, ToolsFromJsonKeepOrder) {
    auto tools = tool_utils::tools_from_json(json::parse(R"([
        {"type": "function", "function": {"name": "b"}},
        {"name": "a"}
    ])"));

    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "b");
    EXPECT_EQ(tools[1].name, "a");

    EXPECT_THROW(tool_utils::tools_from_json(json::object()), std::invalid_argument);
}
