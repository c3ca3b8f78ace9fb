#pragma once

#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include "nlohmann/json.hpp"
#include "tools/tool_parser.h"

/// @brief One family-agnostic conversation turn
struct ChatMessage {
	enum Role {
		SYSTEM,
		USER,
		ASSISTANT,
		TOOL            // Result of a tool execution
	};

	Role role;
	std::string content;

	// Opaque image references, in the order their placeholders are emitted
	std::vector<std::string> images;

	// Calls the assistant already made (assistant turns only)
	std::optional<ToolParser::ToolCallList> tool_calls;

	ChatMessage(Role r, const std::string& c, const std::vector<std::string>& imgs = {})
		: role(r), content(c), images(imgs) {}

	// Convert role string to Role enum
	static Role stringToRole(const std::string& roleStr) {
		if (roleStr == "system") return SYSTEM;
		if (roleStr == "user") return USER;
		if (roleStr == "assistant") return ASSISTANT;
		if (roleStr == "tool") return TOOL;
		return USER;  // Default fallback
	}

	std::string get_role() const {
		switch (role) {
			case SYSTEM: return "system";
			case USER: return "user";
			case ASSISTANT: return "assistant";
			case TOOL: return "tool";
			default: return "user";
		}
	}

	bool has_tool_calls() const {
		return tool_calls.has_value() && !tool_calls->empty();
	}

	/// @brief Decode an OpenAI-style message object
	/// Accepts {"role", "content" (string or null), "images" (array of strings),
	/// "tool_calls" (canonical or OpenAI form)}. Unknown roles decode as user.
	/// @throws std::invalid_argument if the value is not an object or a field has the wrong type
	static ChatMessage from_json(const nlohmann::json& j);
};

/// @brief Decode a messages array, preserving order
/// @throws std::invalid_argument on the first malformed message
std::vector<ChatMessage> messages_from_json(const nlohmann::json& j);

inline std::ostream& operator<<(std::ostream& os, const ChatMessage& msg) {
	os << msg.get_role() << ": ";
	if (msg.content.length() > 100) {
		os << msg.content.substr(0, 100) << "...";
	} else {
		os << msg.content;
	}
	if (!msg.images.empty()) {
		os << " [images: " << msg.images.size() << "]";
	}
	if (msg.has_tool_calls()) {
		os << " [tool_calls: " << msg.tool_calls->size() << "]";
	}
	return os;
}
