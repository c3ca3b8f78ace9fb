#include "message.h"

#include <stdexcept>

using json = nlohmann::json;

ChatMessage ChatMessage::from_json(const json& j) {
	if (!j.is_object()) {
		throw std::invalid_argument("message must be a JSON object");
	}

	std::string role_str = "user";
	if (j.contains("role")) {
		if (!j["role"].is_string()) {
			throw std::invalid_argument("message role must be a string");
		}
		role_str = j["role"].get<std::string>();
	}

	std::string content;
	if (j.contains("content") && !j["content"].is_null()) {
		if (!j["content"].is_string()) {
			throw std::invalid_argument("message content must be a string");
		}
		content = j["content"].get<std::string>();
	}

	ChatMessage msg(stringToRole(role_str), content);

	if (j.contains("images") && !j["images"].is_null()) {
		if (!j["images"].is_array()) {
			throw std::invalid_argument("message images must be an array");
		}
		for (const auto& image : j["images"]) {
			if (!image.is_string()) {
				throw std::invalid_argument("image references must be strings");
			}
			msg.images.push_back(image.get<std::string>());
		}
	}

	// Resolved calls go through the same normalization as model output
	if (msg.role == ASSISTANT && j.contains("tool_calls") && j["tool_calls"].is_array()) {
		json wrapper = {{"tool_calls", j["tool_calls"]}};
		msg.tool_calls = ToolParser::match_tool_calls_object(wrapper);
	}

	return msg;
}

std::vector<ChatMessage> messages_from_json(const json& j) {
	if (!j.is_array()) {
		throw std::invalid_argument("messages must be a JSON array");
	}
	std::vector<ChatMessage> messages;
	messages.reserve(j.size());
	for (const auto& entry : j) {
		messages.push_back(ChatMessage::from_json(entry));
	}
	return messages;
}
