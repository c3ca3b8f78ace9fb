#include "modelgate.h"
#include "tool_parser.h"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <utility>

namespace ToolParser {

using json = nlohmann::json;

json ToolCall::to_json() const {
    json call;
    if (tool_call_id.has_value()) {
        call["id"] = *tool_call_id;
    }
    call["type"] = "function";
    call["function"]["name"] = name;
    call["function"]["arguments"] = arguments;
    return call;
}

// Convert non-standard string delimiters to JSON double-quoted strings
// Handles: {'key': 'value'} -> {"key": "value"}  (Python single quotes)
//          {`key`: `value`} -> {"key": "value"}  (JavaScript backticks)
static std::string fix_nonstandard_quotes(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    bool in_double_string = false;
    bool in_alt_string = false;  // single quote or backtick
    char alt_char = 0;           // which alt delimiter we're in
    bool escape_next = false;

    for (char c : input) {
        if (escape_next) {
            result += c;
            escape_next = false;
            continue;
        }

        if (c == '\\') {
            result += c;
            escape_next = true;
            continue;
        }

        if (c == '"' && !in_alt_string) {
            in_double_string = !in_double_string;
            result += c;
        } else if ((c == '\'' || c == '`') && !in_double_string) {
            if (!in_alt_string) {
                in_alt_string = true;
                alt_char = c;
                result += '"';
            } else if (c == alt_char) {
                in_alt_string = false;
                alt_char = 0;
                result += '"';
            } else {
                // Different alt char inside - just pass through
                result += c;
            }
        } else if (in_alt_string && c == '"') {
            // Escape double quotes inside what was an alt-quoted string
            result += "\\\"";
        } else {
            result += c;
        }
    }

    return result;
}

std::optional<json> parse_json(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::exception&) {
        // fall through to the quote fix
    }

    if (text.find('\'') == std::string::npos && text.find('`') == std::string::npos) {
        return std::nullopt;
    }

    try {
        return json::parse(fix_nonstandard_quotes(text));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// Offsets of every balanced {...} span, ordered by opening brace.
// One pass with a stack of open braces; a brace that never closes yields no span.
// Double-quoted strings are only tracked inside a brace, so quotes in prose are ignored.
static std::vector<std::pair<size_t, size_t>> find_object_spans(const std::string& s) {
    std::vector<std::pair<size_t, size_t>> spans;
    std::vector<size_t> open;
    bool in_string = false;
    bool escape_next = false;

    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (in_string) {
            if (escape_next) {
                escape_next = false;
            } else if (c == '\\') {
                escape_next = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"' && !open.empty()) {
            in_string = true;
        } else if (c == '{') {
            open.push_back(i);
        } else if (c == '}' && !open.empty()) {
            spans.emplace_back(open.back(), i);
            open.pop_back();
        }
    }

    std::sort(spans.begin(), spans.end());
    return spans;
}

std::string extract_json(const std::string& response) {
    // An unbalanced opening brace (truncated output) produces no span, so a
    // complete object nested inside it can still be found
    for (const auto& [start, end] : find_object_spans(response)) {
        std::string candidate = response.substr(start, end - start + 1);
        auto parsed = parse_json(candidate);
        if (parsed.has_value() && parsed->is_object()) {
            return candidate;
        }
    }
    return "";
}

// Arguments may arrive as an object, as a JSON-encoded string (OpenAI wire form),
// under "parameters" instead of "arguments", or not at all.
// keep_raw: a value that is not an object is carried through unchanged instead of
// rejecting the call. Entries under "tool_calls" are calls whatever their payload.
static std::optional<json> normalize_arguments(const json& call, bool keep_raw) {
    const json* args = nullptr;
    if (call.contains("arguments")) {
        args = &call["arguments"];
    } else if (call.contains("parameters")) {
        args = &call["parameters"];
    }

    if (args == nullptr || args->is_null()) {
        return json::object();
    }
    if (args->is_object()) {
        return *args;
    }
    if (args->is_string()) {
        std::string encoded = modelgate::trim(args->get<std::string>());
        if (encoded.empty()) {
            return json::object();
        }
        auto decoded = parse_json(encoded);
        if (decoded.has_value() && decoded->is_object()) {
            return decoded;
        }
    }

    if (keep_raw) {
        return *args;
    }
    return std::nullopt;
}

static std::optional<std::string> call_id(const json& call) {
    if (call.contains("id") && call["id"].is_string()) {
        return call["id"].get<std::string>();
    }
    if (call.contains("tool_call_id") && call["tool_call_id"].is_string()) {
        return call["tool_call_id"].get<std::string>();
    }
    return std::nullopt;
}

// Build a call from an object carrying "name" and arguments; id_source holds the optional id
static std::optional<ToolCall> make_call(const json& fn, const json& id_source, bool keep_raw = false) {
    if (!fn.is_object() || !fn.contains("name") || !fn["name"].is_string()) {
        return std::nullopt;
    }

    std::string name = fn["name"].get<std::string>();
    if (name.empty()) {
        return std::nullopt;
    }

    auto args = normalize_arguments(fn, keep_raw);
    if (!args.has_value()) {
        return std::nullopt;
    }

    return ToolCall(name, *args, call_id(id_source));
}

std::optional<ToolCallList> match_tool_calls_object(const json& j) {
    if (!j.is_object() || !j.contains("tool_calls") || !j["tool_calls"].is_array()) {
        return std::nullopt;
    }

    ToolCallList calls;
    for (const auto& element : j["tool_calls"]) {
        if (!element.is_object()) {
            continue;
        }

        std::optional<ToolCall> call;
        if (element.contains("function") && element["function"].is_object()) {
            call = make_call(element["function"], element, true);
        } else {
            call = make_call(element, element, true);
        }

        if (call.has_value()) {
            calls.push_back(std::move(*call));
        }
    }

    if (calls.empty()) {
        return std::nullopt;
    }
    return calls;
}

std::optional<ToolCallList> match_call_array(const json& j) {
    if (!j.is_array() || j.empty()) {
        return std::nullopt;
    }

    // Every element has to be a call, otherwise this is ordinary data
    ToolCallList calls;
    for (const auto& element : j) {
        auto call = make_call(element, element);
        if (!call.has_value()) {
            return std::nullopt;
        }
        calls.push_back(std::move(*call));
    }
    return calls;
}

std::optional<ToolCallList> match_single_call(const json& j) {
    if (!j.is_object() || !j.contains("name")) {
        return std::nullopt;
    }

    auto call = make_call(j, j);
    if (!call.has_value()) {
        return std::nullopt;
    }
    return ToolCallList{std::move(*call)};
}

std::optional<ToolCallList> match_name_as_key(const json& j) {
    if (!j.is_object() || j.size() != 1) {
        return std::nullopt;
    }

    auto it = j.begin();
    const std::string& key = it.key();
    if (key.empty() || key == "tool_calls" || key == "name" ||
        key == "arguments" || key == "function") {
        return std::nullopt;
    }
    if (!it.value().is_object()) {
        return std::nullopt;
    }

    return ToolCallList{ToolCall(key, it.value())};
}

std::optional<ToolCallList> match_function_object(const json& j) {
    if (!j.is_object() || !j.contains("function") || !j["function"].is_object()) {
        return std::nullopt;
    }

    auto call = make_call(j["function"], j);
    if (!call.has_value()) {
        return std::nullopt;
    }
    return ToolCallList{std::move(*call)};
}

const std::vector<Strategy>& strategies() {
    static const std::vector<Strategy> chain = {
        {"tool_calls object", match_tool_calls_object},
        {"call array", match_call_array},
        {"single call", match_single_call},
        {"name as key", match_name_as_key},
        {"function object", match_function_object},
    };
    return chain;
}

std::optional<ToolCallList> match_json(const json& j) {
    for (const auto& strategy : strategies()) {
        auto calls = strategy.match(j);
        if (calls.has_value()) {
            LOG_DEBUG_FMT("Matched {} tool call(s) as {}", calls->size(), strategy.name);
            return calls;
        }
    }
    return std::nullopt;
}

ExtractionResult extract_tool_calls(const std::string& text) {
    ExtractionResult result;
    result.content = text;

    // Whole text first
    auto whole = parse_json(modelgate::trim(text));
    if (whole.has_value()) {
        result.tool_calls = match_json(*whole);
        if (result.tool_calls.has_value()) {
            return result;
        }
    }

    // Then the first JSON object embedded in the text
    std::string embedded = extract_json(text);
    if (embedded.empty()) {
        return result;
    }

    auto parsed = parse_json(embedded);
    if (parsed.has_value()) {
        result.tool_calls = match_json(*parsed);
        if (result.tool_calls.has_value()) {
            LOG_DEBUG_FMT("Found tool call JSON embedded in text ({} of {} bytes)",
                          embedded.size(), text.size());
        }
    }
    return result;
}

} // namespace ToolParser
