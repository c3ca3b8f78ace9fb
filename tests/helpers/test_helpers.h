#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <string>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <vector>
#include "message.h"
#include "tools/tool.h"

namespace test_helpers {

// Write string to file, creating parent directories
inline bool write_file(const std::string& path, const std::string& content) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return file.good();
}

// Count non-overlapping occurrences of needle
inline size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline ToolDefinition weather_tool() {
    return ToolDefinition("get_weather", "Get the current weather",
                          {{"type", "object"},
                           {"properties", {{"location", {{"type", "string"}}}}},
                           {"required", {"location"}}});
}

inline ToolDefinition search_tool() {
    return ToolDefinition("web_search", "Search the web",
                          {{"type", "object"},
                           {"properties", {{"query", {{"type", "string"}}}}}});
}

// Set environment variable (RAII wrapper)
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value)
        : name_(name) {
        const char* old = getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnv() {
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_ = false;
};

} // namespace test_helpers

#endif // TEST_HELPERS_H
