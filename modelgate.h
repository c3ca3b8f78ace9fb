#pragma once

// ============================================================================
// modelgate core header
// ============================================================================
// Included by the .cpp files of the adapter core. Pulls in the logger and
// the standard headers most of the codebase uses.
// ============================================================================

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <algorithm>
#include <cctype>

#include "logger.h"

#define MODELGATE_VERSION "0.4.0"

namespace modelgate {
    // Lowercase copy, used by every identifier-matching routine
    inline std::string to_lower(const std::string& s) {
        std::string lower = s;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    inline bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    // Trim whitespace from both ends of a string
    inline std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\n\r");
        return s.substr(start, end - start + 1);
    }
}
