#include "modelgate.h"
#include "model_metadata.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace ModelMetadata {

namespace {

struct Suffix {
    const char* text;
    double multiplier;
};

// Tried before the single-letter forms so "billion" is never read as "...n"
const Suffix word_suffixes[] = {
    {"billion", 1e9},
    {"million", 1e6},
    {"thousand", 1e3},
    {"k", 1e3},
};

const Suffix letter_suffixes[] = {
    {"b", 1e9},
    {"m", 1e6},
    {"t", 1e12},
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Strict decimal parse: the whole string must be consumed, no hex, inf or nan
bool parse_real(const std::string& s, double& value) {
    if (s.empty()) return false;
    if (s.find_first_not_of("0123456789.+-e") != std::string::npos) return false;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(v)) {
        return false;
    }
    value = v;
    return true;
}

int64_t to_count(double value) {
    // 9.2e18 is just under INT64_MAX
    if (value < 0 || value >= 9.2e18) {
        LOG_DEBUG("Parameter count out of range: " + std::to_string(value));
        return 0;
    }
    return static_cast<int64_t>(std::llround(value));
}

} // namespace

int64_t parse_parameter_count(const std::string& size) {
    std::string cleaned;
    for (unsigned char c : modelgate::to_lower(size)) {
        if (c == ',' || std::isspace(c)) continue;
        cleaned += static_cast<char>(c);
    }
    if (cleaned.empty() || cleaned[0] == '-') {
        return 0;
    }

    double value = 0;
    for (const auto& suffix : word_suffixes) {
        if (ends_with(cleaned, suffix.text)) {
            std::string prefix = cleaned.substr(0, cleaned.size() - std::string(suffix.text).size());
            if (parse_real(prefix, value)) {
                return to_count(value * suffix.multiplier);
            }
        }
    }

    std::string numeral = cleaned;
    double multiplier = 1;
    for (const auto& suffix : letter_suffixes) {
        if (ends_with(cleaned, suffix.text)) {
            numeral = cleaned.substr(0, cleaned.size() - 1);
            multiplier = suffix.multiplier;
            if (parse_real(numeral, value)) {
                return to_count(value * multiplier);
            }
            break;
        }
    }

    // Last resort: digits and the first decimal point, in order
    std::string digits;
    bool found_dot = false;
    for (char c : numeral) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        } else if (c == '.' && !found_dot) {
            digits += c;
            found_dot = true;
        }
    }

    if (!parse_real(digits, value)) {
        LOG_DEBUG("Unparseable parameter count: '" + size + "'");
        return 0;
    }

    if (multiplier == 1 && value < 1000) {
        multiplier = 1e9;
    }
    return to_count(value * multiplier);
}

} // namespace ModelMetadata
