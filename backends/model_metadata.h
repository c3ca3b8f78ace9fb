#pragma once

#include <cstdint>
#include <string>

namespace ModelMetadata {

/// @brief Parse a free-form parameter count ("7b", "1.5B", "135 million", "7,000,000,000")
/// Bare numbers below 1000 with no unit are read as billions ("7" -> 7B), so a
/// small count written without a unit ("500") is misread. Kept for compatibility
/// with registry metadata that writes sizes tersely.
/// @return The count, or 0 if the string is empty, unparseable, negative or out of range
int64_t parse_parameter_count(const std::string& size);

} // namespace ModelMetadata
