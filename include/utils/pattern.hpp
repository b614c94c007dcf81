#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vstore {
namespace utils {

// Resolves a placeholder name, nullopt when the name is unknown
using PatternLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lists the names of every {$name} placeholder in order of appearance
std::vector<std::string> pattern_fields(const std::string& pattern);

// Replaces every {$name} placeholder with its looked up value. An unterminated
// placeholder is copied literally. Throws std::invalid_argument for unknown names.
std::string replace_in_pattern(const std::string& pattern, const PatternLookup& lookup);

} // namespace utils
} // namespace vstore
