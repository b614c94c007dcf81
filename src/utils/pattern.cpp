#include "utils/pattern.hpp"
#include <stdexcept>

namespace vstore {
namespace utils {

namespace {

// Walks the pattern calling on_text for literal runs and on_field for placeholders
template <typename TextFn, typename FieldFn>
void scan_pattern(const std::string& pattern, TextFn on_text, FieldFn on_field) {
  std::size_t pos = 0;
  while (pos < pattern.size()) {
    std::size_t open = pattern.find("{$", pos);
    if (open == std::string::npos) {
      on_text(pattern.substr(pos));
      return;
    }
    std::size_t close = pattern.find('}', open + 2);
    if (close == std::string::npos) {
      on_text(pattern.substr(pos));
      return;
    }
    on_text(pattern.substr(pos, open - pos));
    on_field(pattern.substr(open + 2, close - open - 2));
    pos = close + 1;
  }
}

} // namespace

std::vector<std::string> pattern_fields(const std::string& pattern) {
  std::vector<std::string> fields;
  scan_pattern(pattern,
    [](const std::string&) {},
    [&fields](const std::string& name) { fields.push_back(name); });
  return fields;
}

std::string replace_in_pattern(const std::string& pattern, const PatternLookup& lookup) {
  std::string result;
  scan_pattern(pattern,
    [&result](const std::string& text) { result += text; },
    [&result, &lookup](const std::string& name) {
      auto value = lookup(name);
      if (!value) {
        throw std::invalid_argument("Unknown pattern field: " + name);
      }
      result += *value;
    });
  return result;
}

} // namespace utils
} // namespace vstore
