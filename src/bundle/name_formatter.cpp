#include "bundle/name_formatter.hpp"
#include "utils/pattern.hpp"
#include <stdexcept>

namespace vstore {
namespace bundle {

NameFormatter::NameFormatter(std::string pattern)
  : pattern_(std::move(pattern)) {
  for (const auto& field : utils::pattern_fields(pattern_)) {
    if (!gridfs::FieldPath::parse(field, true)) {
      throw std::invalid_argument("Name formatter: Unknown field in pattern: " + field);
    }
  }
}

std::string NameFormatter::format(const gridfs::FileDocument& version) const {
  std::string name = utils::replace_in_pattern(pattern_, [&version](const std::string& field) {
    auto path = gridfs::FieldPath::parse(field, true);
    if (!path) {
      return std::optional<std::string>();
    }
    // Missing metadata keys resolve to nothing
    auto value = version.get(*path);
    return std::optional<std::string>(value ? gridfs::value_to_string(*value) : "");
  });
  return sanitize(name);
}

std::string NameFormatter::sanitize(const std::string& name) {
  std::string safe;
  safe.reserve(name.size());
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7F) {
      safe.push_back('_');
    } else {
      safe.push_back(c);
    }
  }
  if (safe.empty() || safe == "." || safe == "..") {
    return "_";
  }
  return safe;
}

} // namespace bundle
} // namespace vstore
