#pragma once

#include <string>
#include <vector>
#include "gridfs/document.hpp"

namespace vstore {
namespace bundle {

// Turns a {$field} pattern into a path-safe name for one file version, e.g.
// "{$_id}_{$filename}". Fields use the filter names (_id, filename, container,
// contentType, length, uploadDate, sha256, metadata.<key>).
class NameFormatter {
public:
  // Throws std::invalid_argument when the pattern names an unknown field
  explicit NameFormatter(std::string pattern);

  std::string format(const gridfs::FileDocument& version) const;

  const std::string& pattern() const { return pattern_; }

  // Replaces path separators and control characters with '_', and the
  // names "", "." and ".." with "_"
  static std::string sanitize(const std::string& name);

private:
  std::string pattern_;
};

} // namespace bundle
} // namespace vstore
