#include "gridfs/document.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace vstore::gridfs {

namespace {

const boost::posix_time::ptime& epoch() {
  static const boost::posix_time::ptime value(boost::gregorian::date(1970, 1, 1));
  return value;
}

bool is_integer_text(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  std::size_t start = (text[0] == '-') ? 1 : 0;
  if (start == text.size()) {
    return false;
  }
  for (std::size_t i = start; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

// Returns the value as a double when it holds a number
std::optional<double> as_number(const Value& value) {
  if (const auto* i = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  return std::nullopt;
}

template <typename T>
int three_way(const T& lhs, const T& rhs) {
  if (lhs < rhs) return -1;
  if (rhs < lhs) return 1;
  return 0;
}

} // namespace

//==============================================
// TIMESTAMPS
//==============================================

Timestamp timestamp_from_millis(int64_t millis) {
  return Timestamp(std::chrono::milliseconds(millis));
}

int64_t timestamp_to_millis(Timestamp ts) {
  return ts.time_since_epoch().count();
}

std::string format_timestamp(Timestamp ts) {
  boost::posix_time::ptime pt = epoch() + boost::posix_time::milliseconds(timestamp_to_millis(ts));
  boost::posix_time::time_duration tod = pt.time_of_day();
  int64_t millis = timestamp_to_millis(ts) % 1000;
  if (millis < 0) {
    millis += 1000;
  }

  std::ostringstream out;
  out << boost::gregorian::to_iso_extended_string(pt.date()) << 'T'
      << std::setfill('0') << std::setw(2) << tod.hours() << ':'
      << std::setw(2) << tod.minutes() << ':'
      << std::setw(2) << tod.seconds() << '.'
      << std::setw(3) << millis << 'Z';
  return out.str();
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
  if (is_integer_text(text)) {
    try {
      return timestamp_from_millis(std::stoll(text));
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
  }

  std::string iso = text;
  if (!iso.empty() && (iso.back() == 'Z' || iso.back() == 'z')) {
    iso.pop_back();
  }
  if (iso.size() < 19 || iso[10] != 'T') {
    return std::nullopt;
  }

  try {
    boost::posix_time::ptime pt = boost::posix_time::from_iso_extended_string(iso);
    if (pt.is_special()) {
      return std::nullopt;
    }
    boost::posix_time::time_duration since = pt - epoch();
    return timestamp_from_millis(since.total_milliseconds());
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

//==============================================
// VALUES
//==============================================

std::string value_to_string(const Value& value) {
  struct Visitor {
    std::string operator()(std::monostate) const { return ""; }
    std::string operator()(bool b) const { return b ? "true" : "false"; }
    std::string operator()(int64_t i) const { return std::to_string(i); }
    std::string operator()(double d) const {
      std::ostringstream out;
      out << d;
      return out.str();
    }
    std::string operator()(const std::string& s) const { return s; }
    std::string operator()(const ObjectId& id) const { return id.to_string(); }
    std::string operator()(Timestamp ts) const { return format_timestamp(ts); }
  };
  return std::visit(Visitor{}, value);
}

std::optional<int> compare_values(const Value& lhs, const Value& rhs) {
  auto lhs_number = as_number(lhs);
  auto rhs_number = as_number(rhs);
  if (lhs_number && rhs_number) {
    return three_way(*lhs_number, *rhs_number);
  }
  if (lhs.index() != rhs.index()) {
    return std::nullopt;
  }

  switch (lhs.index()) {
    case 0: return 0;
    case 1: return three_way(std::get<bool>(lhs), std::get<bool>(rhs));
    case 4: return three_way(std::get<std::string>(lhs), std::get<std::string>(rhs));
    case 5: return three_way(std::get<ObjectId>(lhs), std::get<ObjectId>(rhs));
    case 6: return three_way(std::get<Timestamp>(lhs), std::get<Timestamp>(rhs));
    default: return std::nullopt;
  }
}

bool values_equal(const Value& lhs, const Value& rhs) {
  auto result = compare_values(lhs, rhs);
  return result && *result == 0;
}

Metadata merge_metadata(const Metadata& base, const Metadata& overlay, const std::string& container) {
  Metadata merged = base;
  for (const auto& [key, value] : overlay) {
    merged[key] = value;
  }
  merged["container"] = container;
  return merged;
}

//==============================================
// FIELD PATHS
//==============================================

std::optional<FieldPath> FieldPath::parse(const std::string& name, bool strict) {
  if (name == "id" || name == "_id") return FieldPath{Kind::ID, ""};
  if (name == "filename") return FieldPath{Kind::FILENAME, ""};
  if (name == "contentType") return FieldPath{Kind::CONTENT_TYPE, ""};
  if (name == "length") return FieldPath{Kind::LENGTH, ""};
  if (name == "chunkSize") return FieldPath{Kind::CHUNK_SIZE, ""};
  if (name == "uploadedAt" || name == "uploadDate") return FieldPath{Kind::UPLOAD_DATE, ""};
  if (name == "sha256") return FieldPath{Kind::SHA256, ""};
  if (name == "container") return container();

  const std::string prefix = "metadata.";
  if (name.compare(0, prefix.size(), prefix) == 0 && name.size() > prefix.size()) {
    return metadata(name.substr(prefix.size()));
  }
  if (strict || name.empty()) {
    return std::nullopt;
  }
  return metadata(name);
}

std::string FieldPath::name() const {
  switch (kind) {
    case Kind::ID: return "_id";
    case Kind::FILENAME: return "filename";
    case Kind::CONTENT_TYPE: return "contentType";
    case Kind::LENGTH: return "length";
    case Kind::CHUNK_SIZE: return "chunkSize";
    case Kind::UPLOAD_DATE: return "uploadDate";
    case Kind::SHA256: return "sha256";
    case Kind::METADATA: return "metadata." + key;
    default: return "";
  }
}

//==============================================
// FILE DOCUMENTS
//==============================================

std::string FileDocument::container() const {
  auto it = metadata.find("container");
  if (it == metadata.end()) {
    return "";
  }
  return value_to_string(it->second);
}

std::optional<Value> FileDocument::get(const FieldPath& field) const {
  switch (field.kind) {
    case FieldPath::Kind::ID: return Value(id);
    case FieldPath::Kind::FILENAME: return Value(filename);
    case FieldPath::Kind::CONTENT_TYPE: return Value(content_type);
    case FieldPath::Kind::LENGTH: return Value(static_cast<int64_t>(length));
    case FieldPath::Kind::CHUNK_SIZE: return Value(static_cast<int64_t>(chunk_size));
    case FieldPath::Kind::UPLOAD_DATE: return Value(upload_date);
    case FieldPath::Kind::SHA256: return Value(sha256);
    case FieldPath::Kind::METADATA: {
      auto it = metadata.find(field.key);
      if (it == metadata.end()) {
        return std::nullopt;
      }
      return it->second;
    }
    default:
      return std::nullopt;
  }
}

} // namespace vstore::gridfs
