#ifndef VSTORE_GRIDFS_OBJECT_ID_HPP
#define VSTORE_GRIDFS_OBJECT_ID_HPP

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace vstore::gridfs {

// 12-byte document identifier: 4-byte seconds, 5 process-random bytes and a
// 3-byte counter, all big endian. Ids minted by one process sort in creation order.
class ObjectId {
public:
  static constexpr std::size_t SIZE = 12;

  ObjectId();
  explicit ObjectId(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}

  // Mints a new id stamped with the given unix time
  static ObjectId generate(uint32_t seconds);
  // Parses 24 hex characters, throws errors::InvalidIdentifier otherwise
  static ObjectId parse(const std::string& hex);
  static bool is_valid(const std::string& hex);

  std::string to_string() const;
  uint32_t seconds() const;
  const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }

  bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }
  bool operator>(const ObjectId& other) const { return other.bytes_ < bytes_; }

private:
  std::array<uint8_t, SIZE> bytes_;
};

std::ostream& operator<<(std::ostream& out, const ObjectId& id);

} // namespace vstore::gridfs

#endif // VSTORE_GRIDFS_OBJECT_ID_HPP
