#include "gridfs/object_id.hpp"
#include "errors/storage_error.hpp"
#include <openssl/rand.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <cstring>
#include <mutex>
#include <random>

namespace vstore::gridfs {

namespace {

constexpr std::size_t PROCESS_BYTES = 5;

struct ProcessState {
  std::array<uint8_t, PROCESS_BYTES> random{};
  std::atomic<uint32_t> counter{0};
};

// Random part and counter seed are drawn once per process
ProcessState& process_state() {
  static ProcessState state;
  static std::once_flag once;
  std::call_once(once, [] {
    std::array<uint8_t, PROCESS_BYTES + 3> seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
      BOOST_LOG_TRIVIAL(warning) << "ObjectId: RAND_bytes failed, falling back to std::random_device";
      std::random_device rd;
      for (auto& byte : seed) {
        byte = static_cast<uint8_t>(rd());
      }
    }
    std::memcpy(state.random.data(), seed.data(), PROCESS_BYTES);
    // Leave headroom so the 24-bit counter does not wrap early in a run
    state.counter = ((static_cast<uint32_t>(seed[5]) << 16) |
                     (static_cast<uint32_t>(seed[6]) << 8) |
                      static_cast<uint32_t>(seed[7])) & 0x7FFFFF;
  });
  return state;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

ObjectId::ObjectId() {
  bytes_.fill(0);
}

ObjectId ObjectId::generate(uint32_t seconds) {
  ProcessState& state = process_state();
  uint32_t counter = state.counter.fetch_add(1) & 0xFFFFFF;

  std::array<uint8_t, SIZE> bytes{};
  uint32_t big_seconds = boost::endian::native_to_big(seconds);
  std::memcpy(bytes.data(), &big_seconds, 4);
  std::memcpy(bytes.data() + 4, state.random.data(), PROCESS_BYTES);

  // Low three bytes of the big endian counter
  uint32_t big_counter = boost::endian::native_to_big(counter);
  std::memcpy(bytes.data() + 9, reinterpret_cast<uint8_t*>(&big_counter) + 1, 3);
  return ObjectId(bytes);
}

bool ObjectId::is_valid(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    return false;
  }
  for (char c : hex) {
    if (hex_value(c) < 0) {
      return false;
    }
  }
  return true;
}

ObjectId ObjectId::parse(const std::string& hex) {
  if (!is_valid(hex)) {
    BOOST_LOG_TRIVIAL(debug) << "ObjectId: Rejecting malformed identifier: " << hex;
    throw errors::InvalidIdentifier(hex);
  }

  std::array<uint8_t, SIZE> bytes{};
  for (std::size_t i = 0; i < SIZE; ++i) {
    bytes[i] = static_cast<uint8_t>((hex_value(hex[2 * i]) << 4) | hex_value(hex[2 * i + 1]));
  }
  return ObjectId(bytes);
}

std::string ObjectId::to_string() const {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(SIZE * 2);
  for (uint8_t byte : bytes_) {
    out.push_back(digits[byte >> 4]);
    out.push_back(digits[byte & 0x0F]);
  }
  return out;
}

uint32_t ObjectId::seconds() const {
  uint32_t big_seconds;
  std::memcpy(&big_seconds, bytes_.data(), 4);
  return boost::endian::big_to_native(big_seconds);
}

std::ostream& operator<<(std::ostream& out, const ObjectId& id) {
  return out << id.to_string();
}

} // namespace vstore::gridfs
