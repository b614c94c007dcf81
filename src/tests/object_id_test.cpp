#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>
#include <mutex>
#include "errors/storage_error.hpp"
#include "gridfs/object_id.hpp"

using namespace vstore::gridfs;

TEST(ObjectIdTest, GenerateCarriesSeconds) {
  ObjectId id = ObjectId::generate(1700000000);
  EXPECT_EQ(id.seconds(), 1700000000u);
  EXPECT_EQ(id.to_string().substr(0, 8), "6553f100");
}

TEST(ObjectIdTest, HexRoundTrip) {
  const std::string hex = "65a1b2c3d4e5f60718293a4b";
  ObjectId id = ObjectId::parse(hex);
  EXPECT_EQ(id.to_string(), hex);

  // Upper case input is accepted, output is always lower case
  EXPECT_EQ(ObjectId::parse("65A1B2C3D4E5F60718293A4B"), id);
}

TEST(ObjectIdTest, RejectsMalformedIdentifiers) {
  EXPECT_FALSE(ObjectId::is_valid(""));
  EXPECT_FALSE(ObjectId::is_valid("not-an-id"));
  EXPECT_FALSE(ObjectId::is_valid("65a1b2c3d4e5f60718293a4"));   // 23 chars
  EXPECT_FALSE(ObjectId::is_valid("65a1b2c3d4e5f60718293a4bc")); // 25 chars
  EXPECT_FALSE(ObjectId::is_valid("65a1b2c3d4e5f60718293a4g"));

  try {
    ObjectId::parse("xyz");
    FAIL() << "parse should reject xyz";
  } catch (const vstore::errors::InvalidIdentifier& e) {
    EXPECT_EQ(e.kind(), vstore::errors::ErrorKind::INVALID_IDENTIFIER);
    EXPECT_EQ(e.status(), 400);
    EXPECT_NE(std::string(e.what()).find("xyz"), std::string::npos);
  }
}

TEST(ObjectIdTest, SameSecondIdsAreOrdered) {
  ObjectId first = ObjectId::generate(1700000000);
  ObjectId second = ObjectId::generate(1700000000);
  EXPECT_NE(first, second);
  EXPECT_LT(first, second);
  EXPECT_GT(ObjectId::generate(1700000001), second);
}

TEST(ObjectIdTest, DefaultIsZero) {
  EXPECT_EQ(ObjectId().to_string(), std::string(24, '0'));
}

TEST(ObjectIdTest, ConcurrentGenerationIsUnique) {
  const size_t num_threads = 4;
  const size_t ids_per_thread = 500;
  std::set<ObjectId> ids;
  std::mutex ids_mutex;
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&]() {
      std::vector<ObjectId> local;
      for (size_t j = 0; j < ids_per_thread; ++j) {
        local.push_back(ObjectId::generate(1700000000));
      }
      std::lock_guard<std::mutex> lock(ids_mutex);
      ids.insert(local.begin(), local.end());
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(ids.size(), num_threads * ids_per_thread);
}
