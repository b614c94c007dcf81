#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include "errors/storage_error.hpp"
#include "gridfs/fs_chunk_store.hpp"
#include "test_utils.hpp"

using namespace vstore::gridfs;
using vstore::errors::NotFound;
using vstore::errors::StorageUnavailable;

class FsChunkStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FsChunkStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("fs_chunk_store_test");
    store = open_store();
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Small chunks so multi-chunk files stay small
  std::unique_ptr<FsChunkStore> open_store() {
    return std::make_unique<FsChunkStore>(test_dir.string(), 8, SteppingClock());
  }

  FileDocument insert(const std::string& filename, const std::string& data,
                      const std::string& container = "docs") {
    UploadRequest request;
    request.filename = filename;
    request.content_type = "text/plain";
    request.metadata["container"] = container;
    request.metadata["filename"] = filename;
    auto input = create_test_stream(data);
    return store->insert_stream(*input, request);
  }

  std::string read_all(const ObjectId& id) {
    auto reader = store->open_read_stream(id);
    std::string content;
    char buffer[5];
    std::size_t got = 0;
    while ((got = reader->read(buffer, sizeof(buffer))) > 0) {
      content.append(buffer, got);
    }
    return content;
  }
};

TEST_F(FsChunkStoreTest, InsertAndReadBack) {
  const std::string data = "Hello, chunked world!";
  FileDocument document = insert("hello.txt", data);

  EXPECT_EQ(document.length, data.size());
  EXPECT_EQ(document.chunk_size, 8u);
  EXPECT_EQ(document.filename, "hello.txt");
  EXPECT_EQ(document.content_type, "text/plain");
  EXPECT_EQ(document.sha256.size(), 64u);
  EXPECT_TRUE(store->has_chunks(document.id));
  EXPECT_EQ(read_all(document.id), data);
}

TEST_F(FsChunkStoreTest, EmptyFile) {
  FileDocument document = insert("empty.txt", "");
  EXPECT_EQ(document.length, 0u);
  // SHA-256 of no bytes
  EXPECT_EQ(document.sha256, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(read_all(document.id), "");
}

TEST_F(FsChunkStoreTest, ExactChunkMultiple) {
  const std::string data(32, 'X');
  FileDocument document = insert("exact.bin", data);
  EXPECT_EQ(document.length, 32u);
  EXPECT_EQ(read_all(document.id), data);
}

TEST_F(FsChunkStoreTest, UploadDatesAndIdsIncrease) {
  FileDocument first = insert("a.txt", "one");
  FileDocument second = insert("a.txt", "two");
  EXPECT_LT(first.upload_date, second.upload_date);
  EXPECT_LT(first.id, second.id);
}

TEST_F(FsChunkStoreTest, OpenMissingFileThrowsNotFound) {
  EXPECT_THROW(store->open_read_stream(ObjectId::generate(1)), NotFound);
}

TEST_F(FsChunkStoreTest, InvalidStreamIsRejected) {
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  UploadRequest request;
  request.filename = "bad.txt";
  EXPECT_THROW(store->insert_stream(bad_stream, request), StorageUnavailable);
  EXPECT_TRUE(store->query(Predicate::match_all(), {}).empty());
}

TEST_F(FsChunkStoreTest, MissingChunkFailsTheRead) {
  FileDocument document = insert("gone.txt", std::string(20, 'g'));
  ASSERT_EQ(store->delete_chunks({document.id}), 1u);

  auto reader = store->open_read_stream(document.id);
  char buffer[64];
  EXPECT_THROW(reader->read(buffer, sizeof(buffer)), StorageUnavailable);
}

TEST_F(FsChunkStoreTest, DeleteFilesAndChunksIndependently) {
  FileDocument keep = insert("keep.txt", "keep");
  FileDocument drop = insert("drop.txt", "drop");

  EXPECT_EQ(store->delete_files({drop.id}), 1u);
  // Chunks outlive their document until deleted separately
  EXPECT_TRUE(store->has_chunks(drop.id));
  EXPECT_EQ(store->delete_chunks({drop.id}), 1u);
  EXPECT_FALSE(store->has_chunks(drop.id));

  // Deleting again is a no-op
  EXPECT_EQ(store->delete_files({drop.id}), 0u);
  EXPECT_EQ(store->delete_chunks({drop.id}), 0u);

  EXPECT_EQ(read_all(keep.id), "keep");
  EXPECT_THROW(store->open_read_stream(drop.id), NotFound);
}

TEST_F(FsChunkStoreTest, QuerySortsAndGroups) {
  FileDocument a1 = insert("a.txt", "a1");
  FileDocument b1 = insert("b.txt", "b1");
  FileDocument a2 = insert("a.txt", "a2");
  insert("c.txt", "c1", "other");

  QueryOptions options;
  options.sort = SortSpec{FieldPath::upload_date(), true};
  auto sorted = store->query(Predicate::eq(FieldPath::container(), std::string("docs")), options);
  ASSERT_EQ(sorted.size(), 3u);
  EXPECT_EQ(sorted[0].id, a2.id);
  EXPECT_EQ(sorted[1].id, b1.id);
  EXPECT_EQ(sorted[2].id, a1.id);

  options.group_first_by = FieldPath::filename();
  auto current = store->query(Predicate::eq(FieldPath::container(), std::string("docs")), options);
  ASSERT_EQ(current.size(), 2u);
  EXPECT_EQ(current[0].id, a2.id);
  EXPECT_EQ(current[1].id, b1.id);
}

TEST_F(FsChunkStoreTest, IdsOnlyKeepsIdAndFilename) {
  FileDocument document = insert("a.txt", "abc");
  QueryOptions options;
  options.ids_only = true;
  auto ids = store->query(Predicate::match_all(), options);
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0].id, document.id);
  EXPECT_EQ(ids[0].filename, "a.txt");
  EXPECT_TRUE(ids[0].metadata.empty());
}

TEST_F(FsChunkStoreTest, DistinctIsSorted) {
  insert("a.txt", "1", "zeta");
  insert("b.txt", "2", "alpha");
  insert("c.txt", "3", "alpha");

  auto containers = store->distinct(FieldPath::container(), Predicate::match_all());
  ASSERT_EQ(containers.size(), 2u);
  EXPECT_EQ(std::get<std::string>(containers[0]), "alpha");
  EXPECT_EQ(std::get<std::string>(containers[1]), "zeta");
}

TEST_F(FsChunkStoreTest, SetFieldAndReplaceMetadata) {
  FileDocument a = insert("a.txt", "1", "old");
  insert("b.txt", "2", "old");
  insert("c.txt", "3", "keep");

  EXPECT_EQ(store->set_field(Predicate::eq(FieldPath::container(), std::string("old")),
                             FieldPath::container(), std::string("new")), 2u);
  EXPECT_EQ(store->query(Predicate::eq(FieldPath::container(), std::string("new")), {}).size(), 2u);

  EXPECT_THROW(store->set_field(Predicate::match_all(), FieldPath::filename(), std::string("x")),
               std::invalid_argument);

  Metadata replaced = {{"container", std::string("new")}, {"rev", int64_t{2}}};
  EXPECT_TRUE(store->replace_metadata(a.id, replaced));
  EXPECT_FALSE(store->replace_metadata(ObjectId::generate(1), replaced));

  auto found = store->query(Predicate::eq(FieldPath::id(), a.id), {});
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(std::get<int64_t>(found[0].metadata.at("rev")), 2);
}

TEST_F(FsChunkStoreTest, DocumentsSurviveReopen) {
  FileDocument document = insert("persist.txt", "persisted bytes");
  store->replace_metadata(document.id, {{"container", std::string("docs")},
                                        {"when", timestamp_from_millis(1234)},
                                        {"score", 1.5},
                                        {"flag", true}});
  store.reset();
  store = open_store();

  auto found = store->query(Predicate::eq(FieldPath::id(), document.id), {});
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].filename, "persist.txt");
  EXPECT_EQ(found[0].upload_date, document.upload_date);
  EXPECT_EQ(found[0].sha256, document.sha256);
  EXPECT_EQ(timestamp_to_millis(std::get<Timestamp>(found[0].metadata.at("when"))), 1234);
  EXPECT_DOUBLE_EQ(std::get<double>(found[0].metadata.at("score")), 1.5);
  EXPECT_TRUE(std::get<bool>(found[0].metadata.at("flag")));
  EXPECT_EQ(read_all(document.id), "persisted bytes");

  // The restarted clock reads earlier than what was loaded
  FileDocument later = insert("later.txt", "x");
  EXPECT_GT(later.upload_date, document.upload_date);
  EXPECT_LT(document.id, later.id);
}

TEST_F(FsChunkStoreTest, UploadDatesStrictlyIncreaseUnderAStoppedClock) {
  store.reset();
  const Timestamp frozen = timestamp_from_millis(1700000000000);
  store = std::make_unique<FsChunkStore>(test_dir.string(), 8, [frozen] { return frozen; });

  FileDocument first = insert("a.txt", "one");
  FileDocument second = insert("a.txt", "two");
  EXPECT_EQ(first.upload_date, frozen);
  EXPECT_EQ(second.upload_date, frozen + std::chrono::milliseconds(1));

  store.reset();
  store = std::make_unique<FsChunkStore>(test_dir.string(), 8, [frozen] { return frozen; });
  FileDocument third = insert("a.txt", "three");
  EXPECT_EQ(third.upload_date, frozen + std::chrono::milliseconds(2));
  EXPECT_LT(second.id, third.id);
}

TEST_F(FsChunkStoreTest, SortTiesFallBackToId) {
  FileDocument a = insert("a.txt", "1");
  FileDocument b = insert("b.txt", "2");
  FileDocument c = insert("c.txt", "3");

  QueryOptions options;
  options.sort = SortSpec{FieldPath::container(), true};
  auto sorted = store->query(Predicate::match_all(), options);
  ASSERT_EQ(sorted.size(), 3u);
  EXPECT_EQ(sorted[0].id, c.id);
  EXPECT_EQ(sorted[1].id, b.id);
  EXPECT_EQ(sorted[2].id, a.id);
}

TEST_F(FsChunkStoreTest, FailedMetadataWriteLeavesDocumentUnchanged) {
  FileDocument document = insert("a.txt", "1", "old");
  std::filesystem::path blocked = test_dir / "files" / (document.id.to_string() + ".json.tmp");
  std::filesystem::create_directories(blocked);

  EXPECT_THROW(store->replace_metadata(document.id, {{"container", std::string("new")}}), StorageUnavailable);

  auto found = store->query(Predicate::eq(FieldPath::id(), document.id), {});
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(std::get<std::string>(found[0].metadata.at("container")), "old");
}

TEST_F(FsChunkStoreTest, FailedSetFieldKeepsMemoryInStepWithDisk) {
  FileDocument a = insert("a.txt", "1", "old");
  FileDocument b = insert("b.txt", "2", "old");
  ASSERT_LT(a.id, b.id);
  std::filesystem::create_directories(test_dir / "files" / (b.id.to_string() + ".json.tmp"));

  EXPECT_THROW(store->set_field(Predicate::eq(FieldPath::container(), std::string("old")),
                                FieldPath::container(), std::string("new")), StorageUnavailable);

  auto container_of = [this](const ObjectId& id) {
    auto found = store->query(Predicate::eq(FieldPath::id(), id), {});
    return std::get<std::string>(found.at(0).metadata.at("container"));
  };
  EXPECT_EQ(container_of(a.id), "new");
  EXPECT_EQ(container_of(b.id), "old");

  store.reset();
  store = open_store();
  EXPECT_EQ(container_of(a.id), "new");
  EXPECT_EQ(container_of(b.id), "old");
}

TEST_F(FsChunkStoreTest, UndeletableDocumentStaysAndIsNotCounted) {
  FileDocument stuck = insert("stuck.txt", "1");
  FileDocument gone = insert("gone.txt", "2");

  // A non-empty directory in place of the document file cannot be removed
  std::filesystem::path stuck_path = test_dir / "files" / (stuck.id.to_string() + ".json");
  std::filesystem::remove(stuck_path);
  std::filesystem::create_directories(stuck_path / "child");

  EXPECT_EQ(store->delete_files({stuck.id, gone.id}), 1u);
  EXPECT_EQ(store->query(Predicate::eq(FieldPath::id(), stuck.id), {}).size(), 1u);
  EXPECT_TRUE(store->query(Predicate::eq(FieldPath::id(), gone.id), {}).empty());
}

TEST_F(FsChunkStoreTest, ClearRemovesEverything) {
  FileDocument document = insert("temp.txt", "temp");
  ASSERT_NO_THROW(store->clear());
  EXPECT_TRUE(store->query(Predicate::match_all(), {}).empty());
  EXPECT_FALSE(store->has_chunks(document.id));
}

TEST_F(FsChunkStoreTest, ConcurrentInserts) {
  const size_t num_threads = 4;
  const size_t ops_per_thread = 20;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string name = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
          FileDocument document = insert(name, "Data for " + name);
          if (read_all(document.id) == "Data for " + name) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  EXPECT_EQ(store->query(Predicate::match_all(), {}).size(), num_threads * ops_per_thread);
}
