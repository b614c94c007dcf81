#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "gridfs/chunk_store.hpp"

namespace vstore {
namespace gridfs {

// Chunk store on the local filesystem. Chunks live in a content addressed
// tree keyed by the SHA-256 of the file id:
//   {root}/chunks/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}/{n}
// and each file document is a JSON record at {root}/files/{id}.json, loaded
// into an in-memory index when the store opens.
class FsChunkStore : public ChunkStore {
public:
  using Clock = std::function<Timestamp()>;

  static constexpr uint32_t DEFAULT_CHUNK_SIZE = 255 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FsChunkStore(const std::string& base_path,
                        uint32_t chunk_size = DEFAULT_CHUNK_SIZE,
                        Clock clock = nullptr);


  // ---- BINARY OPERATIONS ----
  FileDocument insert_stream(std::istream& data, const UploadRequest& request) override;
  std::unique_ptr<ChunkReader> open_read_stream(const ObjectId& id) override;


  // ---- DELETION ----
  std::size_t delete_files(const std::vector<ObjectId>& ids) override;
  std::size_t delete_chunks(const std::vector<ObjectId>& ids) override;
  // Removes all stored data and resets the store
  void clear();


  // ---- METADATA QUERIES ----
  std::vector<FileDocument> query(const Predicate& predicate, const QueryOptions& options) override;
  std::vector<Value> distinct(const FieldPath& field, const Predicate& predicate) override;
  // Checks whether any chunk data exists for the id
  bool has_chunks(const ObjectId& id) const;


  // ---- METADATA UPDATES ----
  std::size_t set_field(const Predicate& predicate, const FieldPath& field, const Value& value) override;
  bool replace_metadata(const ObjectId& id, const Metadata& metadata) override;


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }
  uint32_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::filesystem::path files_path_;
  std::filesystem::path chunks_path_;
  uint32_t chunk_size_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::map<ObjectId, FileDocument> documents_;
  Timestamp last_upload_{};


  // ---- DOCUMENT PERSISTENCE ----
  // Reads every {root}/files/*.json record into the index
  void load_documents();
  // Writes the record through a temporary file and rename
  void persist_document(const FileDocument& document) const;
  std::filesystem::path document_path(const ObjectId& id) const;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // Directory holding every chunk of a file
  std::filesystem::path chunk_dir(const ObjectId& id) const;
  // Assigns the upload date, never earlier than the previous one
  Timestamp next_upload_date();
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace gridfs
} // namespace vstore
