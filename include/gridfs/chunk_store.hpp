#ifndef VSTORE_GRIDFS_CHUNK_STORE_HPP
#define VSTORE_GRIDFS_CHUNK_STORE_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "gridfs/document.hpp"
#include "gridfs/predicate.hpp"

namespace vstore::gridfs {

// Everything the store needs to create a file document besides the bytes
struct UploadRequest {
  std::string filename;
  std::string content_type;
  Metadata metadata;
};

// Sequential read handle over one file's chunks. Released on destruction.
class ChunkReader {
public:
  virtual ~ChunkReader() = default;

  // Reads up to size bytes into buffer, returns 0 once the content is exhausted
  virtual std::size_t read(char* buffer, std::size_t size) = 0;
  virtual uint64_t length() const = 0;
};

// Chunked binary object store: a files collection of metadata documents plus
// a chunks collection keyed by file id. Implementations throw
// errors::StorageUnavailable for I/O failures.
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  // ---- BINARY OPERATIONS ----
  // Consumes the stream into chunks and inserts the file document
  virtual FileDocument insert_stream(std::istream& data, const UploadRequest& request) = 0;
  // Throws errors::NotFound when the file has no document
  virtual std::unique_ptr<ChunkReader> open_read_stream(const ObjectId& id) = 0;


  // ---- DELETION ----
  // Two independent calls against the two collections, keyed by the same ids.
  // Each returns how many of the ids it actually removed.
  virtual std::size_t delete_files(const std::vector<ObjectId>& ids) = 0;
  virtual std::size_t delete_chunks(const std::vector<ObjectId>& ids) = 0;


  // ---- METADATA QUERIES ----
  virtual std::vector<FileDocument> query(const Predicate& predicate, const QueryOptions& options) = 0;
  // Distinct values of a field among matching documents, in ascending order
  virtual std::vector<Value> distinct(const FieldPath& field, const Predicate& predicate) = 0;


  // ---- METADATA UPDATES ----
  // Sets one field on every matching document, returns the number modified
  virtual std::size_t set_field(const Predicate& predicate, const FieldPath& field, const Value& value) = 0;
  // Replaces the metadata map of one document, returns false when it does not exist
  virtual bool replace_metadata(const ObjectId& id, const Metadata& metadata) = 0;
};

} // namespace vstore::gridfs

#endif // VSTORE_GRIDFS_CHUNK_STORE_HPP
