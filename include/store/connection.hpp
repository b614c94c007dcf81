#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "gridfs/chunk_store.hpp"

namespace vstore {
namespace store {

// Location and tuning of the chunk store
struct StorageOptions {
  // Full location, takes precedence over root/database when set
  std::string url;
  std::string root = "./vstore-data";
  std::string database = "vstore";
  uint32_t chunk_size = 255 * 1024;
};

// Explicit handle to the chunk store shared by every component. The store is
// opened on first use, exactly once even under concurrent first calls, and
// released when the handle is destroyed.
class Connection {
public:
  using Factory = std::function<std::unique_ptr<gridfs::ChunkStore>(const std::string& location,
                                                                    const StorageOptions& options)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens an FsChunkStore at the resolved location
  explicit Connection(StorageOptions options);
  Connection(StorageOptions options, Factory factory);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- ACCESS ----
  // Opens the store if necessary, throws errors::StorageUnavailable on failure
  gridfs::ChunkStore& store();
  bool is_connected() const { return connected_; }


  // ---- GETTERS ----
  const StorageOptions& options() const { return options_; }
  // url, or {$root}/{$database} resolved against the options
  static std::string resolve_location(const StorageOptions& options);

private:
  // ---- PARAMETERS ----
  StorageOptions options_;
  Factory factory_;
  std::mutex open_mutex_;
  std::atomic<bool> connected_{false};
  std::unique_ptr<gridfs::ChunkStore> store_;

  void open();
};

} // namespace store
} // namespace vstore
