#include "store/connection.hpp"
#include "errors/storage_error.hpp"
#include "gridfs/fs_chunk_store.hpp"
#include "utils/pattern.hpp"
#include <boost/log/trivial.hpp>

namespace vstore {
namespace store {

namespace {

const char* const LOCATION_PATTERN = "{$root}/{$database}";
const char* const FILE_SCHEME = "file://";

std::unique_ptr<gridfs::ChunkStore> open_fs_store(const std::string& location, const StorageOptions& options) {
  return std::make_unique<gridfs::FsChunkStore>(location, options.chunk_size);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection(StorageOptions options)
  : Connection(std::move(options), open_fs_store) {}

Connection::Connection(StorageOptions options, Factory factory)
  : options_(std::move(options))
  , factory_(std::move(factory)) {
  BOOST_LOG_TRIVIAL(debug) << "Connection: Created handle for " << resolve_location(options_);
}

Connection::~Connection() {
  if (connected_) {
    BOOST_LOG_TRIVIAL(info) << "Connection: Releasing chunk store at " << resolve_location(options_);
  }
  store_.reset();
}


//==============================================
// ACCESS
//==============================================

gridfs::ChunkStore& Connection::store() {
  if (!connected_) {
    std::lock_guard<std::mutex> lock(open_mutex_);
    // A throwing open leaves the store unset so a later call retries
    if (!connected_) {
      open();
    }
  }
  return *store_;
}

void Connection::open() {
  std::string location = resolve_location(options_);
  BOOST_LOG_TRIVIAL(info) << "Connection: Opening chunk store at " << location;

  try {
    store_ = factory_(location, options_);
  } catch (const errors::StorageError&) {
    throw;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection: Failed to open chunk store: " << e.what();
    throw errors::StorageUnavailable(e.what());
  }
  if (!store_) {
    throw errors::StorageUnavailable("Chunk store factory returned nothing for " + location);
  }

  connected_ = true;
  BOOST_LOG_TRIVIAL(info) << "Connection: Chunk store ready";
}

std::string Connection::resolve_location(const StorageOptions& options) {
  if (!options.url.empty()) {
    const std::string scheme = FILE_SCHEME;
    if (options.url.compare(0, scheme.size(), scheme) == 0) {
      return options.url.substr(scheme.size());
    }
    return options.url;
  }

  return utils::replace_in_pattern(LOCATION_PATTERN, [&options](const std::string& name) -> std::optional<std::string> {
    if (name == "root") return options.root;
    if (name == "database") return options.database;
    return std::nullopt;
  });
}

} // namespace store
} // namespace vstore
