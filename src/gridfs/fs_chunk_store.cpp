#include "gridfs/fs_chunk_store.hpp"
#include "errors/storage_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

namespace vstore {
namespace gridfs {

namespace {

//==============================================
// RAII WRAPPER FOR THE DIGEST CONTEXT
//==============================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw errors::StorageUnavailable("Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw errors::StorageUnavailable("Failed to initialize hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, std::size_t size) {
    if (!EVP_DigestUpdate(ctx, data, size)) {
      throw errors::StorageUnavailable("Failed to update hash");
    }
  }

  // Finalizes and returns the lowercase hex digest
  std::string hex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
      throw errors::StorageUnavailable("Failed to finalize hash");
    }
    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
      ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
  }
};

//==============================================
// DOCUMENT CODEC
//==============================================

nlohmann::json encode_value(const Value& value) {
  static const char* type_names[] = {"null", "bool", "int", "double", "string", "objectId", "date"};
  nlohmann::json node = {{"type", type_names[value.index()]}};
  if (const auto* b = std::get_if<bool>(&value)) {
    node["value"] = *b;
  } else if (const auto* i = std::get_if<int64_t>(&value)) {
    node["value"] = *i;
  } else if (const auto* d = std::get_if<double>(&value)) {
    node["value"] = *d;
  } else if (const auto* ts = std::get_if<Timestamp>(&value)) {
    node["value"] = timestamp_to_millis(*ts);
  } else if (!std::holds_alternative<std::monostate>(value)) {
    node["value"] = value_to_string(value);
  }
  return node;
}

Value decode_value(const nlohmann::json& node) {
  const std::string type = node.at("type").get<std::string>();
  if (type == "null") return Value{};
  const nlohmann::json& v = node.at("value");
  if (type == "bool") return Value(v.get<bool>());
  if (type == "int") return Value(v.get<int64_t>());
  if (type == "double") return Value(v.get<double>());
  if (type == "string") return Value(v.get<std::string>());
  if (type == "objectId") return Value(ObjectId::parse(v.get<std::string>()));
  if (type == "date") return Value(timestamp_from_millis(v.get<int64_t>()));
  throw std::runtime_error("unknown value type: " + type);
}

nlohmann::json encode_document(const FileDocument& document) {
  nlohmann::json metadata = nlohmann::json::object();
  for (const auto& [key, value] : document.metadata) {
    metadata[key] = encode_value(value);
  }
  return {
    {"_id", document.id.to_string()},
    {"filename", document.filename},
    {"contentType", document.content_type},
    {"length", document.length},
    {"chunkSize", document.chunk_size},
    {"uploadDate", timestamp_to_millis(document.upload_date)},
    {"sha256", document.sha256},
    {"metadata", metadata}
  };
}

FileDocument decode_document(const nlohmann::json& root) {
  FileDocument document;
  document.id = ObjectId::parse(root.at("_id").get<std::string>());
  document.filename = root.at("filename").get<std::string>();
  document.content_type = root.value("contentType", std::string());
  document.length = root.at("length").get<uint64_t>();
  document.chunk_size = root.at("chunkSize").get<uint32_t>();
  document.upload_date = timestamp_from_millis(root.at("uploadDate").get<int64_t>());
  document.sha256 = root.value("sha256", std::string());

  if (auto it = root.find("metadata"); it != root.end()) {
    for (const auto& [key, node] : it->items()) {
      document.metadata[key] = decode_value(node);
    }
  }
  return document;
}

// Identifies a value for grouping and deduplication
std::string group_key(const std::optional<Value>& value) {
  if (!value) {
    return "null";
  }
  return std::to_string(value->index()) + ":" + value_to_string(*value);
}

//==============================================
// CHUNK READER
//==============================================

class FsChunkReader : public ChunkReader {
public:
  FsChunkReader(std::filesystem::path dir, uint64_t length, uint32_t chunk_size)
    : dir_(std::move(dir))
    , length_(length)
    , chunk_size_(chunk_size)
    , chunk_count_(chunk_size == 0 ? 0 : (length + chunk_size - 1) / chunk_size) {}

  std::size_t read(char* buffer, std::size_t size) override {
    while (true) {
      if (current_.is_open()) {
        current_.read(buffer, static_cast<std::streamsize>(size));
        std::streamsize got = current_.gcount();
        if (got > 0) {
          delivered_ += static_cast<uint64_t>(got);
          return static_cast<std::size_t>(got);
        }
        if (current_.bad()) {
          throw errors::StorageUnavailable("Failed reading chunk " + std::to_string(next_chunk_ - 1) +
                                           " in " + dir_.string());
        }
        current_.close();
      }

      if (next_chunk_ >= chunk_count_) {
        if (delivered_ != length_) {
          throw errors::StorageUnavailable("Chunk data shorter than file length in " + dir_.string());
        }
        return 0;
      }

      std::filesystem::path chunk_path = dir_ / std::to_string(next_chunk_);
      current_.open(chunk_path, std::ios::binary);
      if (!current_) {
        BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Missing chunk: " << chunk_path.string();
        throw errors::StorageUnavailable("Missing chunk: " + chunk_path.string());
      }
      ++next_chunk_;
    }
  }

  uint64_t length() const override { return length_; }

private:
  std::filesystem::path dir_;
  uint64_t length_;
  uint32_t chunk_size_;
  uint64_t chunk_count_;
  uint64_t next_chunk_ = 0;
  uint64_t delivered_ = 0;
  std::ifstream current_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FsChunkStore::FsChunkStore(const std::string& base_path, uint32_t chunk_size, Clock clock)
  : base_path_(base_path)
  , files_path_(base_path_ / "files")
  , chunks_path_(base_path_ / "chunks")
  , chunk_size_(chunk_size)
  , clock_(std::move(clock)) {
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Initializing store with base path: " << base_path;

  if (chunk_size_ == 0) {
    throw std::invalid_argument("FsChunkStore: Chunk size must be positive");
  }
  if (!clock_) {
    clock_ = [] {
      return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    };
  }

  try {
    check_directory_exists(files_path_);
    check_directory_exists(chunks_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Failed to prepare directories: " << e.what();
    throw errors::StorageUnavailable(e.what());
  }

  load_documents();
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Loaded " << documents_.size() << " file documents";
}


//==============================================
// BINARY OPERATIONS
//==============================================

FileDocument FsChunkStore::insert_stream(std::istream& data, const UploadRequest& request) {
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Storing stream for file: " << request.filename;

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Invalid input stream for file: " << request.filename;
    throw errors::StorageUnavailable("Invalid input stream for " + request.filename);
  }

  FileDocument document;
  document.upload_date = next_upload_date();
  document.id = ObjectId::generate(static_cast<uint32_t>(
    std::chrono::duration_cast<std::chrono::seconds>(document.upload_date.time_since_epoch()).count()));
  document.filename = request.filename;
  document.content_type = request.content_type;
  document.chunk_size = chunk_size_;
  document.metadata = request.metadata;

  std::filesystem::path dir = chunk_dir(document.id);
  try {
    check_directory_exists(dir);

    DigestContext digest;
    std::vector<char> buffer(chunk_size_);
    uint64_t chunk_index = 0;

    // Read input stream in chunk sized pieces, one file per chunk
    while (true) {
      data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize got = data.gcount();
      if (got <= 0) {
        break;
      }

      std::ofstream chunk(dir / std::to_string(chunk_index), std::ios::binary);
      chunk.write(buffer.data(), got);
      // Buffered bytes only reach the disk on close
      chunk.close();
      if (chunk.fail()) {
        throw errors::StorageUnavailable("Failed to write chunk " + std::to_string(chunk_index));
      }
      digest.update(buffer.data(), static_cast<std::size_t>(got));
      document.length += static_cast<uint64_t>(got);
      ++chunk_index;

      if (got < static_cast<std::streamsize>(buffer.size())) {
        break;
      }
    }
    if (data.bad()) {
      throw errors::StorageUnavailable("Input stream failed while reading " + request.filename);
    }

    document.sha256 = digest.hex();
    persist_document(document);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Upload of " << request.filename << " failed: " << e.what();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (dynamic_cast<const errors::StorageError*>(&e)) {
      throw;
    }
    throw errors::StorageUnavailable(e.what());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[document.id] = document;
  }

  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Stored " << document.length << " bytes as " << document.id;
  return document;
}

std::unique_ptr<ChunkReader> FsChunkStore::open_read_stream(const ObjectId& id) {
  BOOST_LOG_TRIVIAL(debug) << "FsChunkStore: Opening read stream for: " << id;

  FileDocument document;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(id);
    if (it == documents_.end()) {
      throw errors::NotFound("File not found: " + id.to_string());
    }
    document = it->second;
  }
  return std::make_unique<FsChunkReader>(chunk_dir(id), document.length, document.chunk_size);
}


//==============================================
// DELETION
//==============================================

std::size_t FsChunkStore::delete_files(const std::vector<ObjectId>& ids) {
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Deleting " << ids.size() << " file documents";

  std::size_t deleted = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& id : ids) {
    if (documents_.count(id) == 0) {
      continue;
    }
    // The document leaves memory only once its file is gone, so both views agree
    std::error_code ec;
    std::filesystem::remove(document_path(id), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Failed to remove document " << id << ": " << ec.message();
      continue;
    }
    documents_.erase(id);
    ++deleted;
  }
  if (deleted != ids.size()) {
    BOOST_LOG_TRIVIAL(warning) << "FsChunkStore: Removed " << deleted << " of " << ids.size() << " documents";
  }
  return deleted;
}

std::size_t FsChunkStore::delete_chunks(const std::vector<ObjectId>& ids) {
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Deleting chunks of " << ids.size() << " files";

  std::size_t deleted = 0;
  for (const auto& id : ids) {
    std::error_code ec;
    auto removed = std::filesystem::remove_all(chunk_dir(id), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Failed to remove chunks of " << id << ": " << ec.message();
      throw errors::StorageUnavailable("Failed to remove chunks of " + id.to_string());
    }
    if (removed > 0) {
      ++deleted;
    }
  }
  return deleted;
}

void FsChunkStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Clearing entire store at: " << base_path_;
  std::lock_guard<std::mutex> lock(mutex_);
  documents_.clear();
  std::filesystem::remove_all(base_path_);
  check_directory_exists(files_path_);
  check_directory_exists(chunks_path_);
}


//==============================================
// METADATA QUERIES
//==============================================

std::vector<FileDocument> FsChunkStore::query(const Predicate& predicate, const QueryOptions& options) {
  BOOST_LOG_TRIVIAL(debug) << "FsChunkStore: Query " << predicate.to_string();

  std::vector<FileDocument> results;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, document] : documents_) {
      if (predicate.matches(document)) {
        results.push_back(document);
      }
    }
  }

  if (options.sort) {
    const SortSpec& sort = *options.sort;
    // Ties fall back to the id so equal keys keep insertion order
    std::stable_sort(results.begin(), results.end(), [&sort](const FileDocument& a, const FileDocument& b) {
      auto order = compare_values(a.get(sort.field).value_or(Value{}), b.get(sort.field).value_or(Value{}));
      int cmp = order.value_or(0);
      if (cmp == 0) {
        cmp = a.id < b.id ? -1 : (b.id < a.id ? 1 : 0);
      }
      return sort.descending ? cmp > 0 : cmp < 0;
    });
  }

  if (options.group_first_by) {
    std::set<std::string> seen;
    std::vector<FileDocument> firsts;
    for (auto& document : results) {
      if (seen.insert(group_key(document.get(*options.group_first_by))).second) {
        firsts.push_back(std::move(document));
      }
    }
    results = std::move(firsts);
  }

  if (options.ids_only) {
    for (auto& document : results) {
      FileDocument id_only;
      id_only.id = document.id;
      id_only.filename = document.filename;
      document = std::move(id_only);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "FsChunkStore: Query matched " << results.size() << " documents";
  return results;
}

std::vector<Value> FsChunkStore::distinct(const FieldPath& field, const Predicate& predicate) {
  std::map<std::string, Value> unique;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, document] : documents_) {
      if (!predicate.matches(document)) {
        continue;
      }
      if (auto value = document.get(field)) {
        unique.emplace(group_key(value), *value);
      }
    }
  }

  std::vector<Value> values;
  values.reserve(unique.size());
  for (auto& [key, value] : unique) {
    values.push_back(std::move(value));
  }
  std::stable_sort(values.begin(), values.end(), [](const Value& a, const Value& b) {
    if (auto order = compare_values(a, b)) {
      return *order < 0;
    }
    return a.index() < b.index();
  });
  return values;
}

bool FsChunkStore::has_chunks(const ObjectId& id) const {
  return std::filesystem::exists(chunk_dir(id));
}


//==============================================
// METADATA UPDATES
//==============================================

std::size_t FsChunkStore::set_field(const Predicate& predicate, const FieldPath& field, const Value& value) {
  if (field.kind != FieldPath::Kind::METADATA) {
    throw std::invalid_argument("FsChunkStore: Only metadata fields are mutable, got " + field.name());
  }
  BOOST_LOG_TRIVIAL(info) << "FsChunkStore: Setting " << field.name() << " where " << predicate.to_string();

  std::size_t modified = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, document] : documents_) {
    if (!predicate.matches(document)) {
      continue;
    }
    // Memory follows disk: a failed persist leaves this document untouched
    FileDocument updated = document;
    updated.metadata[field.key] = value;
    persist_document(updated);
    document = std::move(updated);
    ++modified;
  }
  return modified;
}

bool FsChunkStore::replace_metadata(const ObjectId& id, const Metadata& metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(id);
  if (it == documents_.end()) {
    return false;
  }
  FileDocument updated = it->second;
  updated.metadata = metadata;
  persist_document(updated);
  it->second = std::move(updated);
  return true;
}


//==============================================
// DOCUMENT PERSISTENCE
//==============================================

void FsChunkStore::load_documents() {
  for (const auto& entry : std::filesystem::directory_iterator(files_path_)) {
    if (entry.path().extension() != ".json") {
      continue;
    }
    try {
      std::ifstream input(entry.path());
      FileDocument document = decode_document(nlohmann::json::parse(input));
      if (document.upload_date > last_upload_) {
        last_upload_ = document.upload_date;
      }
      documents_[document.id] = std::move(document);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "FsChunkStore: Skipping unreadable document " << entry.path().string()
                                 << ": " << e.what();
    }
  }
}

void FsChunkStore::persist_document(const FileDocument& document) const {
  std::filesystem::path target = document_path(document.id);
  std::filesystem::path temp = target;
  temp += ".tmp";

  try {
    std::ofstream output(temp, std::ios::trunc);
    output << encode_document(document).dump();
    output.close();
    if (output.fail()) {
      throw std::runtime_error("write failed for " + temp.string());
    }
    std::filesystem::rename(temp, target);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FsChunkStore: Failed to persist document " << document.id << ": " << e.what();
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    throw errors::StorageUnavailable("Failed to persist document " + document.id.to_string());
  }
}

std::filesystem::path FsChunkStore::document_path(const ObjectId& id) const {
  return files_path_ / (id.to_string() + ".json");
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string FsChunkStore::hash_key(const std::string& key) const {
  DigestContext digest;
  digest.update(key.data(), key.size());
  return digest.hex();
}

std::filesystem::path FsChunkStore::chunk_dir(const ObjectId& id) const {
  std::string hash = hash_key(id.to_string());
  std::filesystem::path path = chunks_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

Timestamp FsChunkStore::next_upload_date() {
  std::lock_guard<std::mutex> lock(mutex_);
  Timestamp now = clock_();
  if (now <= last_upload_) {
    now = last_upload_ + std::chrono::milliseconds(1);
  }
  last_upload_ = now;
  return now;
}

void FsChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace gridfs
} // namespace vstore
