#include "store/version_store.hpp"
#include "errors/storage_error.hpp"
#include "query/translator.hpp"
#include "utils/async.hpp"
#include <boost/log/trivial.hpp>
#include <set>

namespace vstore {
namespace store {

namespace {

gridfs::QueryOptions most_recent_first() {
  gridfs::QueryOptions options;
  options.sort = gridfs::SortSpec{gridfs::FieldPath::upload_date(), true};
  return options;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

VersionStore::VersionStore(Connection& connection)
  : connection_(connection)
  , delete_pool_(2) {}

VersionStore::~VersionStore() {
  delete_pool_.join();
}


//==============================================
// QUERIES
//==============================================

std::vector<FileVersion> VersionStore::find(const query::Filter& filter) {
  gridfs::Predicate predicate = query::translate(filter);
  return connection_.store().query(predicate, most_recent_first());
}

FileVersion VersionStore::find_one(const query::Filter& filter) {
  gridfs::Predicate predicate = query::translate(filter);
  auto matches = connection_.store().query(predicate, most_recent_first());
  if (matches.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Version store: No file matches " << predicate.to_string();
    throw errors::NotFound("File not found");
  }
  return matches.front();
}

CountResult VersionStore::count_files(const query::Filter& filter) {
  gridfs::QueryOptions options;
  options.group_first_by = gridfs::FieldPath::filename();
  options.ids_only = true;
  return {connection_.store().query(query::translate(filter), options).size()};
}

CountResult VersionStore::count_versions(const query::Filter& filter) {
  gridfs::QueryOptions options;
  options.ids_only = true;
  return {connection_.store().query(query::translate(filter), options).size()};
}


//==============================================
// DELETION
//==============================================

DeleteResult VersionStore::delete_by_filter(const query::Filter& filter, bool count_files) {
  gridfs::Predicate predicate = query::translate(filter);
  BOOST_LOG_TRIVIAL(info) << "Version store: Deleting versions matching " << predicate.to_string();

  gridfs::QueryOptions options;
  options.ids_only = true;
  auto matches = connection_.store().query(predicate, options);

  DeleteResult result;
  if (!matches.empty()) {
    std::vector<gridfs::ObjectId> ids;
    std::set<std::string> filenames;
    ids.reserve(matches.size());
    for (const auto& match : matches) {
      ids.push_back(match.id);
      filenames.insert(match.filename);
    }
    result.versions_deleted = delete_by_ids(ids).count;
    if (count_files) {
      result.files_deleted = filenames.size();
    }
  } else if (count_files) {
    result.files_deleted = 0;
  }

  BOOST_LOG_TRIVIAL(info) << "Version store: Deleted " << result.versions_deleted << " versions";
  return result;
}

CountResult VersionStore::delete_by_ids(const std::vector<gridfs::ObjectId>& ids) {
  if (ids.empty()) {
    return {0};
  }

  gridfs::ChunkStore& store = connection_.store();
  auto files_future = utils::post_task(delete_pool_, [&store, &ids] { return store.delete_files(ids); });
  auto chunks_future = utils::post_task(delete_pool_, [&store, &ids] { return store.delete_chunks(ids); });

  // Both deletions are awaited before anything is reported
  std::optional<std::size_t> chunks_deleted;
  try {
    chunks_deleted = chunks_future.get();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Version store: Partial delete failure, chunk deletion failed for "
                             << ids.size() << " ids: " << e.what();
  }
  std::size_t files_deleted = files_future.get();

  if (chunks_deleted && *chunks_deleted != files_deleted) {
    BOOST_LOG_TRIVIAL(warning) << "Version store: Partial delete failure, removed " << files_deleted
                               << " documents but chunks of " << *chunks_deleted << " files";
  }
  return {files_deleted};
}


//==============================================
// WRITES
//==============================================

FileVersion VersionStore::upload(const std::string& container, std::istream& data, const std::string& filename,
                                 const std::string& mime_type, const gridfs::Metadata& custom_metadata) {
  BOOST_LOG_TRIVIAL(info) << "Version store: Uploading " << filename << " to container " << container;

  gridfs::UploadRequest request;
  request.filename = filename;
  request.content_type = mime_type;
  request.metadata = custom_metadata;
  request.metadata["container"] = container;
  request.metadata["filename"] = filename;
  request.metadata["mimetype"] = mime_type;

  return connection_.store().insert_stream(data, request);
}

FileVersion VersionStore::update_metadata(const gridfs::ObjectId& id, const gridfs::Metadata& overlay,
                                          const std::string& container) {
  FileVersion version = find_one(query::Filter::eq("_id", id));
  version.metadata = gridfs::merge_metadata(version.metadata, overlay, container);

  if (!connection_.store().replace_metadata(id, version.metadata)) {
    throw errors::NotFound("File not found");
  }
  BOOST_LOG_TRIVIAL(info) << "Version store: Updated metadata of " << id;
  return version;
}

} // namespace store
} // namespace vstore
