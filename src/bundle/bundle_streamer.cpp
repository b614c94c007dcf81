#include "bundle/bundle_streamer.hpp"
#include "errors/storage_error.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <stdexcept>

namespace vstore {
namespace bundle {

namespace {

const char* const ZIP_CONTENT_TYPE = "application/zip";
const char* const DEFAULT_CONTENT_TYPE = "application/octet-stream";

//==============================================
// RAII WRAPPERS FOR LIBARCHIVE HANDLES
//==============================================

// Write handle that is abandoned, never finalized, unless close() succeeded.
// Freeing an open libarchive writer would otherwise write the central
// directory and make a truncated archive look valid.
struct ArchiveWriter {
  struct archive* handle = nullptr;
  bool closed = false;

  ArchiveWriter() {
    handle = archive_write_new();
    if (!handle) {
      throw errors::StorageUnavailable("Failed to create archive writer");
    }
  }

  ~ArchiveWriter() {
    if (!closed) {
      archive_write_fail(handle);
    }
    archive_write_free(handle);
  }

  ArchiveWriter(const ArchiveWriter&) = delete;
  ArchiveWriter& operator=(const ArchiveWriter&) = delete;
};

struct ArchiveEntry {
  struct archive_entry* handle = nullptr;

  ArchiveEntry() {
    handle = archive_entry_new();
    if (!handle) {
      throw errors::StorageUnavailable("Failed to create archive entry");
    }
  }

  ~ArchiveEntry() {
    archive_entry_free(handle);
  }

  ArchiveEntry(const ArchiveEntry&) = delete;
  ArchiveEntry& operator=(const ArchiveEntry&) = delete;
};

struct SinkContext {
  OutputSink* sink = nullptr;
  bool sink_closed = false;
};

la_ssize_t write_to_sink(struct archive* archive, void* client_data, const void* buffer, size_t length) {
  auto* context = static_cast<SinkContext*>(client_data);
  if (!context->sink->write(static_cast<const char*>(buffer), length)) {
    context->sink_closed = true;
    archive_set_error(archive, ECANCELED, "output sink closed");
    return -1;
  }
  return static_cast<la_ssize_t>(length);
}

// Converts a libarchive failure into the matching storage error
[[noreturn]] void throw_archive_error(struct archive* archive, const SinkContext& context, const std::string& step) {
  if (context.sink_closed) {
    throw errors::BundleAborted("output sink closed during " + step);
  }
  const char* detail = archive_error_string(archive);
  throw errors::StorageUnavailable("Archive " + step + " failed: " + (detail ? detail : "unknown error"));
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BundleStreamer::BundleStreamer(store::Connection& connection, BundleOptions options)
  : connection_(connection)
  , options_(options) {
  if (options_.buffer_size == 0) {
    throw std::invalid_argument("Bundle streamer: Buffer size must be positive");
  }
}


//==============================================
// STREAMING
//==============================================

void BundleStreamer::stream_bundle(OutputSink& sink, const std::vector<store::FileVersion>& versions,
                                   const NameFormatter& names, const std::string& archive_name) {
  if (versions.empty()) {
    throw errors::EmptyBundle("No files in bundle.");
  }
  BOOST_LOG_TRIVIAL(info) << "Bundle streamer: Streaming " << versions.size() << " files as " << archive_name << ".zip";

  SinkHeader header;
  header.content_type = ZIP_CONTENT_TYPE;
  header.filename = NameFormatter::sanitize(archive_name + ".zip");
  sink.open(header);

  try {
    write_archive(sink, versions, names);
    sink.finish();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bundle streamer: Aborting " << archive_name << ".zip: " << e.what();
    sink.abort(e.what());
    throw;
  }
  BOOST_LOG_TRIVIAL(info) << "Bundle streamer: Finished " << archive_name << ".zip";
}

void BundleStreamer::write_archive(OutputSink& sink, const std::vector<store::FileVersion>& versions,
                                   const NameFormatter& names) {
  ArchiveWriter writer;
  SinkContext context;
  context.sink = &sink;

  if (archive_write_set_format_zip(writer.handle) != ARCHIVE_OK) {
    throw_archive_error(writer.handle, context, "format setup");
  }
  // Entry names are UTF-8; sets general purpose bit 11 on every entry
  if (archive_write_set_options(writer.handle, "hdrcharset=UTF-8") != ARCHIVE_OK) {
    throw_archive_error(writer.handle, context, "header charset setup");
  }
  if (!options_.compress && archive_write_zip_set_compression_store(writer.handle) != ARCHIVE_OK) {
    throw_archive_error(writer.handle, context, "compression setup");
  }
  // No blocking: bytes reach the sink as soon as libarchive produces them
  archive_write_set_bytes_per_block(writer.handle, 0);
  archive_write_set_bytes_in_last_block(writer.handle, 1);

  if (archive_write_open(writer.handle, &context, nullptr, write_to_sink, nullptr) != ARCHIVE_OK) {
    throw_archive_error(writer.handle, context, "open");
  }

  gridfs::ChunkStore& store = connection_.store();
  std::set<std::string> used_names;
  std::vector<char> buffer(options_.buffer_size);

  for (const auto& version : versions) {
    std::string entry_name = unique_entry_name(names.format(version), used_names);
    BOOST_LOG_TRIVIAL(debug) << "Bundle streamer: Adding entry " << entry_name << " (" << version.id << ")";

    ArchiveEntry entry;
    archive_entry_set_pathname_utf8(entry.handle, entry_name.c_str());
    archive_entry_set_size(entry.handle, static_cast<la_int64_t>(version.length));
    archive_entry_set_filetype(entry.handle, AE_IFREG);
    archive_entry_set_perm(entry.handle, 0644);
    archive_entry_set_mtime(entry.handle,
      static_cast<time_t>(gridfs::timestamp_to_millis(version.upload_date) / 1000), 0);

    auto reader = store.open_read_stream(version.id);
    if (archive_write_header(writer.handle, entry.handle) != ARCHIVE_OK) {
      throw_archive_error(writer.handle, context, "header for " + entry_name);
    }

    uint64_t copied = 0;
    std::size_t got = 0;
    while ((got = reader->read(buffer.data(), buffer.size())) > 0) {
      if (archive_write_data(writer.handle, buffer.data(), got) < 0) {
        throw_archive_error(writer.handle, context, "data for " + entry_name);
      }
      copied += got;
    }
    if (copied != version.length) {
      throw errors::StorageUnavailable("Read " + std::to_string(copied) + " of " +
                                       std::to_string(version.length) + " bytes of " + version.id.to_string());
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw_archive_error(writer.handle, context, "entry end for " + entry_name);
    }
  }

  if (archive_write_close(writer.handle) != ARCHIVE_OK) {
    throw_archive_error(writer.handle, context, "close");
  }
  writer.closed = true;
}

void BundleStreamer::stream_single(OutputSink& sink, const store::FileVersion& version,
                                   const NameFormatter& name, bool inline_disposition) {
  BOOST_LOG_TRIVIAL(info) << "Bundle streamer: Streaming single file " << version.id;

  // Opened before the sink so a missing file never starts a response
  auto reader = connection_.store().open_read_stream(version.id);

  SinkHeader header;
  header.content_type = version.content_type.empty() ? DEFAULT_CONTENT_TYPE : version.content_type;
  header.filename = name.format(version);
  header.inline_disposition = inline_disposition;
  header.length = version.length;
  sink.open(header);

  try {
    std::vector<char> buffer(options_.buffer_size);
    uint64_t copied = 0;
    std::size_t got = 0;
    while ((got = reader->read(buffer.data(), buffer.size())) > 0) {
      if (!sink.write(buffer.data(), got)) {
        throw errors::BundleAborted("output sink closed after " + std::to_string(copied) + " bytes");
      }
      copied += got;
    }
    if (copied != version.length) {
      throw errors::StorageUnavailable("Read " + std::to_string(copied) + " of " +
                                       std::to_string(version.length) + " bytes of " + version.id.to_string());
    }
    sink.finish();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bundle streamer: Aborting download of " << version.id << ": " << e.what();
    sink.abort(e.what());
    throw;
  }
}

std::string BundleStreamer::unique_entry_name(const std::string& name, std::set<std::string>& used) {
  if (used.insert(name).second) {
    return name;
  }

  std::size_t dot = name.rfind('.');
  std::string stem = (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
  std::string extension = (dot == std::string::npos || dot == 0) ? "" : name.substr(dot);

  for (std::size_t n = 1;; ++n) {
    std::string candidate = stem + " (" + std::to_string(n) + ")" + extension;
    if (used.insert(candidate).second) {
      return candidate;
    }
  }
}

} // namespace bundle
} // namespace vstore
