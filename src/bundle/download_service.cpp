#include "bundle/download_service.hpp"
#include "errors/storage_error.hpp"
#include <boost/log/trivial.hpp>

namespace vstore {
namespace bundle {

namespace {

const char* const FILENAME_PATTERN = "{$filename}";
const char* const VERSION_PATTERN = "{$_id}_{$filename}";

// Aliases are literal names; braces are kept out of the pattern language
std::string literal(const std::string& name) {
  std::string escaped;
  escaped.reserve(name.size());
  for (char c : name) {
    escaped += (c == '{' || c == '}') ? '_' : c;
  }
  return escaped;
}

} // namespace

//==============================================
// CONTAINERS
//==============================================

void DownloadService::download_container(OutputSink& sink, const std::string& container,
                                         const query::Filter& filter) {
  BOOST_LOG_TRIVIAL(info) << "Download service: Container " << container;
  auto versions = index_.list_current_files(container, filter);
  if (versions.empty()) {
    throw errors::EmptyBundle("No files in container.");
  }
  streamer_.stream_bundle(sink, versions, NameFormatter(FILENAME_PATTERN), container);
}

void DownloadService::download_current_where(OutputSink& sink, const std::string& container,
                                             const query::Filter& filter, const std::string& alias,
                                             bool inline_disposition) {
  auto versions = index_.list_current_files(container, filter);
  if (versions.empty()) {
    throw errors::EmptyBundle("No files in container.");
  }
  NameFormatter name(alias.empty() ? std::string(FILENAME_PATTERN) : literal(alias));
  streamer_.stream_single(sink, versions.front(), name, inline_disposition);
}


//==============================================
// LINEAGES
//==============================================

void DownloadService::download_file(OutputSink& sink, const std::string& container, const std::string& filename,
                                    const std::string& alias, bool inline_disposition) {
  BOOST_LOG_TRIVIAL(info) << "Download service: File " << container << "/" << filename;
  store::FileVersion current = index_.get_current_file(container, filename);
  NameFormatter name(alias.empty() ? std::string(FILENAME_PATTERN) : literal(alias));
  streamer_.stream_single(sink, current, name, inline_disposition);
}

void DownloadService::download_versions(OutputSink& sink, const std::string& container,
                                        const std::string& filename, const std::string& alias,
                                        const query::Filter& filter) {
  BOOST_LOG_TRIVIAL(info) << "Download service: Versions of " << container << "/" << filename;
  auto versions = index_.list_versions(container, filename, filter);
  if (versions.empty()) {
    throw errors::EmptyBundle("No files in container.");
  }
  std::string base = alias.empty() ? filename : alias;
  NameFormatter names("{$_id}_" + (alias.empty() ? std::string(FILENAME_PATTERN) : literal(alias)));
  streamer_.stream_bundle(sink, versions, names, base);
}

void DownloadService::download_version(OutputSink& sink, const std::string& container,
                                       const std::string& filename, const std::string& version_id,
                                       const std::string& alias, bool inline_disposition) {
  BOOST_LOG_TRIVIAL(info) << "Download service: Version " << version_id << " of " << container << "/" << filename;
  store::FileVersion version = index_.get_version(container, filename, version_id);
  NameFormatter name(alias.empty() ? std::string(VERSION_PATTERN) : literal(alias));
  streamer_.stream_single(sink, version, name, inline_disposition);
}

} // namespace bundle
} // namespace vstore
