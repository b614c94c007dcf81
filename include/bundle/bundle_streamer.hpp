#pragma once

#include <set>
#include <string>
#include <vector>
#include "bundle/name_formatter.hpp"
#include "bundle/output_sink.hpp"
#include "store/connection.hpp"
#include "store/version_store.hpp"

namespace vstore {
namespace bundle {

struct BundleOptions {
  // Deflate entries; stored entries otherwise
  bool compress = true;
  // Bytes requested from the chunk reader per read
  std::size_t buffer_size = 64 * 1024;
};

// Streams file versions to an output sink, either as one ZIP archive with an
// entry per version or as the raw bytes of a single version. Bytes move from
// the chunk store to the sink a buffer at a time.
class BundleStreamer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BundleStreamer(store::Connection& connection, BundleOptions options = {});


  // ---- STREAMING ----
  // Writes one archive entry per version in order. Throws errors::EmptyBundle
  // before touching the sink when versions is empty. On any failure the
  // archive is abandoned, the sink is aborted and the error rethrown;
  // errors::BundleAborted when the sink stops accepting bytes.
  void stream_bundle(OutputSink& sink, const std::vector<store::FileVersion>& versions,
                     const NameFormatter& names, const std::string& archive_name);
  // Writes the bytes of one version with no container format
  void stream_single(OutputSink& sink, const store::FileVersion& version,
                     const NameFormatter& name, bool inline_disposition);


  // Appends " (n)" before the extension until the name is unused, then records it
  static std::string unique_entry_name(const std::string& name, std::set<std::string>& used);

private:
  // ---- PARAMETERS ----
  store::Connection& connection_;
  BundleOptions options_;

  void write_archive(OutputSink& sink, const std::vector<store::FileVersion>& versions,
                     const NameFormatter& names);
};

} // namespace bundle
} // namespace vstore
