#pragma once

#include <string>
#include "bundle/bundle_streamer.hpp"
#include "bundle/output_sink.hpp"
#include "query/filter.hpp"
#include "store/container_index.hpp"

namespace vstore {
namespace bundle {

// Download operations over containers and lineages. Selections come from the
// container index; bytes go out through the bundle streamer.
class DownloadService {
public:
  DownloadService(store::ContainerIndex& index, BundleStreamer& streamer)
    : index_(index), streamer_(streamer) {}

  // ---- CONTAINERS ----
  // Current version of every matching file as {container}.zip
  void download_container(OutputSink& sink, const std::string& container, const query::Filter& filter = {});
  // First current file matching filter, named alias when given
  void download_current_where(OutputSink& sink, const std::string& container, const query::Filter& filter,
                              const std::string& alias = "", bool inline_disposition = false);


  // ---- LINEAGES ----
  // Current version of one filename
  void download_file(OutputSink& sink, const std::string& container, const std::string& filename,
                     const std::string& alias = "", bool inline_disposition = false);
  // Every matching version of one filename as {alias or filename}.zip with
  // entries named {_id}_{alias or filename}
  void download_versions(OutputSink& sink, const std::string& container, const std::string& filename,
                         const std::string& alias = "", const query::Filter& filter = {});
  // One version, named {_id}_{filename} unless alias is given
  void download_version(OutputSink& sink, const std::string& container, const std::string& filename,
                        const std::string& version_id, const std::string& alias = "",
                        bool inline_disposition = false);

private:
  store::ContainerIndex& index_;
  BundleStreamer& streamer_;
};

} // namespace bundle
} // namespace vstore
