#include "bundle/output_sink.hpp"
#include "errors/storage_error.hpp"
#include <boost/log/trivial.hpp>

namespace vstore {
namespace bundle {

std::string SinkHeader::disposition() const {
  std::string escaped;
  for (char c : filename) {
    if (c == '"' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return std::string(inline_disposition ? "inline" : "attachment") + "; filename=\"" + escaped + "\"";
}

//==============================================
// OSTREAM SINK
//==============================================

void OstreamSink::open(const SinkHeader& header) {
  header_ = header;
  state_ = State::OPEN;
}

bool OstreamSink::write(const char* data, std::size_t size) {
  if (closed_ || state_ != State::OPEN) {
    return false;
  }
  output_.write(data, static_cast<std::streamsize>(size));
  if (!output_) {
    return false;
  }
  bytes_written_ += size;
  return true;
}

void OstreamSink::finish() {
  output_.flush();
  state_ = State::COMPLETE;
}

void OstreamSink::abort(const std::string& reason) {
  abort_reason_ = reason;
  state_ = State::INCOMPLETE;
}

//==============================================
// FILE SINK
//==============================================

FileSink::FileSink(std::filesystem::path path)
  : path_(std::move(path)) {
  partial_path_ = path_;
  partial_path_ += ".part";
}

FileSink::~FileSink() {
  if (file_.is_open() && !done_) {
    abort("sink destroyed before the stream ended");
  }
}

void FileSink::open(const SinkHeader& header) {
  BOOST_LOG_TRIVIAL(debug) << "File sink: Writing " << header.filename << " to " << path_.string();
  file_.open(partial_path_, std::ios::binary | std::ios::trunc);
  if (!file_) {
    throw errors::StorageUnavailable("Failed to create " + partial_path_.string());
  }
}

bool FileSink::write(const char* data, std::size_t size) {
  if (!file_.is_open()) {
    return false;
  }
  file_.write(data, static_cast<std::streamsize>(size));
  return static_cast<bool>(file_);
}

void FileSink::finish() {
  file_.close();
  if (file_.fail()) {
    abort("failed to flush output");
    throw errors::StorageUnavailable("Failed to write " + path_.string());
  }
  std::filesystem::rename(partial_path_, path_);
  done_ = true;
}

void FileSink::abort(const std::string& reason) {
  BOOST_LOG_TRIVIAL(warning) << "File sink: Discarding incomplete " << path_.string() << ": " << reason;
  if (file_.is_open()) {
    file_.close();
  }
  std::error_code ec;
  std::filesystem::remove(partial_path_, ec);
  done_ = true;
}

} // namespace bundle
} // namespace vstore
