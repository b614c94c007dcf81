#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>

namespace vstore {
namespace bundle {

// Response description handed to the sink before the first byte
struct SinkHeader {
  std::string content_type;
  std::string filename;
  bool inline_disposition = false;
  std::optional<uint64_t> length;

  // Content-Disposition value for HTTP-style callers
  std::string disposition() const;
};

// Destination of a download. Every stream ends with exactly one of finish()
// or abort(); an aborted stream must not look like a complete file.
class OutputSink {
public:
  virtual ~OutputSink() = default;

  virtual void open(const SinkHeader& header) = 0;
  // Returns false once the receiving side has gone away
  virtual bool write(const char* data, std::size_t size) = 0;
  virtual void finish() = 0;
  virtual void abort(const std::string& reason) = 0;
};

// Sink over a caller owned std::ostream
class OstreamSink : public OutputSink {
public:
  enum class State {
    IDLE,
    OPEN,
    COMPLETE,
    INCOMPLETE
  };

  explicit OstreamSink(std::ostream& output) : output_(output) {}

  void open(const SinkHeader& header) override;
  bool write(const char* data, std::size_t size) override;
  void finish() override;
  void abort(const std::string& reason) override;

  // Makes further writes fail, as a disconnected receiver would
  void close_early() { closed_ = true; }

  State state() const { return state_; }
  const SinkHeader& header() const { return header_; }
  const std::string& abort_reason() const { return abort_reason_; }
  uint64_t bytes_written() const { return bytes_written_; }

private:
  std::ostream& output_;
  State state_ = State::IDLE;
  SinkHeader header_;
  std::string abort_reason_;
  uint64_t bytes_written_ = 0;
  bool closed_ = false;
};

// Sink writing {path}.part and renaming it to path on finish. Abort removes
// the partial file, so a failed download never leaves a file at path.
class FileSink : public OutputSink {
public:
  explicit FileSink(std::filesystem::path path);
  ~FileSink() override;

  void open(const SinkHeader& header) override;
  bool write(const char* data, std::size_t size) override;
  void finish() override;
  void abort(const std::string& reason) override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::filesystem::path partial_path_;
  std::ofstream file_;
  bool done_ = false;
};

} // namespace bundle
} // namespace vstore
