#include "bundle/bundle_streamer.hpp"
#include "bundle/download_service.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/connection.hpp"
#include "store/container_index.hpp"
#include "store/version_store.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  vstore::store::StorageOptions storage;
  std::string log_file{"vstore.log"};
  vstore::logger::severity_level log_level{vstore::logger::severity_level::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-r <root>] [-d <database>] [-u <url>] [-c <chunk size>]"
            << " [-l <log file>] [-v <log level>]\n"
            << "Optional arguments:\n"
            << "  -r, --root         Storage root directory (default ./vstore-data)\n"
            << "  -d, --database     Database name under the root (default vstore)\n"
            << "  -u, --url          Full storage location, overrides root and database\n"
            << "  -c, --chunk-size   Chunk size in bytes (default 261120)\n"
            << "  -l, --log-file     Log file (default vstore.log)\n"
            << "  -v, --log-level    trace, debug, info, warning, error or fatal\n"
            << "Example: " << program_name << " -r /var/lib/vstore -d assets\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-r", "--root",
    "-d", "--database",
    "-u", "--url",
    "-c", "--chunk-size",
    "-l", "--log-file",
    "-v", "--log-level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-r" || flag == "--root") {
      options.storage.root = value;
    } else if (flag == "-d" || flag == "--database") {
      options.storage.database = value;
    } else if (flag == "-u" || flag == "--url") {
      options.storage.url = value;
    } else if (flag == "-c" || flag == "--chunk-size") {
      try {
        unsigned long chunk_size = std::stoul(value);
        if (chunk_size == 0 || chunk_size > 16 * 1024 * 1024) {
          throw std::out_of_range("chunk size");
        }
        options.storage.chunk_size = static_cast<uint32_t>(chunk_size);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid chunk size\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      try {
        options.log_level = vstore::logger::parse_severity(value);
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.storage.url.empty() && (options.storage.root.empty() || options.storage.database.empty())) {
    std::cerr << "Error: Root and database must not be empty\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    vstore::logger::init_logging(options.log_file, options.log_level);

    vstore::store::Connection connection(options.storage);
    vstore::store::VersionStore versions(connection);
    vstore::store::ContainerIndex index(versions);
    vstore::bundle::BundleStreamer streamer(connection);
    vstore::bundle::DownloadService downloads(index, streamer);
    vstore::cli::CLI cli(index, downloads);

    // Fail at startup rather than on the first command
    connection.store();
    std::cout << "Storage at " << vstore::store::Connection::resolve_location(options.storage) << '\n';

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
