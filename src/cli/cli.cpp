#include "cli/cli.hpp"
#include "bundle/output_sink.hpp"
#include "errors/storage_error.hpp"
#include "query/where_parser.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>

namespace vstore {
namespace cli {

namespace {

const char* const DEFAULT_MIME_TYPE = "application/octet-stream";

// Commands whose trailing text is a JSON where filter, with their positional argument count
const std::map<std::string, std::size_t> WHERE_COMMANDS = {
  {"ls", 1},
  {"count", 1},
  {"zip", 2}
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::ContainerIndex& index, bundle::DownloadService& downloads, std::istream& in, std::ostream& out)
  : running_(false)
  , index_(index)
  , downloads_(downloads)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "vstore> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = process_line(line);
    if (running_) {
      out_ << "vstore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::process_line(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string where;
  auto positional = WHERE_COMMANDS.find(command);
  if (positional != WHERE_COMMANDS.end()) {
    std::string arg;
    while (args.size() < positional->second && iss >> arg) {
      args.push_back(arg);
    }
    std::getline(iss >> std::ws, where);
  } else {
    std::string arg;
    while (iss >> arg) {
      args.push_back(arg);
    }
  }

  process_command(command, args, where);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args,
                          const std::string& where) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help") {
      handle_help_command();
    }
    else if (command == "containers" && args.empty()) {
      handle_containers_command();
    }
    else if (command == "ls" && args.size() == 1) {
      handle_list_command(args[0], where);
    }
    else if (command == "count" && args.size() == 1) {
      handle_count_command(args[0], where);
    }
    else if (command == "upload" || command == "replace") {
      handle_upload_command(args, command == "replace");
    }
    else if (command == "versions" && args.size() == 2) {
      handle_versions_command(args[0], args[1]);
    }
    else if (command == "info") {
      handle_info_command(args);
    }
    else if (command == "meta") {
      handle_meta_command(args);
    }
    else if (command == "rm") {
      handle_remove_command(args);
    }
    else if (command == "rmc" && args.size() == 1) {
      handle_remove_container_command(args[0]);
    }
    else if (command == "mv" && args.size() == 2) {
      handle_move_command(args[0], args[1]);
    }
    else if (command == "get") {
      handle_get_command(args);
    }
    else if (command == "zip" && args.size() == 2) {
      handle_zip_command(args[0], args[1], where);
    }
    else if (command == "zipv") {
      handle_zip_versions_command(args);
    }
    else {
      out_ << "Unknown command or invalid arguments, try help" << std::endl;
    }
  } catch (const errors::StorageError& e) {
    log_and_display_error(std::string("Error ") + std::to_string(e.status()) + " ("
                          + errors::error_kind_to_string(e.kind()) + ")", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error", e.what());
  }
}

void CLI::handle_containers_command() {
  for (const auto& container : index_.list_containers()) {
    out_ << container << std::endl;
  }
}

void CLI::handle_list_command(const std::string& container, const std::string& where) {
  auto files = index_.list_current_files(container, query::parse_where(where));
  for (const auto& file : files) {
    print_version(file);
  }
  out_ << files.size() << " files" << std::endl;
}

void CLI::handle_count_command(const std::string& container, const std::string& where) {
  out_ << index_.count_current_files(container, query::parse_where(where)).count << std::endl;
}

void CLI::handle_upload_command(const std::vector<std::string>& args, bool replace) {
  if (args.size() < 2 || args.size() > 3) {
    out_ << "Usage: " << (replace ? "replace" : "upload") << " <container> <local file> [mime type]" << std::endl;
    return;
  }

  auto file = std::make_shared<std::ifstream>(args[1], std::ios::binary);
  if (!*file) {
    out_ << "Error opening file: " << args[1] << std::endl;
    return;
  }

  store::UploadSource source;
  source.filename = std::filesystem::path(args[1]).filename().string();
  source.mime_type = args.size() == 3 ? args[2] : DEFAULT_MIME_TYPE;
  source.data = file;

  auto uploaded = replace ? index_.replace_files(args[0], {source})
                          : index_.upload_files(args[0], {source});
  for (const auto& version : uploaded) {
    print_version(version);
  }
}

void CLI::handle_versions_command(const std::string& container, const std::string& filename) {
  auto versions = index_.list_versions(container, filename);
  for (const auto& version : versions) {
    print_version(version);
  }
  out_ << versions.size() << " versions" << std::endl;
}

void CLI::handle_info_command(const std::vector<std::string>& args) {
  if (args.size() < 2 || args.size() > 3) {
    out_ << "Usage: info <container> <file> [version id]" << std::endl;
    return;
  }

  store::FileVersion version = args.size() == 3 ? index_.get_version(args[0], args[1], args[2])
                                                : index_.get_current_file(args[0], args[1]);
  print_version(version);
  out_ << "  contentType: " << version.content_type << std::endl
       << "  sha256: " << version.sha256 << std::endl;
  for (const auto& [key, value] : version.metadata) {
    out_ << "  metadata." << key << ": " << gridfs::value_to_string(value) << std::endl;
  }
}

void CLI::handle_meta_command(const std::vector<std::string>& args) {
  if (args.size() < 4) {
    out_ << "Usage: meta <container> <file> <version id> <key>=<value>..." << std::endl;
    return;
  }

  gridfs::Metadata overlay;
  for (std::size_t i = 3; i < args.size(); ++i) {
    std::size_t eq_pos = args[i].find('=');
    if (eq_pos == std::string::npos || eq_pos == 0) {
      out_ << "Invalid metadata pair: " << args[i] << std::endl;
      return;
    }
    overlay[args[i].substr(0, eq_pos)] = std::string(args[i].substr(eq_pos + 1));
  }

  print_version(index_.update_version(args[0], args[1], args[2], overlay));
}

void CLI::handle_remove_command(const std::vector<std::string>& args) {
  if (args.size() < 2 || args.size() > 3) {
    out_ << "Usage: rm <container> <file> [version id]" << std::endl;
    return;
  }

  store::DeleteResult result = args.size() == 3 ? index_.delete_version(args[0], args[1], args[2])
                                                : index_.delete_file(args[0], args[1]);
  out_ << "Deleted " << result.versions_deleted << " versions" << std::endl;
}

void CLI::handle_remove_container_command(const std::string& container) {
  store::DeleteResult result = index_.delete_container(container);
  out_ << "Deleted " << result.versions_deleted << " versions of "
       << result.files_deleted.value_or(0) << " files" << std::endl;
}

void CLI::handle_move_command(const std::string& old_name, const std::string& new_name) {
  out_ << "Moved " << index_.rename_container(old_name, new_name).count << " files" << std::endl;
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  if (args.size() < 3 || args.size() > 4) {
    out_ << "Usage: get <container> <file> <destination> [version id]" << std::endl;
    return;
  }

  bundle::FileSink sink(args[2]);
  if (args.size() == 4) {
    downloads_.download_version(sink, args[0], args[1], args[3]);
  } else {
    downloads_.download_file(sink, args[0], args[1]);
  }
  out_ << "Saved " << args[2] << std::endl;
}

void CLI::handle_zip_command(const std::string& container, const std::string& destination,
                             const std::string& where) {
  bundle::FileSink sink(destination);
  downloads_.download_container(sink, container, query::parse_where(where));
  out_ << "Saved " << destination << std::endl;
}

void CLI::handle_zip_versions_command(const std::vector<std::string>& args) {
  if (args.size() != 3) {
    out_ << "Usage: zipv <container> <file> <destination>" << std::endl;
    return;
  }

  bundle::FileSink sink(args[2]);
  downloads_.download_versions(sink, args[0], args[1]);
  out_ << "Saved " << args[2] << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                                  Display this help message" << std::endl;
  out_ << "  containers                            List container names" << std::endl;
  out_ << "  ls <container> [where]                List current files, where is a JSON filter" << std::endl;
  out_ << "  count <container> [where]             Count current files" << std::endl;
  out_ << "  upload <container> <file> [mime]      Add a new version of a local file" << std::endl;
  out_ << "  replace <container> <file> [mime]     Upload and drop older versions" << std::endl;
  out_ << "  versions <container> <file>           List every version of a file" << std::endl;
  out_ << "  info <container> <file> [id]          Show the current or given version" << std::endl;
  out_ << "  meta <container> <file> <id> k=v...   Merge metadata into a version" << std::endl;
  out_ << "  rm <container> <file> [id]            Delete a file or one version" << std::endl;
  out_ << "  rmc <container>                       Delete a container" << std::endl;
  out_ << "  mv <container> <new name>             Rename a container" << std::endl;
  out_ << "  get <container> <file> <dest> [id]    Save the current or given version" << std::endl;
  out_ << "  zip <container> <dest> [where]        Save current files as a ZIP archive" << std::endl;
  out_ << "  zipv <container> <file> <dest>        Save every version as a ZIP archive" << std::endl;
  out_ << "  quit                                  Exit the shell" << std::endl << std::endl;
}

void CLI::print_version(const store::FileVersion& version) {
  out_ << version.id << "  " << version.filename << "  " << version.length << "  "
       << gridfs::format_timestamp(version.upload_date) << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace vstore
