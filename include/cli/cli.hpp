#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "bundle/download_service.hpp"
#include "store/container_index.hpp"

namespace vstore {
namespace cli {

// Interactive shell over the container index and download operations
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(store::ContainerIndex& index, bundle::DownloadService& downloads,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Runs one command line, returns false on quit
    bool process_line(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    store::ContainerIndex& index_;
    bundle::DownloadService& downloads_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args,
                         const std::string& where);
    void handle_containers_command();
    void handle_list_command(const std::string& container, const std::string& where);
    void handle_count_command(const std::string& container, const std::string& where);
    void handle_upload_command(const std::vector<std::string>& args, bool replace);
    void handle_versions_command(const std::string& container, const std::string& filename);
    void handle_info_command(const std::vector<std::string>& args);
    void handle_meta_command(const std::vector<std::string>& args);
    void handle_remove_command(const std::vector<std::string>& args);
    void handle_remove_container_command(const std::string& container);
    void handle_move_command(const std::string& old_name, const std::string& new_name);
    void handle_get_command(const std::vector<std::string>& args);
    void handle_zip_command(const std::string& container, const std::string& destination, const std::string& where);
    void handle_zip_versions_command(const std::vector<std::string>& args);
    void handle_help_command();

    void print_version(const store::FileVersion& version);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace vstore
