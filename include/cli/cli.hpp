#ifndef PODFS_CLI_HPP
#define PODFS_CLI_HPP

#include <iostream>
#include <string>
#include <vector>
#include "file/file.hpp"

namespace podfs {
namespace cli {

// Line oriented shell over the file operations
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(file::File& files, const file::Context& context,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Executes a single command line, returns false if the command failed
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    file::File& files_;
    const file::Context& context_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_upload_command(const std::vector<std::string>& args);
    void handle_download_command(const std::vector<std::string>& args);
    void handle_remove_command(const std::vector<std::string>& args);
    void handle_list_command(const std::vector<std::string>& args);
    void handle_share_command(const std::vector<std::string>& args);
    void handle_share_pod_command(const std::vector<std::string>& args);
    void handle_info_command(const std::vector<std::string>& args);
    void handle_save_shared_command(const std::vector<std::string>& args);
    void handle_get_shared_command(const std::vector<std::string>& args);
    void handle_get_from_pod_command(const std::vector<std::string>& args);
    void handle_help_command();

    void write_local_file(const std::string& local_path, const utils::Bytes& data);
    void require_args(const std::vector<std::string>& args, size_t count, const std::string& usage);
};

} // namespace cli
} // namespace podfs

#endif // PODFS_CLI_HPP
