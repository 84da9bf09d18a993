#include "cli/cli.hpp"
#include "file/path.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace podfs {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(file::File& files, const file::Context& context, std::istream& input, std::ostream& output)
  : running_(false)
  , files_(files)
  , context_(context)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "podfs> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    if (!line.empty()) {
      execute(line);
    }

    if (running_) {
      output_ << "podfs> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  iss >> command;

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  try {
    process_command(command, args);
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Command '" << command << "' failed: " << e.what();
    output_ << "Error: " << e.what() << std::endl;
    return false;
  }
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "upload") {
    handle_upload_command(args);
  }
  else if (command == "download") {
    handle_download_command(args);
  }
  else if (command == "rm") {
    handle_remove_command(args);
  }
  else if (command == "ls") {
    handle_list_command(args);
  }
  else if (command == "share") {
    handle_share_command(args);
  }
  else if (command == "share-pod") {
    handle_share_pod_command(args);
  }
  else if (command == "info") {
    handle_info_command(args);
  }
  else if (command == "save-shared") {
    handle_save_shared_command(args);
  }
  else if (command == "get-shared") {
    handle_get_shared_command(args);
  }
  else if (command == "get-from-pod") {
    handle_get_from_pod_command(args);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    throw std::invalid_argument("Unknown command: " + command + " (try 'help')");
  }
}

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  require_args(args, 3, "upload <pod> <local_file> <remote_path>");

  std::ifstream file(args[1], std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open local file: " + args[1]);
  }

  auto meta = files_.upload(context_, args[0], args[2], file);
  output_ << "Uploaded " << meta.file_size << " bytes to " << file::combine(meta.file_path, meta.file_name)
          << " (manifest " << meta.blocks_reference << ")" << std::endl;
}

void CLI::handle_download_command(const std::vector<std::string>& args) {
  require_args(args, 3, "download <pod> <remote_path> <local_file>");
  write_local_file(args[2], files_.download(context_, args[0], args[1]));
}

void CLI::handle_remove_command(const std::vector<std::string>& args) {
  require_args(args, 2, "rm <pod> <remote_path>");
  files_.remove(context_, args[0], args[1]);
  output_ << "Removed " << args[1] << std::endl;
}

void CLI::handle_list_command(const std::vector<std::string>& args) {
  require_args(args, 1, "ls <pod> [directory]");
  if (!context_.account) {
    throw file::NotAuthenticated();
  }

  auto pod = context_.account->resolve_pod(args[0]);
  const std::string directory = file::normalize_directory(args.size() > 1 ? args[1] : "/");
  for (const auto& entry : context_.directory.list(pod.address, directory)) {
    output_ << "  " << (entry.is_file ? "[FILE] " : "[DIR]  ") << entry.name << std::endl;
  }
}

void CLI::handle_share_command(const std::vector<std::string>& args) {
  require_args(args, 2, "share <pod> <remote_path>");
  output_ << files_.share(context_, args[0], args[1]) << std::endl;
}

void CLI::handle_share_pod_command(const std::vector<std::string>& args) {
  require_args(args, 1, "share-pod <pod>");
  output_ << files_.share_pod(context_, args[0]) << std::endl;
}

void CLI::handle_info_command(const std::vector<std::string>& args) {
  require_args(args, 1, "info <reference>");
  auto info = files_.get_shared_info(context_, args[0]);
  output_ << "Source:   " << info.source_address << "\n"
          << "Pod:      " << info.meta.pod_name << "\n"
          << "Path:     " << file::combine(info.meta.file_path, info.meta.file_name) << "\n"
          << "Size:     " << info.meta.file_size << " bytes\n"
          << "Blocks:   " << info.meta.block_size << " bytes each\n"
          << "Type:     " << info.meta.content_type << std::endl;
}

void CLI::handle_save_shared_command(const std::vector<std::string>& args) {
  require_args(args, 3, "save-shared <pod> <parent_path> <reference> [name]");
  file::ReceiveOptions options;
  if (args.size() > 3) {
    options.name = args[3];
  }
  auto meta = files_.save_shared(context_, args[0], args[1], args[2], options);
  output_ << "Saved " << file::combine(meta.file_path, meta.file_name) << " in pod " << meta.pod_name << std::endl;
}

void CLI::handle_get_shared_command(const std::vector<std::string>& args) {
  require_args(args, 2, "get-shared <reference> <local_file>");
  write_local_file(args[1], files_.download_shared(context_, args[0]));
}

void CLI::handle_get_from_pod_command(const std::vector<std::string>& args) {
  require_args(args, 3, "get-from-pod <pod_reference> <remote_path> <local_file>");
  write_local_file(args[2], files_.download_from_shared_pod(context_, args[0], args[1]));
}

void CLI::handle_help_command() {
  output_ << "Commands:\n"
          << "  upload <pod> <local_file> <remote_path>\n"
          << "  download <pod> <remote_path> <local_file>\n"
          << "  rm <pod> <remote_path>\n"
          << "  ls <pod> [directory]\n"
          << "  share <pod> <remote_path>\n"
          << "  share-pod <pod>\n"
          << "  info <reference>\n"
          << "  save-shared <pod> <parent_path> <reference> [name]\n"
          << "  get-shared <reference> <local_file>\n"
          << "  get-from-pod <pod_reference> <remote_path> <local_file>\n"
          << "  help\n"
          << "  quit" << std::endl;
}


//==============================================
// UTILITY METHODS
//==============================================

void CLI::write_local_file(const std::string& local_path, const utils::Bytes& data) {
  std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("Cannot create local file: " + local_path);
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file.good()) {
    throw std::runtime_error("Failed to write local file: " + local_path);
  }
  output_ << "Wrote " << data.size() << " bytes to " << local_path << std::endl;
}

void CLI::require_args(const std::vector<std::string>& args, size_t count, const std::string& usage) {
  if (args.size() < count) {
    throw std::invalid_argument("Usage: " + usage);
  }
}

} // namespace cli
} // namespace podfs
