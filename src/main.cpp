#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "services/account.hpp"
#include "services/directory.hpp"
#include "services/feed.hpp"
#include "store/content_store.hpp"
#include "store/store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_path;
  std::string store_path;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config.ini>] [-s <store_dir>]\n"
        << "Optional arguments:\n"
        << "  -c, --config  INI file with [store], [log], [upload] and [pods] sections\n"
        << "  -s, --store   Store directory, overrides store.path from the config\n"
        << "Example: " << program_name << " -c podfs.ini\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {"-c", "--config", "-s", "--store"};

  ProgramOptions options;

  if ((argc - 1) % 2 != 0) {
    std::cerr << "Error: Every flag needs a value\n";
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

    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else {
      options.store_path = value;
    }
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    podfs::config::Config config;
    if (!options.config_path.empty()) {
      config = podfs::config::load_config(options.config_path);
    }
    if (!options.store_path.empty()) {
      config.store_path = options.store_path;
    }

    if (config.log_file.empty()) {
      podfs::logging::init_console_logging(config.log_level);
    } else {
      podfs::logging::init_logging(config.log_file, config.log_level);
    }

    podfs::store::Store store(config.store_path);
    podfs::store::LocalContentStore content_store(store);
    podfs::services::LocalFeed feed(store);
    podfs::services::LocalDirectory directory(store);
    podfs::services::LocalAccount account(config.pods);
    if (!config.pods.empty()) {
      account.login();
    }

    podfs::file::Context context{content_store, feed, directory, &account};

    podfs::file::UploadOptions upload_options;
    upload_options.block_size = config.block_size;
    upload_options.max_concurrency = config.max_concurrency;
    podfs::file::DownloadOptions download_options;
    download_options.max_concurrency = config.max_concurrency;

    podfs::file::File files(upload_options, download_options);
    podfs::cli::CLI cli(files, context);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start podfs: " << e.what() << '\n';
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
