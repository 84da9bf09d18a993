#ifndef PODFS_CONFIG_HPP
#define PODFS_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace config {

struct Config {
  std::filesystem::path store_path = "podfs_store";
  // Empty logs to the console
  std::string log_file;
  logging::severity_level log_level = logging::severity_level::info;
  uint64_t block_size = 1000000;
  size_t max_concurrency = 1;
  // Pod name -> signing key
  std::map<std::string, utils::Bytes> pods;
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config: " + message) {}
};

// Reads an INI file with [store], [log], [upload] and [pods] sections.
// Absent keys keep their defaults; malformed values throw ConfigError.
Config load_config(const std::filesystem::path& path);
Config parse_config(std::istream& input);

} // namespace config
} // namespace podfs

#endif // PODFS_CONFIG_HPP
