#include "config/config.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace podfs {
namespace config {

namespace pt = boost::property_tree;

namespace {

template <typename T>
T get_positive(const pt::ptree& tree, const std::string& key, T fallback) {
  auto value = tree.get_optional<std::string>(key);
  if (!value) {
    return fallback;
  }
  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(*value, &consumed);
    if (consumed != value->size() || parsed == 0 || value->front() == '-') {
      throw ConfigError(key + " must be a positive integer, got '" + *value + "'");
    }
    return static_cast<T>(parsed);
  } catch (const std::logic_error&) {
    throw ConfigError(key + " must be a positive integer, got '" + *value + "'");
  }
}

} // namespace

Config parse_config(std::istream& input) {
  pt::ptree tree;
  try {
    pt::read_ini(input, tree);
  } catch (const pt::ini_parser_error& e) {
    throw ConfigError(e.message() + " at line " + std::to_string(e.line()));
  }

  Config config;
  config.store_path = tree.get<std::string>("store.path", config.store_path.string());
  config.log_file = tree.get<std::string>("log.file", config.log_file);
  if (auto level = tree.get_optional<std::string>("log.level")) {
    try {
      config.log_level = logging::parse_severity(*level);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(e.what());
    }
  }
  config.block_size = get_positive<uint64_t>(tree, "upload.block_size", config.block_size);
  config.max_concurrency = get_positive<size_t>(tree, "upload.max_concurrency", config.max_concurrency);

  if (auto pods = tree.get_child_optional("pods")) {
    for (const auto& [name, key] : *pods) {
      try {
        utils::Bytes signing_key = utils::from_hex(key.data());
        if (signing_key.empty()) {
          throw ConfigError("empty signing key for pod " + name);
        }
        config.pods[name] = signing_key;
      } catch (const std::invalid_argument&) {
        throw ConfigError("signing key for pod " + name + " is not hex");
      }
    }
  }
  return config;
}

Config load_config(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input) {
    throw ConfigError("cannot open " + path.string());
  }
  Config config = parse_config(input);
  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << path.string() << " with " << config.pods.size() << " pods";
  return config;
}

} // namespace config
} // namespace podfs
