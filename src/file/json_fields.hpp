#ifndef PODFS_FILE_JSON_FIELDS_HPP
#define PODFS_FILE_JSON_FIELDS_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "file/file_error.hpp"
#include "utils/bytes.hpp"

// Field access helpers shared by the manifest, metadata and share codecs

namespace podfs {
namespace file {
namespace json {

// Keeps insertion order so documents are written in wire field order
using Document = nlohmann::ordered_json;

inline Document parse(const utils::Bytes& document, const char* what) {
  try {
    return Document::parse(document.begin(), document.end());
  } catch (const nlohmann::json::parse_error& e) {
    throw FormatError(std::string(what) + ": " + e.what());
  }
}

inline utils::Bytes serialize(const Document& root, const char* what) {
  try {
    return utils::to_bytes(root.dump());
  } catch (const nlohmann::json::type_error& e) {
    // Raised for strings that are not UTF-8
    throw FormatError(std::string(what) + ": " + e.what());
  }
}

inline const Document& require_field(const Document& node, const std::string& key) {
  auto it = node.find(key);
  if (it == node.end()) {
    throw SchemaError("missing field '" + key + "'");
  }
  return *it;
}

inline const Document& require_object(const Document& node, const std::string& key) {
  const auto& value = require_field(node, key);
  if (!value.is_object()) {
    throw SchemaError("field '" + key + "' is not an object");
  }
  return value;
}

inline std::string require_string(const Document& node, const std::string& key) {
  const auto& value = require_field(node, key);
  if (!value.is_string()) {
    throw SchemaError("field '" + key + "' is not a string");
  }
  return value.get<std::string>();
}

inline std::string optional_string(const Document& node, const std::string& key) {
  if (node.find(key) == node.end()) {
    return std::string();
  }
  return require_string(node, key);
}

inline uint64_t require_uint(const Document& node, const std::string& key) {
  const auto& value = require_field(node, key);
  if (!value.is_number_unsigned()) {
    throw SchemaError("field '" + key + "' is not an unsigned integer");
  }
  return value.get<uint64_t>();
}

// Top level of every document is an object
inline void assert_object(const Document& root, const char* what) {
  if (!root.is_object()) {
    throw SchemaError(std::string(what) + " is not an object");
  }
}

} // namespace json
} // namespace file
} // namespace podfs

#endif // PODFS_FILE_JSON_FIELDS_HPP
