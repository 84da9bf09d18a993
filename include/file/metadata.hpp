#ifndef PODFS_FILE_METADATA_HPP
#define PODFS_FILE_METADATA_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "store/content_store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace file {

// Schema tag written into every metadata record
static constexpr uint64_t META_VERSION = 2;

struct FileMetadata {
  uint64_t version = META_VERSION;
  std::string pod_address;
  std::string pod_name;
  std::string file_path;      // parent directory, excludes file_name
  std::string file_name;
  uint64_t file_size = 0;
  uint64_t block_size = 0;
  std::string content_type;
  std::string compression;    // kept for wire compatibility, always empty
  uint64_t creation_time = 0;
  uint64_t access_time = 0;
  uint64_t modification_time = 0;
  store::Reference blocks_reference;

  bool operator==(const FileMetadata& other) const;
  bool operator!=(const FileMetadata& other) const { return !(*this == other); }
};

// ---- SERIALIZATION AND DESERIALIZATION ----
utils::Bytes encode_metadata(const FileMetadata& meta);
// Throws FormatError, SchemaError or VersionError. Does not check fileSize consistency.
FileMetadata decode_metadata(const utils::Bytes& document);

// Object form, used when metadata is nested inside a share capsule
nlohmann::ordered_json metadata_to_json(const FileMetadata& meta);
FileMetadata metadata_from_json(const nlohmann::ordered_json& node);

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_METADATA_HPP
