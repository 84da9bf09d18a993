#include "file/metadata.hpp"
#include "json_fields.hpp"

namespace podfs {
namespace file {

bool FileMetadata::operator==(const FileMetadata& other) const {
  return version == other.version &&
         pod_address == other.pod_address &&
         pod_name == other.pod_name &&
         file_path == other.file_path &&
         file_name == other.file_name &&
         file_size == other.file_size &&
         block_size == other.block_size &&
         content_type == other.content_type &&
         compression == other.compression &&
         creation_time == other.creation_time &&
         access_time == other.access_time &&
         modification_time == other.modification_time &&
         blocks_reference == other.blocks_reference;
}

//==============================================
// JSON CONVERSION
//==============================================

nlohmann::ordered_json metadata_to_json(const FileMetadata& meta) {
  json::Document node;
  node["version"] = meta.version;
  node["pod_address"] = meta.pod_address;
  node["pod_name"] = meta.pod_name;
  node["file_path"] = meta.file_path;
  node["file_name"] = meta.file_name;
  node["file_size"] = meta.file_size;
  node["block_size"] = meta.block_size;
  node["content_type"] = meta.content_type;
  node["compression"] = meta.compression;
  node["creation_time"] = meta.creation_time;
  node["access_time"] = meta.access_time;
  node["modification_time"] = meta.modification_time;
  node["blocks_reference"] = meta.blocks_reference;
  return node;
}

FileMetadata metadata_from_json(const nlohmann::ordered_json& node) {
  json::assert_object(node, "metadata");

  // Version decides the layout, so it is checked before anything else
  const auto& version = json::require_field(node, "version");
  if (!version.is_number_unsigned() || version.get<uint64_t>() != META_VERSION) {
    throw VersionError(version.dump());
  }

  FileMetadata meta;
  meta.version = META_VERSION;
  meta.pod_address = json::require_string(node, "pod_address");
  meta.pod_name = json::require_string(node, "pod_name");
  meta.file_path = json::require_string(node, "file_path");
  meta.file_name = json::require_string(node, "file_name");
  meta.file_size = json::require_uint(node, "file_size");
  meta.block_size = json::require_uint(node, "block_size");
  meta.content_type = json::optional_string(node, "content_type");
  meta.compression = json::optional_string(node, "compression");
  meta.creation_time = json::require_uint(node, "creation_time");
  meta.access_time = json::require_uint(node, "access_time");
  meta.modification_time = json::require_uint(node, "modification_time");
  meta.blocks_reference = json::require_string(node, "blocks_reference");
  return meta;
}

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

utils::Bytes encode_metadata(const FileMetadata& meta) {
  return json::serialize(metadata_to_json(meta), "metadata");
}

FileMetadata decode_metadata(const utils::Bytes& document) {
  return metadata_from_json(json::parse(document, "metadata"));
}

} // namespace file
} // namespace podfs
