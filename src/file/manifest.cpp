#include "file/manifest.hpp"
#include "json_fields.hpp"
#include <iomanip>
#include <sstream>

namespace podfs {
namespace file {

std::string block_name(uint64_t index) {
  std::stringstream ss;
  ss << "block-" << std::setw(5) << std::setfill('0') << index;
  return ss.str();
}

utils::Bytes encode_manifest(const Blocks& blocks) {
  json::Document list = json::Document::array();
  for (const auto& block : blocks) {
    json::Document item;
    item["name"] = block.name;
    item["size"] = block.size;
    item["compressed_size"] = block.compressed_size;
    item["reference"] = block.reference;
    list.push_back(std::move(item));
  }

  json::Document root;
  root["blocks"] = std::move(list);
  return json::serialize(root, "manifest");
}

Blocks decode_manifest(const utils::Bytes& document) {
  auto root = json::parse(document, "manifest");
  json::assert_object(root, "manifest");

  auto list = root.find("blocks");
  if (list == root.end()) {
    throw SchemaError("manifest has no 'blocks' field");
  }
  if (!list->is_array()) {
    throw SchemaError("'blocks' is not a list");
  }

  Blocks blocks;
  blocks.reserve(list->size());
  for (const auto& item : *list) {
    if (!item.is_object()) {
      throw SchemaError("block descriptor is not an object");
    }

    Block block;
    block.name = json::require_string(item, "name");
    block.size = json::require_uint(item, "size");
    block.compressed_size = json::require_uint(item, "compressed_size");
    block.reference = json::require_string(item, "reference");
    if (!store::is_reference(block.reference)) {
      throw SchemaError("block '" + block.name + "' has malformed reference");
    }
    blocks.push_back(std::move(block));
  }
  return blocks;
}

} // namespace file
} // namespace podfs
