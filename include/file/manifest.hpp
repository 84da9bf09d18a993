#ifndef PODFS_FILE_MANIFEST_HPP
#define PODFS_FILE_MANIFEST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "store/content_store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace file {

// One uploaded slice of a file
struct Block {
  std::string name;
  uint64_t size = 0;
  uint64_t compressed_size = 0;
  store::Reference reference;

  bool operator==(const Block& other) const {
    return name == other.name && size == other.size &&
           compressed_size == other.compressed_size && reference == other.reference;
  }
  bool operator!=(const Block& other) const { return !(*this == other); }
};

// Order is the reassembly order
using Blocks = std::vector<Block>;

// Name of the block at the given ordinal: block-00000, block-00001, ...
std::string block_name(uint64_t index);

// {"blocks":[{"name":..,"size":..,"compressed_size":..,"reference":..}, ...]}
utils::Bytes encode_manifest(const Blocks& blocks);
// Throws FormatError for unparseable documents, SchemaError for bad descriptors
Blocks decode_manifest(const utils::Bytes& document);

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_MANIFEST_HPP
