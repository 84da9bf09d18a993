#include "file/block_codec.hpp"
#include "file/file_error.hpp"
#include <algorithm>

namespace podfs {
namespace file {

std::vector<utils::Bytes> split(const utils::Bytes& data, uint64_t block_size) {
  if (block_size == 0) {
    throw InvalidBlockSize();
  }

  std::vector<utils::Bytes> blocks;
  blocks.reserve(static_cast<size_t>((data.size() + block_size - 1) / block_size));

  for (uint64_t offset = 0; offset < data.size(); offset += block_size) {
    uint64_t end = std::min<uint64_t>(offset + block_size, data.size());
    blocks.emplace_back(data.begin() + offset, data.begin() + end);
  }
  return blocks;
}

utils::Bytes join(const std::vector<utils::Bytes>& blocks) {
  size_t total = 0;
  for (const auto& block : blocks) {
    total += block.size();
  }

  utils::Bytes result;
  result.reserve(total);
  for (const auto& block : blocks) {
    result.insert(result.end(), block.begin(), block.end());
  }
  return result;
}

BlockReader::BlockReader(std::istream& input, uint64_t block_size)
  : input_(input)
  , block_size_(block_size) {
  if (block_size_ == 0) {
    throw InvalidBlockSize();
  }
}

std::optional<utils::Bytes> BlockReader::next() {
  if (!input_.good()) {
    return std::nullopt;
  }

  utils::Bytes block(static_cast<size_t>(block_size_));
  input_.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
  auto bytes_read = input_.gcount();

  if (input_.bad()) {
    throw FileError("Block reader: Failed to read from input stream");
  }
  if (bytes_read <= 0) {
    return std::nullopt;
  }

  block.resize(static_cast<size_t>(bytes_read));
  bytes_read_ += static_cast<uint64_t>(bytes_read);
  ++blocks_read_;
  return block;
}

} // namespace file
} // namespace podfs
