#ifndef PODFS_FILE_BLOCK_CODEC_HPP
#define PODFS_FILE_BLOCK_CODEC_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <vector>
#include "utils/bytes.hpp"

namespace podfs {
namespace file {

// Splits data into slices of block_size bytes, the last one possibly shorter.
// Empty data yields no slices. Throws InvalidBlockSize when block_size is 0.
std::vector<utils::Bytes> split(const utils::Bytes& data, uint64_t block_size);

// Concatenates slices in the given order
utils::Bytes join(const std::vector<utils::Bytes>& blocks);

// Pulls block_size slices from a stream without buffering the whole payload
class BlockReader {
public:
  BlockReader(std::istream& input, uint64_t block_size);

  // Next slice, std::nullopt once the stream is exhausted
  std::optional<utils::Bytes> next();

  uint64_t bytes_read() const { return bytes_read_; }
  uint64_t blocks_read() const { return blocks_read_; }

private:
  std::istream& input_;
  uint64_t block_size_;
  uint64_t bytes_read_ = 0;
  uint64_t blocks_read_ = 0;
};

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_BLOCK_CODEC_HPP
