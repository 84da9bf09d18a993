#ifndef PODFS_UTILS_BYTES_HPP
#define PODFS_UTILS_BYTES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace podfs {
namespace utils {

using Bytes = std::vector<uint8_t>;

// ---- CONVERSIONS ----
// Lowercase hex encoding of raw bytes
std::string to_hex(const uint8_t* data, std::size_t size);
std::string to_hex(const Bytes& data);
// Decodes a hex string, throws std::invalid_argument on odd length or non-hex input
Bytes from_hex(const std::string& hex);
// True when the string is exactly `length` lowercase or uppercase hex characters
bool is_hex(const std::string& value, std::size_t length);

Bytes to_bytes(const std::string& text);
std::string to_string(const Bytes& data);

// True when text is well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF)
bool is_utf8(const std::string& text);

} // namespace utils
} // namespace podfs

#endif // PODFS_UTILS_BYTES_HPP
