#include "utils/bytes.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace podfs {
namespace utils {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string to_hex(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const Bytes& data) {
  return to_hex(data.data(), data.size());
}

Bytes from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length");
  }

  Bytes result;
  result.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Invalid hex character in: " + hex);
    }
    result.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return result;
}

bool is_hex(const std::string& value, std::size_t length) {
  if (value.size() != length) {
    return false;
  }
  for (char c : value) {
    if (hex_value(c) < 0) {
      return false;
    }
  }
  return true;
}

Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

std::string to_string(const Bytes& data) {
  return std::string(data.begin(), data.end());
}

bool is_utf8(const std::string& text) {
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    size_t length = 0;
    uint8_t low = 0x80;
    uint8_t high = 0xbf;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if (lead >= 0xc2 && lead <= 0xdf) {
      length = 2;
    } else if (lead >= 0xe0 && lead <= 0xef) {
      length = 3;
      if (lead == 0xe0) low = 0xa0;
      if (lead == 0xed) high = 0x9f;
    } else if (lead >= 0xf0 && lead <= 0xf4) {
      length = 4;
      if (lead == 0xf0) low = 0x90;
      if (lead == 0xf4) high = 0x8f;
    } else {
      return false;
    }

    if (i + length > text.size()) {
      return false;
    }
    // Only the first continuation byte has a narrowed range
    for (size_t k = 1; k < length; ++k) {
      const auto c = static_cast<uint8_t>(text[i + k]);
      if (c < low || c > high) {
        return false;
      }
      low = 0x80;
      high = 0xbf;
    }
    i += length;
  }
  return true;
}

} // namespace utils
} // namespace podfs
