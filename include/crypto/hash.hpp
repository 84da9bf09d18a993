#ifndef PODFS_CRYPTO_HASH_HPP
#define PODFS_CRYPTO_HASH_HPP

#include <cstdint>
#include <string>
#include "crypto_error.hpp"
#include "utils/bytes.hpp"

namespace podfs::crypto {

static constexpr size_t DIGEST_SIZE = 32;    // SHA-256
static constexpr size_t ADDRESS_SIZE = 20;   // owner address length in bytes

// SHA-256 over a buffer using OpenSSL EVP
utils::Bytes sha256(const uint8_t* data, size_t size);
utils::Bytes sha256(const utils::Bytes& data);

// Hex encoded SHA-256, used for content addresses and feed topics
std::string sha256_hex(const utils::Bytes& data);
std::string sha256_hex(const std::string& data);

// Owner address bound to a signing key: first ADDRESS_SIZE bytes of SHA-256(key), hex encoded
std::string address_from_key(const utils::Bytes& signing_key);

// Cryptographically secure random bytes
utils::Bytes random_bytes(size_t size);

} // namespace podfs::crypto

#endif // PODFS_CRYPTO_HASH_HPP
