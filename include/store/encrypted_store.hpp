#ifndef PODFS_STORE_ENCRYPTED_STORE_HPP
#define PODFS_STORE_ENCRYPTED_STORE_HPP

#include <string>
#include "store/content_store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace store {

// Capability-bearing address: the content address of a ciphertext object
// followed by the key that decrypts it. Rendered as 128 hex characters.
class EncryptedReference {
public:
  static constexpr size_t HEX_LENGTH = 128;
  static constexpr size_t KEY_SIZE = 32;

  EncryptedReference(Reference address, utils::Bytes key);

  // True when value has the shape of an encrypted reference
  static bool is_valid(const std::string& value);
  // Throws std::invalid_argument when value is not an encrypted reference
  static EncryptedReference parse(const std::string& value);

  const Reference& address() const { return address_; }
  const utils::Bytes& key() const { return key_; }
  std::string str() const;

private:
  Reference address_;
  utils::Bytes key_;
};

// Encrypted put/get path over any ContentStore. Each object gets a fresh
// AES-256 key and IV; the stored blob is IV || ciphertext.
class EncryptedStore {
public:
  explicit EncryptedStore(ContentStore& store);

  EncryptedReference put(const utils::Bytes& data);
  // Throws MissingContentError for unknown addresses, crypto::DecryptionError for bad keys
  utils::Bytes get(const EncryptedReference& reference);

private:
  ContentStore& store_;
};

} // namespace store
} // namespace podfs

#endif // PODFS_STORE_ENCRYPTED_STORE_HPP
