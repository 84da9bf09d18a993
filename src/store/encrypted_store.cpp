#include "store/encrypted_store.hpp"
#include "crypto/crypto_stream.hpp"
#include <cctype>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace podfs {
namespace store {

//==============================================
// ENCRYPTED REFERENCE
//==============================================

EncryptedReference::EncryptedReference(Reference address, utils::Bytes key)
  : address_(std::move(address))
  , key_(std::move(key)) {
  if (!is_reference(address_) || key_.size() != KEY_SIZE) {
    throw std::invalid_argument("Encrypted reference: Invalid address or key");
  }
}

bool EncryptedReference::is_valid(const std::string& value) {
  return utils::is_hex(value, HEX_LENGTH);
}

EncryptedReference EncryptedReference::parse(const std::string& value) {
  if (!is_valid(value)) {
    throw std::invalid_argument("Encrypted reference: Expected " + std::to_string(HEX_LENGTH) +
                                " hex characters, got: " + value);
  }
  Reference address = value.substr(0, REFERENCE_HEX_LENGTH);
  for (auto& c : address) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return EncryptedReference(address, utils::from_hex(value.substr(REFERENCE_HEX_LENGTH)));
}

std::string EncryptedReference::str() const {
  return address_ + utils::to_hex(key_);
}

//==============================================
// ENCRYPTED STORE
//==============================================

EncryptedStore::EncryptedStore(ContentStore& store) : store_(store) {}

EncryptedReference EncryptedStore::put(const utils::Bytes& data) {
  auto key = crypto::CryptoStream::generate_key();
  auto iv = crypto::CryptoStream::generate_iv();

  crypto::CryptoStream cipher;
  cipher.initialize(utils::Bytes(key.begin(), key.end()), utils::Bytes(iv.begin(), iv.end()));

  utils::Bytes blob(iv.begin(), iv.end());
  utils::Bytes ciphertext = cipher.encrypt(data);
  blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());

  Reference address = store_.put(blob);
  BOOST_LOG_TRIVIAL(debug) << "Encrypted store: Stored " << data.size() << " plaintext bytes at " << address;
  return EncryptedReference(address, utils::Bytes(key.begin(), key.end()));
}

utils::Bytes EncryptedStore::get(const EncryptedReference& reference) {
  utils::Bytes blob = store_.get(reference.address());

  if (blob.size() < crypto::CryptoStream::IV_SIZE + crypto::CryptoStream::padded_size(0)) {
    BOOST_LOG_TRIVIAL(error) << "Encrypted store: Object too short at " << reference.address();
    throw crypto::DecryptionError("Encrypted object shorter than IV plus one block");
  }
  // PKCS#7 output is always a whole number of blocks
  const size_t ciphertext_size = blob.size() - crypto::CryptoStream::IV_SIZE;
  if (crypto::CryptoStream::padded_size(ciphertext_size - 1) != ciphertext_size) {
    BOOST_LOG_TRIVIAL(error) << "Encrypted store: Object at " << reference.address()
                             << " is not block aligned (" << ciphertext_size << " bytes)";
    throw crypto::DecryptionError("Encrypted object is not block aligned");
  }

  utils::Bytes iv(blob.begin(), blob.begin() + crypto::CryptoStream::IV_SIZE);
  utils::Bytes ciphertext(blob.begin() + crypto::CryptoStream::IV_SIZE, blob.end());

  crypto::CryptoStream cipher;
  cipher.initialize(reference.key(), iv);
  return cipher.decrypt(ciphertext);
}

} // namespace store
} // namespace podfs
