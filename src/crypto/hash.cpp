#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace podfs::crypto {

//==============================================
// RAII WRAPPER FOR DIGEST CONTEXT
//==============================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw HashError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// HASHING
//==============================================

utils::Bytes sha256(const uint8_t* data, size_t size) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw HashError("Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(context.get(), data, size)) {
    throw HashError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw HashError("Failed to finalize hash");
  }

  return utils::Bytes(hash, hash + hash_len);
}

utils::Bytes sha256(const utils::Bytes& data) {
  return sha256(data.data(), data.size());
}

std::string sha256_hex(const utils::Bytes& data) {
  return utils::to_hex(sha256(data));
}

std::string sha256_hex(const std::string& data) {
  return utils::to_hex(sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::string address_from_key(const utils::Bytes& signing_key) {
  if (signing_key.empty()) {
    throw HashError("Cannot derive address from empty signing key");
  }
  auto digest = sha256(signing_key);
  return utils::to_hex(digest.data(), ADDRESS_SIZE);
}

//==============================================
// RANDOMNESS
//==============================================

utils::Bytes random_bytes(size_t size) {
  utils::Bytes result(size);
  if (size > 0 && RAND_bytes(result.data(), static_cast<int>(result.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Crypto: RAND_bytes failed for " << size << " bytes";
    throw CryptoError("Failed to generate random bytes");
  }
  return result;
}

} // namespace podfs::crypto
