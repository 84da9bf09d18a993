#include "crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <array>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace podfs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Crypto stream: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream() 
  : context_(std::make_unique<CipherContext>()) {
  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Cipher context created";
}

CryptoStream::~CryptoStream() = default;

//==============================================
// KEY MATERIAL
//==============================================

std::array<uint8_t, CryptoStream::KEY_SIZE> CryptoStream::generate_key() {
  std::array<uint8_t, KEY_SIZE> key;
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw CryptoError("Crypto stream: Failed to generate random key");
  }
  return key;
}

std::array<uint8_t, CryptoStream::IV_SIZE> CryptoStream::generate_iv() {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw CryptoError("Crypto stream: Failed to generate random IV");
  }
  return iv;
}

//==============================================
// INITIALIZATION
//==============================================

void CryptoStream::initialize(const utils::Bytes& key, const utils::Bytes& iv) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid key size: " << key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }
  if (iv.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid IV size: " << iv.size() << " bytes (expected " << IV_SIZE << " bytes)";
    throw InitializationError("Invalid IV size");
  }

  key_ = key;
  iv_ = iv;
  is_initialized_ = true;
}

void CryptoStream::initialize_cipher(bool encrypting) {
  if (!is_initialized_) {
    throw InitializationError("CryptoStream not initialized");
  }

  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw EncryptionError("Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw DecryptionError("Failed to initialize decryption context");
    }
  }
}

//==============================================
// STREAM PROCESSING
//==============================================

void CryptoStream::process_stream(std::istream& input, std::ostream& output, bool encrypting) {
  if (!output.good()) {
    throw CryptoError("Crypto stream: Invalid output stream state");
  }

  initialize_cipher(encrypting);

  std::array<uint8_t, BUFFER_SIZE> inbuf;
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> outbuf;
  size_t total_bytes_processed = 0;

  while (input.good()) {
    input.read(reinterpret_cast<char*>(inbuf.data()), inbuf.size());
    auto bytes_read = input.gcount();
    if (bytes_read <= 0) {
      break;
    }

    auto outlen = process_chunk(inbuf.data(), static_cast<size_t>(bytes_read), outbuf.data(), encrypting);
    write_output(output, outbuf.data(), outlen);
    total_bytes_processed += outlen;
  }

  if (input.bad()) {
    throw CryptoError("Crypto stream: Failed to read from input stream");
  }

  int final_outlen = 0;
  process_final_block(outbuf.data(), final_outlen, encrypting);
  write_output(output, outbuf.data(), static_cast<size_t>(final_outlen));
  total_bytes_processed += final_outlen;

  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Completed " << (encrypting ? "encryption" : "decryption")
                           << ", produced " << total_bytes_processed << " bytes";
}

size_t CryptoStream::process_chunk(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, 
                                   bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(bytes_read))) {
      throw EncryptionError("Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(bytes_read))) {
      throw DecryptionError("Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

void CryptoStream::write_output(std::ostream& output, const uint8_t* data, size_t length) {
  if (length > 0) {
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw CryptoError("Crypto stream: Failed to write to output stream");
    }
  }
}

void CryptoStream::process_final_block(uint8_t* outbuf, int& outlen, bool encrypting) {
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw EncryptionError("Failed to finalize encryption");
    }
  } else {
    // Wrong key or truncated ciphertext shows up here as a padding failure
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw DecryptionError("Failed to finalize decryption");
    }
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================
  
std::ostream& CryptoStream::encrypt(std::istream& input, std::ostream& output) {
  process_stream(input, output, true);
  return output;
}

std::ostream& CryptoStream::decrypt(std::istream& input, std::ostream& output) {
  process_stream(input, output, false);
  return output;
}

utils::Bytes CryptoStream::encrypt(const utils::Bytes& plaintext) {
  std::stringstream input(utils::to_string(plaintext));
  std::stringstream output;
  encrypt(input, output);
  return utils::to_bytes(output.str());
}

utils::Bytes CryptoStream::decrypt(const utils::Bytes& ciphertext) {
  if (ciphertext.size() % BLOCK_SIZE != 0 || ciphertext.empty()) {
    throw DecryptionError("Ciphertext length is not a positive multiple of the block size");
  }
  std::stringstream input(utils::to_string(ciphertext));
  std::stringstream output;
  decrypt(input, output);
  return utils::to_bytes(output.str());
}

size_t CryptoStream::padded_size(size_t plaintext_size) {
  return (plaintext_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
}

} // namespace podfs::crypto
