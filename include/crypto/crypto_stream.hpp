#ifndef PODFS_CRYPTO_STREAM_HPP
#define PODFS_CRYPTO_STREAM_HPP

#include <istream>
#include <ostream>
#include <vector>
#include <memory>
#include <array>
#include "crypto_error.hpp"
#include "utils/bytes.hpp"

namespace podfs::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CBC over streams and buffers. One instance holds one key/IV pair.
class CryptoStream {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CryptoStream();
  ~CryptoStream();

  CryptoStream(const CryptoStream&) = delete;
  CryptoStream& operator=(const CryptoStream&) = delete;

  // ---- KEY MATERIAL ----
  static std::array<uint8_t, KEY_SIZE> generate_key();
  static std::array<uint8_t, IV_SIZE> generate_iv();
  
  // ---- INITIALIZATION ----
  // Sets key and IV, throws InitializationError on wrong sizes
  void initialize(const utils::Bytes& key, const utils::Bytes& iv);
  bool is_initialized() const { return is_initialized_; }

  
  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::ostream& encrypt(std::istream& input, std::ostream& output);
  std::ostream& decrypt(std::istream& input, std::ostream& output);

  utils::Bytes encrypt(const utils::Bytes& plaintext);
  utils::Bytes decrypt(const utils::Bytes& ciphertext);

  // Size of the ciphertext produced for a plaintext of the given size (PKCS#7 padding)
  static size_t padded_size(size_t plaintext_size);

private:
  // ---- PARAMETERS ----
  utils::Bytes key_;
  utils::Bytes iv_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;
  static constexpr size_t BUFFER_SIZE = 8192; 

  
  // ---- INITIALIZATION ----  
  // Resets the cipher context for one pass over the data
  void initialize_cipher(bool encrypting);


  // ---- STREAM PROCESSING ----
  // Performs the main encryption/decryption loop on the input stream
  void process_stream(std::istream& input, std::ostream& output, bool encrypting);
  // Encrypts or decrypts a single chunk of data
  size_t process_chunk(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, bool encrypting);
  // Writes processed data to the output stream
  void write_output(std::ostream& output, const uint8_t* data, size_t length);
  // Handles the final block with padding
  void process_final_block(uint8_t* outbuf, int& outlen, bool encrypting);
};
  
} // namespace podfs::crypto

#endif // PODFS_CRYPTO_STREAM_HPP
