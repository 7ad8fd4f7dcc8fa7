#ifndef PEERDROP_CRYPTO_AEAD_CIPHER_HPP
#define PEERDROP_CRYPTO_AEAD_CIPHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "peerdrop/crypto/crypto_error.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"

namespace peerdrop::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM over whole buffers. Every call to encrypt draws a fresh
// random IV; ciphertext carries the tag in its last TAG_SIZE bytes.
class AeadCipher {
public:
  static constexpr std::size_t KEY_SIZE = SymmetricKey::SIZE;
  static constexpr std::size_t IV_SIZE = 12;
  static constexpr std::size_t TAG_SIZE = 16;

  using Iv = std::array<uint8_t, IV_SIZE>;

  struct Sealed {
    Iv iv{};
    std::vector<uint8_t> ciphertext;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AeadCipher(const SymmetricKey& key);
  ~AeadCipher();

  AeadCipher(const AeadCipher&) = delete;
  AeadCipher& operator=(const AeadCipher&) = delete;


  // ---- BUFFER OPERATIONS ----
  Sealed encrypt(const uint8_t* data, std::size_t size);
  Sealed encrypt(const std::vector<uint8_t>& plaintext);
  // Throws AuthenticationError when the tag does not verify
  std::vector<uint8_t> decrypt(const Iv& iv, const uint8_t* data, std::size_t size);
  std::vector<uint8_t> decrypt(const Iv& iv, const std::vector<uint8_t>& ciphertext);


  // ---- STRING OPERATIONS ----
  // base64(iv || ciphertext), for embedding in text control messages
  std::string encrypt_string(const std::string& text);
  std::string decrypt_string(const std::string& encoded);


  // ---- IV GENERATION ----
  static Iv generate_iv();

private:
  SymmetricKey key_;
  std::unique_ptr<CipherContext> context_;
};

} // namespace peerdrop::crypto

#endif // PEERDROP_CRYPTO_AEAD_CIPHER_HPP
