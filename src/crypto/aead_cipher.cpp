#include "peerdrop/crypto/aead_cipher.hpp"
#include "peerdrop/crypto/base64.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace peerdrop::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Failed to create cipher context");
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

AeadCipher::AeadCipher(const SymmetricKey& key)
  : key_(key)
  , context_(std::make_unique<CipherContext>()) {
}

AeadCipher::~AeadCipher() = default;

//==============================================
// IV GENERATION
//==============================================

AeadCipher::Iv AeadCipher::generate_iv() {
  Iv iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw EncryptionError("Failed to generate random IV");
  }
  return iv;
}

//==============================================
// BUFFER OPERATIONS
//==============================================

AeadCipher::Sealed AeadCipher::encrypt(const uint8_t* data, std::size_t size) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw EncryptionError("Plaintext too large");
  }

  Sealed sealed;
  sealed.iv = generate_iv();
  sealed.ciphertext.resize(size + TAG_SIZE);

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx, nullptr, nullptr, key_.data(), sealed.iv.data()) != 1) {
    throw EncryptionError("Failed to initialize AES-256-GCM context");
  }

  int outlen = 0;
  if (size > 0) {
    if (EVP_EncryptUpdate(ctx, sealed.ciphertext.data(), &outlen, data, static_cast<int>(size)) != 1) {
      throw EncryptionError("Failed to encrypt data block");
    }
  }

  // GCM never emits bytes on finalization
  uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx, final_block, &final_len) != 1) {
    throw EncryptionError("Failed to finalize encryption");
  }

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                          sealed.ciphertext.data() + size) != 1) {
    throw EncryptionError("Failed to read authentication tag");
  }

  return sealed;
}

AeadCipher::Sealed AeadCipher::encrypt(const std::vector<uint8_t>& plaintext) {
  return encrypt(plaintext.data(), plaintext.size());
}

std::vector<uint8_t> AeadCipher::decrypt(const Iv& iv, const uint8_t* data, std::size_t size) {
  if (size < TAG_SIZE) {
    throw AuthenticationError("Ciphertext shorter than the authentication tag");
  }
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw AuthenticationError("Ciphertext too large");
  }

  const std::size_t body_size = size - TAG_SIZE;
  std::vector<uint8_t> plaintext(body_size);

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_.data(), iv.data()) != 1) {
    throw InitializationError("Failed to initialize AES-256-GCM context");
  }

  int outlen = 0;
  if (body_size > 0) {
    if (EVP_DecryptUpdate(ctx, plaintext.data(), &outlen, data, static_cast<int>(body_size)) != 1) {
      throw AuthenticationError("Failed to decrypt data block");
    }
  }

  // OpenSSL takes a non-const pointer for the expected tag but does not modify it
  std::array<uint8_t, TAG_SIZE> tag;
  std::copy(data + body_size, data + size, tag.begin());
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
    throw AuthenticationError("Failed to set authentication tag");
  }

  uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx, final_block, &final_len) != 1) {
    BOOST_LOG_TRIVIAL(debug) << "AEAD cipher: Tag verification failed for " << size << " byte ciphertext";
    throw AuthenticationError("Authentication tag mismatch");
  }

  return plaintext;
}

std::vector<uint8_t> AeadCipher::decrypt(const Iv& iv, const std::vector<uint8_t>& ciphertext) {
  return decrypt(iv, ciphertext.data(), ciphertext.size());
}

//==============================================
// STRING OPERATIONS
//==============================================

std::string AeadCipher::encrypt_string(const std::string& text) {
  Sealed sealed = encrypt(reinterpret_cast<const uint8_t*>(text.data()), text.size());

  std::vector<uint8_t> combined;
  combined.reserve(IV_SIZE + sealed.ciphertext.size());
  combined.insert(combined.end(), sealed.iv.begin(), sealed.iv.end());
  combined.insert(combined.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
  return base64_encode(combined);
}

std::string AeadCipher::decrypt_string(const std::string& encoded) {
  std::vector<uint8_t> combined;
  try {
    combined = base64_decode(encoded);
  } catch (const std::invalid_argument& e) {
    throw AuthenticationError(std::string("Sealed string is not base64: ") + e.what());
  }

  if (combined.size() < IV_SIZE + TAG_SIZE) {
    throw AuthenticationError("Sealed string too short");
  }

  Iv iv;
  std::copy(combined.begin(), combined.begin() + IV_SIZE, iv.begin());
  auto plaintext = decrypt(iv, combined.data() + IV_SIZE, combined.size() - IV_SIZE);
  return std::string(plaintext.begin(), plaintext.end());
}

} // namespace peerdrop::crypto
