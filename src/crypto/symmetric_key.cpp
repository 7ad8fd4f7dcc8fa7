#include "peerdrop/crypto/symmetric_key.hpp"
#include <openssl/crypto.h>

namespace peerdrop::crypto {

SymmetricKey::SymmetricKey(const Bytes& bytes)
  : bytes_(bytes) {
}

SymmetricKey::SymmetricKey(const SymmetricKey& other)
  : bytes_(other.bytes_) {
}

SymmetricKey& SymmetricKey::operator=(const SymmetricKey& other) {
  if (this != &other) {
    wipe();
    bytes_ = other.bytes_;
  }
  return *this;
}

SymmetricKey::~SymmetricKey() {
  wipe();
}

void SymmetricKey::wipe() {
  OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

} // namespace peerdrop::crypto
