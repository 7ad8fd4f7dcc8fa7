#ifndef PEERDROP_CRYPTO_SYMMETRIC_KEY_HPP
#define PEERDROP_CRYPTO_SYMMETRIC_KEY_HPP

#include <array>
#include <cstdint>

namespace peerdrop::crypto {

// 256-bit AEAD key. The bytes are cleansed whenever the key is destroyed
// or overwritten.
class SymmetricKey {
public:
  static constexpr std::size_t SIZE = 32;
  using Bytes = std::array<uint8_t, SIZE>;

  SymmetricKey() = default;
  explicit SymmetricKey(const Bytes& bytes);
  SymmetricKey(const SymmetricKey& other);
  SymmetricKey& operator=(const SymmetricKey& other);
  ~SymmetricKey();

  const Bytes& bytes() const { return bytes_; }
  const uint8_t* data() const { return bytes_.data(); }

  void wipe();

private:
  Bytes bytes_{};
};

} // namespace peerdrop::crypto

#endif // PEERDROP_CRYPTO_SYMMETRIC_KEY_HPP
