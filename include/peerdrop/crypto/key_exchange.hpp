#ifndef PEERDROP_CRYPTO_KEY_EXCHANGE_HPP
#define PEERDROP_CRYPTO_KEY_EXCHANGE_HPP

#include <memory>
#include <string>
#include "peerdrop/crypto/crypto_error.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"

// Forward declaration for OpenSSL key handle
struct evp_pkey_st;

namespace peerdrop::crypto {

struct PkeyDeleter {
    void operator()(evp_pkey_st* key) const;
};

/**
 * Public half of a P-256 ECDH key pair. Holds only the public point,
 * so copies may be handed out freely.
 */
class PublicKey {
public:
    PublicKey() = default;
    explicit PublicKey(std::shared_ptr<evp_pkey_st> key) : key_(std::move(key)) {}

    bool valid() const { return key_ != nullptr; }
    evp_pkey_st* get() const { return key_.get(); }

private:
    std::shared_ptr<evp_pkey_st> key_;
};

/**
 * Private half of a P-256 ECDH key pair. Move-only; the scalar is
 * cleared by OpenSSL when the handle is released.
 */
class PrivateKey {
public:
    PrivateKey() = default;
    explicit PrivateKey(evp_pkey_st* key) : key_(key) {}

    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    bool valid() const { return key_ != nullptr; }
    evp_pkey_st* get() const { return key_.get(); }
    void reset() { key_.reset(); }

private:
    std::unique_ptr<evp_pkey_st, PkeyDeleter> key_;
};

struct KeyPair {
    PublicKey public_key;
    PrivateKey private_key;
};


// ---- KEY GENERATION ----
KeyPair generate_key_pair();


// ---- PUBLIC KEY TRANSPORT ----
// base64 of the JSON Web Key {"kty":"EC","crv":"P-256","x":..,"y":..,"ext":true,"key_ops":[]}
std::string export_public_key(const PublicKey& key);
// Throws KeyFormatError on any malformed or off-curve input
PublicKey import_public_key(const std::string& blob);


// ---- KEY AGREEMENT ----
// The 32-byte shared x-coordinate is used directly as the AES-256-GCM key
SymmetricKey derive_shared_key(const PrivateKey& private_key, const PublicKey& peer_key);

} // namespace peerdrop::crypto

#endif // PEERDROP_CRYPTO_KEY_EXCHANGE_HPP
