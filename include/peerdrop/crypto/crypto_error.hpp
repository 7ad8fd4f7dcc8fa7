#ifndef PEERDROP_CRYPTO_ERROR_HPP
#define PEERDROP_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerdrop::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Imported public key is not a valid P-256 JWK
class KeyFormatError : public CryptoError {
public:
    explicit KeyFormatError(const std::string& message)
        : CryptoError("Key format error: " + message) {}
};

// GCM tag did not verify, or the sealed input is truncated
class AuthenticationError : public CryptoError {
public:
    explicit AuthenticationError(const std::string& message)
        : CryptoError("Authentication error: " + message) {}
};

} // namespace peerdrop::crypto

#endif // PEERDROP_CRYPTO_ERROR_HPP
