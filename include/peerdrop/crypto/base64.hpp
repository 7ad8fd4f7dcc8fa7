#ifndef PEERDROP_CRYPTO_BASE64_HPP
#define PEERDROP_CRYPTO_BASE64_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace peerdrop::crypto {

// ---- STANDARD ALPHABET (PADDED) ----
std::string base64_encode(const uint8_t* data, std::size_t size);
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& text);

// Whitespace is ignored so pasted blobs survive line wrapping.
// Throws std::invalid_argument on malformed input.
std::vector<uint8_t> base64_decode(const std::string& encoded);
std::string base64_decode_to_string(const std::string& encoded);


// ---- URL-SAFE ALPHABET (UNPADDED, AS USED BY JWK) ----
std::string base64url_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64url_decode(const std::string& encoded);

} // namespace peerdrop::crypto

#endif // PEERDROP_CRYPTO_BASE64_HPP
