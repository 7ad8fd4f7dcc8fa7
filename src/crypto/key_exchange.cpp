#include "peerdrop/crypto/key_exchange.hpp"
#include "peerdrop/crypto/base64.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>

namespace peerdrop::crypto {

namespace {

constexpr std::size_t COORDINATE_SIZE = 32;
constexpr const char* CURVE_GROUP = "prime256v1";

using Coordinate = std::array<uint8_t, COORDINATE_SIZE>;

struct PkeyCtx {
  EVP_PKEY_CTX* ctx = nullptr;

  explicit PkeyCtx(EVP_PKEY_CTX* c) : ctx(c) {}
  ~PkeyCtx() {
    if (ctx) {
      EVP_PKEY_CTX_free(ctx);
    }
  }
  PkeyCtx(const PkeyCtx&) = delete;
  PkeyCtx& operator=(const PkeyCtx&) = delete;

  EVP_PKEY_CTX* get() { return ctx; }
};

Coordinate read_coordinate(const EVP_PKEY* key, const char* param) {
  BIGNUM* bn = nullptr;
  if (EVP_PKEY_get_bn_param(key, param, &bn) != 1) {
    throw InitializationError(std::string("Failed to read EC parameter ") + param);
  }
  Coordinate out{};
  const int written = BN_bn2binpad(bn, out.data(), static_cast<int>(out.size()));
  BN_free(bn);
  if (written != static_cast<int>(COORDINATE_SIZE)) {
    throw InitializationError("EC coordinate does not fit 32 bytes");
  }
  return out;
}

// Builds a public-only key from an uncompressed point. Returns nullptr if
// OpenSSL rejects the point.
EVP_PKEY* public_key_from_point(const Coordinate& x, const Coordinate& y) {
  std::array<uint8_t, 1 + 2 * COORDINATE_SIZE> point{};
  point[0] = 0x04;
  std::copy(x.begin(), x.end(), point.begin() + 1);
  std::copy(y.begin(), y.end(), point.begin() + 1 + COORDINATE_SIZE);

  OSSL_PARAM params[] = {
    OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>(CURVE_GROUP), 0),
    OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
    OSSL_PARAM_construct_end()
  };

  PkeyCtx ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  if (!ctx.get() || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    throw InitializationError("Failed to create EC import context");
  }

  EVP_PKEY* key = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &key, EVP_PKEY_PUBLIC_KEY, params) != 1) {
    return nullptr;
  }

  PkeyCtx check(EVP_PKEY_CTX_new_from_pkey(nullptr, key, nullptr));
  if (!check.get() || EVP_PKEY_public_check(check.get()) != 1) {
    EVP_PKEY_free(key);
    return nullptr;
  }
  return key;
}

std::shared_ptr<evp_pkey_st> share(EVP_PKEY* key) {
  return std::shared_ptr<evp_pkey_st>(key, PkeyDeleter());
}

Coordinate decode_coordinate(const nlohmann::json& jwk, const char* name) {
  auto it = jwk.find(name);
  if (it == jwk.end() || !it->is_string()) {
    throw KeyFormatError(std::string("Missing coordinate ") + name);
  }

  std::vector<uint8_t> bytes;
  try {
    bytes = base64url_decode(it->get<std::string>());
  } catch (const std::invalid_argument& e) {
    throw KeyFormatError(std::string("Coordinate ") + name + " is not base64url: " + e.what());
  }
  if (bytes.size() != COORDINATE_SIZE) {
    throw KeyFormatError(std::string("Coordinate ") + name + " has length " + std::to_string(bytes.size()));
  }

  Coordinate out{};
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

} // namespace

void PkeyDeleter::operator()(evp_pkey_st* key) const {
  EVP_PKEY_free(key);
}

//==============================================
// KEY GENERATION
//==============================================

KeyPair generate_key_pair() {
  EVP_PKEY* raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256");
  if (!raw) {
    throw InitializationError("Failed to generate P-256 key pair");
  }
  KeyPair pair;
  pair.private_key = PrivateKey(raw);

  // The public half is a separate public-only key so it never carries the scalar
  const Coordinate x = read_coordinate(raw, OSSL_PKEY_PARAM_EC_PUB_X);
  const Coordinate y = read_coordinate(raw, OSSL_PKEY_PARAM_EC_PUB_Y);
  EVP_PKEY* pub = public_key_from_point(x, y);
  if (!pub) {
    throw InitializationError("Failed to extract public key");
  }
  pair.public_key = PublicKey(share(pub));

  BOOST_LOG_TRIVIAL(debug) << "Key exchange: Generated P-256 key pair";
  return pair;
}

//==============================================
// PUBLIC KEY TRANSPORT
//==============================================

std::string export_public_key(const PublicKey& key) {
  if (!key.valid()) {
    throw InitializationError("Cannot export an empty public key");
  }

  const Coordinate x = read_coordinate(key.get(), OSSL_PKEY_PARAM_EC_PUB_X);
  const Coordinate y = read_coordinate(key.get(), OSSL_PKEY_PARAM_EC_PUB_Y);

  nlohmann::json jwk = {
    {"kty", "EC"},
    {"crv", "P-256"},
    {"x", base64url_encode(std::vector<uint8_t>(x.begin(), x.end()))},
    {"y", base64url_encode(std::vector<uint8_t>(y.begin(), y.end()))},
    {"ext", true},
    {"key_ops", nlohmann::json::array()}
  };
  return base64_encode(jwk.dump());
}

PublicKey import_public_key(const std::string& blob) {
  std::string text;
  try {
    text = base64_decode_to_string(blob);
  } catch (const std::invalid_argument& e) {
    throw KeyFormatError(std::string("Public key blob is not base64: ") + e.what());
  }

  nlohmann::json jwk = nlohmann::json::parse(text, nullptr, false);
  if (jwk.is_discarded() || !jwk.is_object()) {
    throw KeyFormatError("Public key blob is not a JSON object");
  }

  auto kty = jwk.find("kty");
  if (kty == jwk.end() || !kty->is_string() || kty->get<std::string>() != "EC") {
    throw KeyFormatError("Expected kty EC");
  }
  auto crv = jwk.find("crv");
  if (crv == jwk.end() || !crv->is_string() || crv->get<std::string>() != "P-256") {
    throw KeyFormatError("Expected crv P-256");
  }

  const Coordinate x = decode_coordinate(jwk, "x");
  const Coordinate y = decode_coordinate(jwk, "y");

  EVP_PKEY* key = public_key_from_point(x, y);
  if (!key) {
    throw KeyFormatError("Point is not on the P-256 curve");
  }
  return PublicKey(share(key));
}

//==============================================
// KEY AGREEMENT
//==============================================

SymmetricKey derive_shared_key(const PrivateKey& private_key, const PublicKey& peer_key) {
  if (!private_key.valid() || !peer_key.valid()) {
    throw InitializationError("Key agreement requires both keys");
  }

  PkeyCtx ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, private_key.get(), nullptr));
  if (!ctx.get() || EVP_PKEY_derive_init(ctx.get()) != 1) {
    throw InitializationError("Failed to initialize ECDH context");
  }
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer_key.get()) != 1) {
    throw KeyFormatError("Peer key rejected for ECDH");
  }

  std::size_t secret_len = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) != 1 || secret_len != SymmetricKey::SIZE) {
    throw InitializationError("Unexpected ECDH secret length");
  }

  SymmetricKey::Bytes secret{};
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) != 1) {
    OPENSSL_cleanse(secret.data(), secret.size());
    throw InitializationError("ECDH derivation failed");
  }

  SymmetricKey key(secret);
  OPENSSL_cleanse(secret.data(), secret.size());
  return key;
}

} // namespace peerdrop::crypto
