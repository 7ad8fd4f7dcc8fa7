#include "peerdrop/crypto/base64.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace peerdrop::crypto {

namespace {

bool is_base64_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::string strip_whitespace(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

//==============================================
// ENCODING
//==============================================

std::string base64_encode(const uint8_t* data, std::size_t size) {
  if (size == 0) {
    return {};
  }
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
    throw std::length_error("Base64: Input too large");
  }

  std::string out(4 * ((size + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
  return base64_encode(data.data(), data.size());
}

std::string base64_encode(const std::string& text) {
  return base64_encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
  std::string out = base64_encode(data);
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  return out;
}

//==============================================
// DECODING
//==============================================

std::vector<uint8_t> base64_decode(const std::string& encoded) {
  const std::string input = strip_whitespace(encoded);
  if (input.empty()) {
    return {};
  }
  if (input.size() % 4 != 0) {
    throw std::invalid_argument("Base64: Length is not a multiple of 4");
  }
  if (input.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::length_error("Base64: Input too large");
  }

  // Padding may only appear as the last one or two characters
  std::size_t padding = 0;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (c == '=') {
      if (i + 2 < input.size()) {
        throw std::invalid_argument("Base64: Misplaced padding");
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      throw std::invalid_argument("Base64: Invalid character");
    }
  }

  std::vector<uint8_t> out(input.size() / 4 * 3);
  int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                                static_cast<int>(input.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    throw std::invalid_argument("Base64: Decoding failed");
  }
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

std::string base64_decode_to_string(const std::string& encoded) {
  const auto bytes = base64_decode(encoded);
  return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> base64url_decode(const std::string& encoded) {
  std::string input = encoded;
  if (input.find_first_of("+/=") != std::string::npos) {
    throw std::invalid_argument("Base64url: Invalid character");
  }
  std::replace(input.begin(), input.end(), '-', '+');
  std::replace(input.begin(), input.end(), '_', '/');
  if (input.size() % 4 == 1) {
    throw std::invalid_argument("Base64url: Invalid length");
  }
  while (input.size() % 4 != 0) {
    input.push_back('=');
  }
  return base64_decode(input);
}

} // namespace peerdrop::crypto
