#ifndef PEERDROP_PROTOCOL_CHUNK_FRAME_HPP
#define PEERDROP_PROTOCOL_CHUNK_FRAME_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "peerdrop/crypto/aead_cipher.hpp"
#include "peerdrop/protocol/protocol_error.hpp"

namespace peerdrop::protocol {

// Binary chunk layout, one channel message:
//   byte 0            id length (0-255)
//   bytes 1..len      transfer id (UTF-8)
//   [encrypted]       12-byte IV
//   rest              ciphertext || tag, or raw chunk bytes
struct ChunkFrame {
    std::string transfer_id;
    std::optional<crypto::AeadCipher::Iv> iv;
    std::vector<uint8_t> payload;
};

constexpr std::size_t MAX_TRANSFER_ID_LENGTH = 255;

// Probe payloads carry ids with this prefix and are discarded by receivers
constexpr const char* CALIBRATION_ID_PREFIX = "calibration-";

bool is_calibration_id(const std::string& id);

// Throws ProtocolError when the id does not fit the length byte
std::vector<uint8_t> encode_chunk_frame(const ChunkFrame& frame);

// Throws ProtocolError on a truncated header or IV
ChunkFrame decode_chunk_frame(const std::vector<uint8_t>& data, bool encrypted);

// Reads only the id; nullopt when the header is truncated
std::optional<std::string> peek_transfer_id(const std::vector<uint8_t>& data);

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_CHUNK_FRAME_HPP
