#include "peerdrop/protocol/chunk_frame.hpp"
#include <algorithm>
#include <cstring>

namespace peerdrop::protocol {

bool is_calibration_id(const std::string& id) {
  return id.compare(0, std::strlen(CALIBRATION_ID_PREFIX), CALIBRATION_ID_PREFIX) == 0;
}

std::vector<uint8_t> encode_chunk_frame(const ChunkFrame& frame) {
  if (frame.transfer_id.size() > MAX_TRANSFER_ID_LENGTH) {
    throw ProtocolError("Transfer id longer than " + std::to_string(MAX_TRANSFER_ID_LENGTH) + " bytes");
  }

  const std::size_t iv_size = frame.iv ? frame.iv->size() : 0;
  std::vector<uint8_t> out;
  out.reserve(1 + frame.transfer_id.size() + iv_size + frame.payload.size());

  out.push_back(static_cast<uint8_t>(frame.transfer_id.size()));
  out.insert(out.end(), frame.transfer_id.begin(), frame.transfer_id.end());
  if (frame.iv) {
    out.insert(out.end(), frame.iv->begin(), frame.iv->end());
  }
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  return out;
}

std::optional<std::string> peek_transfer_id(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return std::nullopt;
  }
  const std::size_t id_length = data[0];
  if (data.size() < 1 + id_length) {
    return std::nullopt;
  }
  return std::string(data.begin() + 1, data.begin() + 1 + id_length);
}

ChunkFrame decode_chunk_frame(const std::vector<uint8_t>& data, bool encrypted) {
  auto id = peek_transfer_id(data);
  if (!id) {
    throw ProtocolError("Chunk frame header truncated");
  }

  ChunkFrame frame;
  frame.transfer_id = std::move(*id);
  std::size_t offset = 1 + frame.transfer_id.size();

  if (encrypted) {
    crypto::AeadCipher::Iv iv{};
    if (data.size() < offset + iv.size()) {
      throw ProtocolError("Chunk frame IV truncated for " + frame.transfer_id);
    }
    std::copy(data.begin() + offset, data.begin() + offset + iv.size(), iv.begin());
    frame.iv = iv;
    offset += iv.size();
  }

  frame.payload.assign(data.begin() + offset, data.end());
  return frame;
}

} // namespace peerdrop::protocol
