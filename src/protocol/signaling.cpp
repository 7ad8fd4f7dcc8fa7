#include "peerdrop/protocol/signaling.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "peerdrop/crypto/base64.hpp"

namespace peerdrop::protocol {

std::string encode_description(const network::SessionDescription& description) {
  nlohmann::json value = {{"type", description.type}, {"sdp", description.sdp}};
  return crypto::base64_encode(value.dump());
}

network::SessionDescription decode_description(const std::string& blob) {
  std::string text;
  try {
    text = crypto::base64_decode_to_string(blob);
  } catch (const std::invalid_argument& e) {
    throw ProtocolError(std::string("Description blob is not base64: ") + e.what());
  }

  nlohmann::json value = nlohmann::json::parse(text, nullptr, false);
  if (value.is_discarded() || !value.is_object()) {
    throw ProtocolError("Description blob is not a JSON object");
  }

  auto type = value.find("type");
  auto sdp = value.find("sdp");
  if (type == value.end() || !type->is_string() || sdp == value.end() || !sdp->is_string()) {
    throw ProtocolError("Description requires string fields 'type' and 'sdp'");
  }

  return network::SessionDescription{type->get<std::string>(), sdp->get<std::string>()};
}

} // namespace peerdrop::protocol
