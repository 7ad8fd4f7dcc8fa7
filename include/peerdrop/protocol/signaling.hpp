#ifndef PEERDROP_PROTOCOL_SIGNALING_HPP
#define PEERDROP_PROTOCOL_SIGNALING_HPP

#include <string>
#include "peerdrop/network/transport.hpp"
#include "peerdrop/protocol/protocol_error.hpp"

namespace peerdrop::protocol {

// base64 of {"type":..,"sdp":..}; the sdp text passes through untouched
std::string encode_description(const network::SessionDescription& description);
network::SessionDescription decode_description(const std::string& blob);

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_SIGNALING_HPP
