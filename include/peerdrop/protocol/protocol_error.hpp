#ifndef PEERDROP_PROTOCOL_ERROR_HPP
#define PEERDROP_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerdrop::protocol {

// Malformed frame, control message or signaling blob
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error("Protocol error: " + message) {}
};

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_ERROR_HPP
