#ifndef PEERDROP_PROTOCOL_CONTROL_MESSAGE_HPP
#define PEERDROP_PROTOCOL_CONTROL_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "peerdrop/protocol/protocol_error.hpp"

namespace peerdrop::protocol {

// When encrypted is set, name and file_type hold base64(iv || ciphertext)
struct FileMeta {
    std::string id;
    std::string name;
    uint64_t size{0};
    std::string file_type;
    bool encrypted{false};
};

struct FileComplete {
    std::string id;
};

struct CalibrationPing {
    std::string id;
    uint64_t size{0};
};

struct CalibrationPong {
    std::string id;
    uint64_t size{0};
};

// Anything without a recognised type, forwarded verbatim
struct OtherMessage {
    nlohmann::json raw;
};

using ControlMessage = std::variant<FileMeta, FileComplete, CalibrationPing, CalibrationPong, OtherMessage>;

std::string encode_control_message(const ControlMessage& message);

// Throws ProtocolError on invalid JSON or a known type with malformed fields
ControlMessage decode_control_message(const std::string& text);

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_CONTROL_MESSAGE_HPP
