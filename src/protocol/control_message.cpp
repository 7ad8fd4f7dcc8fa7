#include "peerdrop/protocol/control_message.hpp"
#include <type_traits>

namespace peerdrop::protocol {

namespace {

using json = nlohmann::json;

constexpr const char* TYPE_FILE_META = "file-meta";
constexpr const char* TYPE_FILE_COMPLETE = "file-complete";
constexpr const char* TYPE_CALIBRATION_PING = "calibration-ping";
constexpr const char* TYPE_CALIBRATION_PONG = "calibration-pong";

std::string require_string(const json& object, const char* type, const char* field) {
  auto it = object.find(field);
  if (it == object.end() || !it->is_string()) {
    throw ProtocolError(std::string(type) + " requires string field '" + field + "'");
  }
  return it->get<std::string>();
}

uint64_t require_size(const json& object, const char* type, const char* field) {
  auto it = object.find(field);
  if (it == object.end() || !it->is_number_unsigned()) {
    throw ProtocolError(std::string(type) + " requires non-negative integer field '" + field + "'");
  }
  return it->get<uint64_t>();
}

} // namespace

//==============================================
// ENCODING
//==============================================

std::string encode_control_message(const ControlMessage& message) {
  return std::visit([](const auto& m) -> std::string {
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, FileMeta>) {
      return json{{"type", TYPE_FILE_META}, {"id", m.id}, {"name", m.name}, {"size", m.size},
                  {"fileType", m.file_type}, {"encrypted", m.encrypted}}.dump();
    } else if constexpr (std::is_same_v<T, FileComplete>) {
      return json{{"type", TYPE_FILE_COMPLETE}, {"id", m.id}}.dump();
    } else if constexpr (std::is_same_v<T, CalibrationPing>) {
      return json{{"type", TYPE_CALIBRATION_PING}, {"id", m.id}, {"size", m.size}}.dump();
    } else if constexpr (std::is_same_v<T, CalibrationPong>) {
      return json{{"type", TYPE_CALIBRATION_PONG}, {"id", m.id}, {"size", m.size}}.dump();
    } else {
      return m.raw.dump();
    }
  }, message);
}

//==============================================
// DECODING
//==============================================

ControlMessage decode_control_message(const std::string& text) {
  json value = json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    throw ProtocolError("Control message is not valid JSON");
  }
  if (!value.is_object()) {
    return OtherMessage{std::move(value)};
  }

  auto type_it = value.find("type");
  if (type_it == value.end() || !type_it->is_string()) {
    return OtherMessage{std::move(value)};
  }
  const std::string type = type_it->get<std::string>();

  if (type == TYPE_FILE_META) {
    FileMeta meta;
    meta.id = require_string(value, TYPE_FILE_META, "id");
    meta.name = require_string(value, TYPE_FILE_META, "name");
    meta.size = require_size(value, TYPE_FILE_META, "size");
    meta.file_type = require_string(value, TYPE_FILE_META, "fileType");
    auto encrypted = value.find("encrypted");
    if (encrypted != value.end()) {
      if (!encrypted->is_boolean()) {
        throw ProtocolError("file-meta field 'encrypted' must be a boolean");
      }
      meta.encrypted = encrypted->get<bool>();
    }
    return meta;
  }
  if (type == TYPE_FILE_COMPLETE) {
    return FileComplete{require_string(value, TYPE_FILE_COMPLETE, "id")};
  }
  if (type == TYPE_CALIBRATION_PING) {
    return CalibrationPing{require_string(value, TYPE_CALIBRATION_PING, "id"),
                           require_size(value, TYPE_CALIBRATION_PING, "size")};
  }
  if (type == TYPE_CALIBRATION_PONG) {
    return CalibrationPong{require_string(value, TYPE_CALIBRATION_PONG, "id"),
                           require_size(value, TYPE_CALIBRATION_PONG, "size")};
  }
  return OtherMessage{std::move(value)};
}

} // namespace peerdrop::protocol
