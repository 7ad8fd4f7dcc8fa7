#include "peerdrop/network/transport.hpp"

namespace peerdrop {
namespace network {

const char* to_string(IceGatheringState state) {
  switch (state) {
    case IceGatheringState::NEW:       return "new";
    case IceGatheringState::GATHERING: return "gathering";
    case IceGatheringState::COMPLETE:  return "complete";
    default:                           return "unknown";
  }
}

const char* to_string(ChannelState state) {
  switch (state) {
    case ChannelState::CONNECTING: return "connecting";
    case ChannelState::OPEN:       return "open";
    case ChannelState::CLOSING:    return "closing";
    case ChannelState::CLOSED:     return "closed";
    default:                       return "unknown";
  }
}

const char* to_string(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::NEW:          return "new";
    case ConnectionStatus::CONNECTING:   return "connecting";
    case ConnectionStatus::CONNECTED:    return "connected";
    case ConnectionStatus::DISCONNECTED: return "disconnected";
    case ConnectionStatus::FAILED:       return "failed";
    case ConnectionStatus::CLOSED:       return "closed";
    default:                             return "unknown";
  }
}

std::ostream& operator<<(std::ostream& os, IceGatheringState state) {
  return os << to_string(state);
}

std::ostream& operator<<(std::ostream& os, ChannelState state) {
  return os << to_string(state);
}

std::ostream& operator<<(std::ostream& os, ConnectionStatus status) {
  return os << to_string(status);
}

} // namespace network
} // namespace peerdrop
