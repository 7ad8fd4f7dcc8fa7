#include "peerdrop/protocol/file_transfer.hpp"
#include <algorithm>
#include <cmath>

namespace peerdrop::protocol {

const char* to_string(TransferStatus status) {
  switch (status) {
    case TransferStatus::PENDING:      return "pending";
    case TransferStatus::TRANSFERRING: return "transferring";
    case TransferStatus::COMPLETED:    return "completed";
    case TransferStatus::ERROR:        return "error";
    default:                           return "unknown";
  }
}

const char* to_string(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::OUTBOUND: return "outbound";
    case TransferDirection::INBOUND:  return "inbound";
    default:                          return "unknown";
  }
}

std::ostream& operator<<(std::ostream& os, TransferStatus status) {
  return os << to_string(status);
}

std::ostream& operator<<(std::ostream& os, TransferDirection direction) {
  return os << to_string(direction);
}

int compute_progress(uint64_t done, uint64_t total) {
  if (total == 0) {
    return 100;
  }
  const double ratio = static_cast<double>(done) / static_cast<double>(total);
  const long rounded = std::lround(ratio * 100.0);
  return static_cast<int>(std::clamp<long>(rounded, 0, 100));
}

} // namespace peerdrop::protocol
