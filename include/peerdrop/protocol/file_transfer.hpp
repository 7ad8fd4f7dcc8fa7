#ifndef PEERDROP_PROTOCOL_FILE_TRANSFER_HPP
#define PEERDROP_PROTOCOL_FILE_TRANSFER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace peerdrop::protocol {

enum class TransferStatus {
    PENDING,
    TRANSFERRING,
    COMPLETED,
    ERROR
};

enum class TransferDirection {
    OUTBOUND,
    INBOUND
};

const char* to_string(TransferStatus status);
const char* to_string(TransferDirection direction);
std::ostream& operator<<(std::ostream& os, TransferStatus status);
std::ostream& operator<<(std::ostream& os, TransferDirection direction);

// Progress report for one file. Only completed inbound reports carry a payload.
struct FileTransfer {
    std::string id;
    std::string name;
    uint64_t size{0};
    std::string mime_type;
    int progress{0};
    TransferStatus status{TransferStatus::PENDING};
    TransferDirection direction{TransferDirection::OUTBOUND};
    std::optional<std::vector<uint8_t>> payload;
    // Set when status is ERROR
    std::string error;
};

struct OutgoingFile {
    std::string name;
    std::string mime_type;
    std::vector<uint8_t> data;
};

// round(done / total * 100) clamped to [0, 100]; 100 for an empty total
int compute_progress(uint64_t done, uint64_t total);

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_FILE_TRANSFER_HPP
