#ifndef PEERDROP_PROTOCOL_TRANSFER_CONFIG_HPP
#define PEERDROP_PROTOCOL_TRANSFER_CONFIG_HPP

#include <cstddef>
#include <ostream>

namespace peerdrop::protocol {

// Active chunking and backpressure parameters. Replaced as a whole by
// calibration, never patched field by field.
struct TransferConfig {
    std::size_t chunk_size;
    std::size_t buffer_threshold;
    std::size_t buffer_low_threshold;
    std::size_t max_message_size;
    // Bytes per second measured by calibration; 0 when uncalibrated
    double effective_bandwidth;
    bool is_calibrated;

    static TransferConfig defaults() {
        return TransferConfig{16 * 1024, 64 * 1024, 16 * 1024, 256 * 1024, 0.0, false};
    }

    bool operator==(const TransferConfig& other) const {
        return chunk_size == other.chunk_size &&
               buffer_threshold == other.buffer_threshold &&
               buffer_low_threshold == other.buffer_low_threshold &&
               max_message_size == other.max_message_size &&
               effective_bandwidth == other.effective_bandwidth &&
               is_calibrated == other.is_calibrated;
    }
    bool operator!=(const TransferConfig& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const TransferConfig& config) {
    os << "{chunk=" << config.chunk_size
       << ", threshold=" << config.buffer_threshold
       << ", low=" << config.buffer_low_threshold
       << ", max_message=" << config.max_message_size
       << ", bandwidth=" << config.effective_bandwidth
       << ", calibrated=" << (config.is_calibrated ? "yes" : "no") << "}";
    return os;
}

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_TRANSFER_CONFIG_HPP
