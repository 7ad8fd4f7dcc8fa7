#ifndef PEERDROP_SESSION_OPTIONS_HPP
#define PEERDROP_SESSION_OPTIONS_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "peerdrop/protocol/transfer_config.hpp"

namespace peerdrop {
namespace session {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

struct SessionOptions {
    // Offer/answer proceed with partial candidates once this elapses
    std::chrono::milliseconds ice_gathering_timeout{20000};
    std::chrono::milliseconds probe_timeout{5000};
    // Probed in order; the first timeout stops escalation
    std::vector<std::size_t> calibration_sizes{16 * 1024, 32 * 1024, 64 * 1024, 128 * 1024, 256 * 1024};
    protocol::TransferConfig initial_config = protocol::TransferConfig::defaults();
    std::string channel_label{"fileTransfer"};
    bool restart_ice_on_failure{false};
    // Used to time calibration round trips; empty means steady_clock::now
    Clock clock;
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_OPTIONS_HPP
