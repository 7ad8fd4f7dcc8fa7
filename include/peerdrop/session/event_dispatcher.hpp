#ifndef PEERDROP_SESSION_EVENT_DISPATCHER_HPP
#define PEERDROP_SESSION_EVENT_DISPATCHER_HPP

#include <functional>
#include <optional>
#include <string>
#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>
#include "peerdrop/network/transport.hpp"
#include "peerdrop/protocol/file_transfer.hpp"
#include "peerdrop/session/calibrator.hpp"

namespace peerdrop {
namespace session {

struct ControlEvent {
    enum class Kind {
        CHANNEL_OPEN,
        CHANNEL_CLOSE,
        CHANNEL_ERROR,
        CONNECTION_STATE,
        ICE_CANDIDATE_ERROR,
        // Unrecognised control message from the peer, forwarded verbatim
        PEER_MESSAGE
    };

    Kind kind{Kind::PEER_MESSAGE};
    std::optional<network::ConnectionStatus> connection_status;
    boost::system::error_code error;
    std::string detail;
    nlohmann::json message;
};

const char* to_string(ControlEvent::Kind kind);

/**
 * Fans session events out to subscribers on three independent channels.
 * Delivery is synchronous and in order. A subscriber that throws is logged
 * and skipped; the remaining subscribers still run.
 */
class EventDispatcher {
public:
    using MessageSlot = std::function<void(const ControlEvent&)>;
    using FileSlot = std::function<void(const protocol::FileTransfer&)>;
    using CalibrationSlot = std::function<void(const CalibrationResult&)>;

    // ---- SUBSCRIPTION ----
    // Disconnecting the returned connection unsubscribes
    boost::signals2::connection on_message(MessageSlot slot);
    boost::signals2::connection on_file(FileSlot slot);
    boost::signals2::connection on_calibration(CalibrationSlot slot);
    void disconnect_all();

    // ---- PUBLISHING ----
    void publish_message(const ControlEvent& event);
    void publish_file(const protocol::FileTransfer& transfer);
    void publish_calibration(const CalibrationResult& result);

private:
    boost::signals2::signal<void(const ControlEvent&)> message_signal_;
    boost::signals2::signal<void(const protocol::FileTransfer&)> file_signal_;
    boost::signals2::signal<void(const CalibrationResult&)> calibration_signal_;
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_EVENT_DISPATCHER_HPP
