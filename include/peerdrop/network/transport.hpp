#ifndef PEERDROP_NETWORK_TRANSPORT_HPP
#define PEERDROP_NETWORK_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "peerdrop/network/network_error.hpp"

namespace peerdrop {
namespace network {

using Bytes = std::vector<uint8_t>;

// Opaque connection-negotiation description. The sdp text is never
// interpreted outside the transport that produced it.
struct SessionDescription {
    std::string type;
    std::string sdp;
};

enum class IceGatheringState {
    NEW,
    GATHERING,
    COMPLETE
};

enum class ChannelState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

enum class ConnectionStatus {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* to_string(IceGatheringState state);
const char* to_string(ChannelState state);
const char* to_string(ConnectionStatus status);

std::ostream& operator<<(std::ostream& os, IceGatheringState state);
std::ostream& operator<<(std::ostream& os, ChannelState state);
std::ostream& operator<<(std::ostream& os, ConnectionStatus status);

// Sampled for reporting only
struct TransportStats {
    std::optional<double> rtt_ms;
    std::string local_candidate_type;
    std::string remote_candidate_type;
    std::string connection_type;
};

/**
 * Ordered, reliable, message-oriented channel between two peers.
 *
 * Implementations invoke a copy of the registered handlers, so replacing
 * them from inside a handler is safe. All events are delivered on the
 * owning io_context.
 */
class DataChannel {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void()> on_close;
        std::function<void(const std::string&)> on_error;
        std::function<void(const std::string&)> on_text;
        std::function<void(const Bytes&)> on_binary;
        std::function<void()> on_buffered_amount_low;
    };

    virtual ~DataChannel() = default;

    virtual void set_handlers(Handlers handlers) = 0;

    // ---- SENDING ----
    // Both throw TransportError unless the channel is open
    virtual void send_binary(const Bytes& data) = 0;
    virtual void send_text(const std::string& text) = 0;
    virtual void close() = 0;

    // ---- STATE ----
    virtual ChannelState state() const = 0;
    virtual std::size_t buffered_amount() const = 0;
    virtual std::size_t buffered_amount_low_threshold() const = 0;
    virtual void set_buffered_amount_low_threshold(std::size_t threshold) = 0;
    virtual const std::string& label() const = 0;
};

/**
 * Connection negotiation and lifetime for one peer link.
 *
 * The offerer creates the data channel; the answerer receives it through
 * on_data_channel once the link is up.
 */
class PeerTransport {
public:
    struct Handlers {
        std::function<void(IceGatheringState)> on_ice_gathering_state;
        std::function<void(ConnectionStatus)> on_connection_state;
        std::function<void(std::shared_ptr<DataChannel>)> on_data_channel;
        std::function<void(const std::string&)> on_ice_candidate_error;
    };

    virtual ~PeerTransport() = default;

    virtual void set_handlers(Handlers handlers) = 0;

    // ---- NEGOTIATION ----
    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label, bool ordered) = 0;
    virtual SessionDescription create_local_offer() = 0;
    virtual SessionDescription create_local_answer() = 0;
    // Starts ICE gathering
    virtual void set_local_description(const SessionDescription& description) = 0;
    // Includes whatever candidates have been gathered so far
    virtual std::optional<SessionDescription> local_description() const = 0;
    // Throws TransportError when the description cannot be applied
    virtual void apply_remote_description(const SessionDescription& description) = 0;

    // ---- STATE ----
    virtual IceGatheringState ice_gathering_state() const = 0;
    virtual TransportStats stats() const = 0;

    // ---- LIFETIME ----
    virtual void restart_ice() = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<PeerTransport>()>;

} // namespace network
} // namespace peerdrop

#endif // PEERDROP_NETWORK_TRANSPORT_HPP
