#ifndef PEERDROP_NETWORK_LOOPBACK_TRANSPORT_HPP
#define PEERDROP_NETWORK_LOOPBACK_TRANSPORT_HPP

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "peerdrop/network/transport.hpp"

namespace peerdrop {
namespace network {

struct LoopbackOptions {
    // One-way delivery delay
    std::chrono::milliseconds latency{0};
    // Link rate in bytes per second; 0 means unlimited
    std::size_t bytes_per_second{0};
    std::chrono::milliseconds ice_gathering_delay{0};
    // When false, gathering never reaches COMPLETE
    bool complete_ice_gathering{true};
    std::string candidate_type{"host"};
};

class LoopbackTransport;

/**
 * Pairs loopback transports created from the same hub. Descriptions carry
 * a token naming the endpoint that produced them.
 */
class LoopbackHub : public std::enable_shared_from_this<LoopbackHub> {
public:
    static std::shared_ptr<LoopbackHub> create(boost::asio::io_context& io, LoopbackOptions options = {});

    TransportFactory factory();
    // Also forgets transports that have been destroyed
    std::shared_ptr<LoopbackTransport> create_transport();

    std::shared_ptr<LoopbackTransport> find(const std::string& token) const;
    std::size_t registered() const { return registry_.size(); }
    const LoopbackOptions& options() const { return options_; }
    boost::asio::io_context& io_context() { return io_; }

private:
    LoopbackHub(boost::asio::io_context& io, LoopbackOptions options);

    boost::asio::io_context& io_;
    LoopbackOptions options_;
    uint64_t next_token_{1};
    std::map<std::string, std::weak_ptr<LoopbackTransport>> registry_;
};

/**
 * In-process data channel. Each direction is a FIFO paced by the link
 * rate and latency; the buffered amount drains as messages are delivered.
 */
class LoopbackDataChannel : public DataChannel,
                            public std::enable_shared_from_this<LoopbackDataChannel> {
public:
    LoopbackDataChannel(boost::asio::io_context& io, std::string label, const LoopbackOptions& options);
    ~LoopbackDataChannel() override;

    void set_handlers(Handlers handlers) override;

    // ---- SENDING ----
    void send_binary(const Bytes& data) override;
    void send_text(const std::string& text) override;
    void close() override;

    // ---- STATE ----
    ChannelState state() const override { return state_; }
    std::size_t buffered_amount() const override { return buffered_amount_; }
    std::size_t buffered_amount_low_threshold() const override { return low_threshold_; }
    void set_buffered_amount_low_threshold(std::size_t threshold) override { low_threshold_ = threshold; }
    const std::string& label() const override { return label_; }

    // ---- LINKING ----
    static void link(const std::shared_ptr<LoopbackDataChannel>& a, const std::shared_ptr<LoopbackDataChannel>& b);
    void open();

private:
    struct Message {
        bool binary{false};
        Bytes payload;
        std::chrono::steady_clock::time_point deliver_at;
    };

    void enqueue(bool binary, Bytes payload);
    void schedule_delivery();
    void deliver_front();
    void receive(const Message& message);
    void handle_remote_close();

    boost::asio::io_context& io_;
    std::string label_;
    LoopbackOptions options_;
    Handlers handlers_;
    ChannelState state_{ChannelState::CONNECTING};
    std::weak_ptr<LoopbackDataChannel> peer_;

    // ---- OUTBOUND QUEUE ----
    std::deque<Message> outbound_;
    std::size_t buffered_amount_{0};
    std::size_t low_threshold_{0};
    std::chrono::steady_clock::time_point link_free_at_{};
    boost::asio::steady_timer delivery_timer_;
    bool delivery_scheduled_{false};
};

class LoopbackTransport : public PeerTransport,
                          public std::enable_shared_from_this<LoopbackTransport> {
public:
    LoopbackTransport(std::shared_ptr<LoopbackHub> hub, std::string token);
    ~LoopbackTransport() override;

    void set_handlers(Handlers handlers) override;

    // ---- NEGOTIATION ----
    std::shared_ptr<DataChannel> create_data_channel(const std::string& label, bool ordered) override;
    SessionDescription create_local_offer() override;
    SessionDescription create_local_answer() override;
    void set_local_description(const SessionDescription& description) override;
    std::optional<SessionDescription> local_description() const override;
    void apply_remote_description(const SessionDescription& description) override;

    // ---- STATE ----
    IceGatheringState ice_gathering_state() const override { return gathering_state_; }
    TransportStats stats() const override;
    ConnectionStatus connection_status() const { return connection_status_; }
    const std::string& token() const { return token_; }

    // ---- LIFETIME ----
    void restart_ice() override;
    void close() override;

    // Simulates a link-level state change reported by the transport
    void inject_connection_state(ConnectionStatus status);

private:
    static std::optional<std::string> parse_token(const std::string& sdp);
    std::string build_sdp(const std::string& setup) const;
    void set_gathering_state(IceGatheringState state);
    void set_connection_state(ConnectionStatus status);
    void connect_to(const std::shared_ptr<LoopbackTransport>& answerer);
    void accept_channel(const std::shared_ptr<LoopbackDataChannel>& channel);

    std::shared_ptr<LoopbackHub> hub_;
    std::string token_;
    Handlers handlers_;
    boost::asio::steady_timer gathering_timer_;

    IceGatheringState gathering_state_{IceGatheringState::NEW};
    ConnectionStatus connection_status_{ConnectionStatus::NEW};
    std::optional<SessionDescription> local_description_;
    std::optional<std::string> remote_token_;

    std::string channel_label_;
    std::shared_ptr<LoopbackDataChannel> channel_;
    bool closed_{false};
};

} // namespace network
} // namespace peerdrop

#endif // PEERDROP_NETWORK_LOOPBACK_TRANSPORT_HPP
