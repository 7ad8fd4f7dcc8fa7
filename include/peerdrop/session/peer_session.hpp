#ifndef PEERDROP_SESSION_PEER_SESSION_HPP
#define PEERDROP_SESSION_PEER_SESSION_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include "peerdrop/crypto/aead_cipher.hpp"
#include "peerdrop/crypto/key_exchange.hpp"
#include "peerdrop/network/transport.hpp"
#include "peerdrop/protocol/control_message.hpp"
#include "peerdrop/protocol/file_transfer.hpp"
#include "peerdrop/protocol/reassembler.hpp"
#include "peerdrop/protocol/transfer_config.hpp"
#include "peerdrop/session/calibrator.hpp"
#include "peerdrop/session/event_dispatcher.hpp"
#include "peerdrop/session/file_sender.hpp"
#include "peerdrop/session/flow_controller.hpp"
#include "peerdrop/session/session_options.hpp"
#include "peerdrop/session/session_state.hpp"

namespace peerdrop {
namespace session {

/**
 * One encrypted peer connection: handshake, file transfer in both
 * directions and calibration, on top of a PeerTransport.
 *
 * All operations and callbacks run on the io_context passed to create().
 * Asynchronous operations complete with a NetworkError code, or with
 * operation_aborted when disconnect() interrupts them.
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    enum class Role {
        NONE,
        OFFERER,
        ANSWERER
    };

    // Signaling blobs handed to the remote peer out of band
    struct HandshakeBlobs {
        std::string description;
        std::string public_key;
    };

    using HandshakeHandler = std::function<void(const boost::system::error_code&, HandshakeBlobs)>;
    using SendHandler = std::function<void(const boost::system::error_code&, const std::string&)>;
    using CalibrationHandler = std::function<void(const boost::system::error_code&, const CalibrationResult&)>;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    static std::shared_ptr<PeerSession> create(boost::asio::io_context& io,
                                               network::TransportFactory factory,
                                               SessionOptions options = {});
    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;


    // ---- HANDSHAKE ----
    void create_offer(HandshakeHandler handler);
    void handle_offer(const std::string& offer_blob, const std::string& peer_public_key, HandshakeHandler handler);
    // Malformed input leaves the session untouched so the call can be retried
    boost::system::error_code handle_answer(const std::string& answer_blob, const std::string& peer_public_key);


    // ---- TRANSFER ----
    // Returns the transfer id, or an empty string when the channel is not open
    std::string send_file(protocol::OutgoingFile file, SendHandler handler);
    void calibrate(CalibrationHandler handler);


    // ---- TEARDOWN ----
    void disconnect();


    // ---- STATUS ----
    bool is_connected() const;
    bool is_encryption_enabled() const { return encryption_enabled_; }
    SessionState::State state() const { return state_.get_state(); }
    Role role() const { return role_; }
    const protocol::TransferConfig& transfer_config() const { return config_; }
    std::size_t active_transfers() const { return senders_.size(); }
    std::size_t inbound_transfers() const { return reassembler_.size(); }
    EventDispatcher& events() { return events_; }

private:
    using IceWaiter = std::function<void(const boost::system::error_code&)>;

    PeerSession(boost::asio::io_context& io, network::TransportFactory factory, SessionOptions options);

    // Wraps a callback so it runs only while the session and its epoch are alive
    template <typename Handler>
    auto guarded(Handler handler);

    // ---- HANDSHAKE HELPERS ----
    void open_transport();
    void attach_channel(const std::shared_ptr<network::DataChannel>& channel);
    void await_ice_gathering(IceWaiter waiter);
    void fire_ice_waiter(const boost::system::error_code& ec);
    IceWaiter description_waiter(std::string public_key_blob, HandshakeHandler handler);
    void finish_description(const std::string& public_key_blob, const HandshakeHandler& handler);
    void enter_keyed();
    void rollback_handshake();
    void post_handshake_error(HandshakeHandler handler, const boost::system::error_code& ec);

    // ---- TRANSPORT EVENTS ----
    void handle_connection_state(network::ConnectionStatus status);
    void handle_channel_open();
    void handle_channel_close();
    void handle_channel_error(const std::string& message);

    // ---- RECEIVE PATH ----
    void handle_text(const std::string& text);
    void handle_binary(const network::Bytes& data);
    void handle_file_meta(const protocol::FileMeta& meta);
    void handle_file_complete(const protocol::FileComplete& complete);
    void handle_ping(const protocol::CalibrationPing& ping);

    void apply_config(const protocol::TransferConfig& config);
    void publish(ControlEvent::Kind kind, const std::string& detail = {});

    boost::asio::io_context& io_;
    network::TransportFactory factory_;
    SessionOptions options_;

    // ---- SESSION STATE ----
    SessionState state_;
    Role role_{Role::NONE};
    uint64_t epoch_{0};
    bool channel_open_{false};

    // ---- KEY MATERIAL ----
    crypto::KeyPair keys_;
    std::optional<crypto::SymmetricKey> shared_key_;
    std::unique_ptr<crypto::AeadCipher> cipher_;
    bool encryption_enabled_{false};

    // ---- TRANSPORT ----
    std::shared_ptr<network::PeerTransport> transport_;
    std::shared_ptr<network::DataChannel> channel_;
    boost::asio::steady_timer ice_timer_;
    IceWaiter ice_waiter_;

    // ---- TRANSFER ----
    protocol::TransferConfig config_;
    std::shared_ptr<FlowController> flow_;
    std::map<std::string, std::shared_ptr<FileSender>> senders_;
    protocol::Reassembler reassembler_;
    std::shared_ptr<Calibrator> calibrator_;

    EventDispatcher events_;
};

const char* to_string(PeerSession::Role role);

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_PEER_SESSION_HPP
