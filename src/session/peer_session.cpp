#include "peerdrop/session/peer_session.hpp"
#include <type_traits>
#include <utility>
#include <variant>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "peerdrop/network/network_error.hpp"
#include "peerdrop/protocol/chunk_frame.hpp"
#include "peerdrop/protocol/signaling.hpp"

namespace peerdrop {
namespace session {

namespace {

boost::system::error_code code_of(network::NetworkError code) {
  return network::make_error_code(code);
}

} // namespace

const char* to_string(PeerSession::Role role) {
  switch (role) {
    case PeerSession::Role::NONE:     return "none";
    case PeerSession::Role::OFFERER:  return "offerer";
    case PeerSession::Role::ANSWERER: return "answerer";
    default:                          return "unknown";
  }
}

template <typename Handler>
auto PeerSession::guarded(Handler handler) {
  std::weak_ptr<PeerSession> weak = weak_from_this();
  const uint64_t epoch = epoch_;
  return [weak, epoch, handler = std::move(handler)](auto&&... args) {
    auto self = weak.lock();
    if (!self || self->epoch_ != epoch) {
      return;
    }
    handler(std::forward<decltype(args)>(args)...);
  };
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PeerSession::PeerSession(boost::asio::io_context& io, network::TransportFactory factory, SessionOptions options)
  : io_(io)
  , factory_(std::move(factory))
  , options_(std::move(options))
  , ice_timer_(io)
  , config_(options_.initial_config)
  , flow_(std::make_shared<FlowController>(io, config_.buffer_threshold, config_.buffer_low_threshold)) {
}

std::shared_ptr<PeerSession> PeerSession::create(boost::asio::io_context& io,
                                                 network::TransportFactory factory,
                                                 SessionOptions options) {
  return std::shared_ptr<PeerSession>(new PeerSession(io, std::move(factory), std::move(options)));
}

PeerSession::~PeerSession() {
  disconnect();
}

//==============================================
// HANDSHAKE
//==============================================

void PeerSession::create_offer(HandshakeHandler handler) {
  if (state_.get_state() != SessionState::State::IDLE) {
    BOOST_LOG_TRIVIAL(warning) << "Session: create_offer in state " << state_.get_state_string();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::INVALID_STATE));
    return;
  }

  std::string public_key_blob;
  try {
    keys_ = crypto::generate_key_pair();
    public_key_blob = crypto::export_public_key(keys_.public_key);
    role_ = Role::OFFERER;

    open_transport();
    channel_ = transport_->create_data_channel(options_.channel_label, true);
    attach_channel(channel_);

    const auto offer = transport_->create_local_offer();
    transport_->set_local_description(offer);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Offer failed: " << e.what();
    rollback_handshake();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::CRYPTO_FAILURE));
    return;
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Offer failed: " << e.what();
    rollback_handshake();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::TRANSPORT_FAILURE));
    return;
  }

  state_.transition_to(SessionState::State::OFFER_CREATED);
  BOOST_LOG_TRIVIAL(info) << "Session: Offer created, gathering candidates";
  await_ice_gathering(description_waiter(std::move(public_key_blob), std::move(handler)));
}

void PeerSession::handle_offer(const std::string& offer_blob, const std::string& peer_public_key,
                               HandshakeHandler handler) {
  if (state_.get_state() != SessionState::State::IDLE) {
    BOOST_LOG_TRIVIAL(warning) << "Session: handle_offer in state " << state_.get_state_string();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::INVALID_STATE));
    return;
  }

  // Validate every input before touching session state
  network::SessionDescription offer;
  try {
    offer = protocol::decode_description(offer_blob);
  } catch (const protocol::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Rejected offer: " << e.what();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::INVALID_DESCRIPTION));
    return;
  }
  if (offer.type != "offer") {
    BOOST_LOG_TRIVIAL(warning) << "Session: Expected an offer, got " << offer.type;
    post_handshake_error(std::move(handler), code_of(network::NetworkError::INVALID_DESCRIPTION));
    return;
  }

  crypto::PublicKey peer_key;
  try {
    peer_key = crypto::import_public_key(peer_public_key);
  } catch (const crypto::KeyFormatError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Rejected peer key: " << e.what();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::KEY_FORMAT));
    return;
  }

  std::string public_key_blob;
  try {
    keys_ = crypto::generate_key_pair();
    public_key_blob = crypto::export_public_key(keys_.public_key);
    shared_key_ = crypto::derive_shared_key(keys_.private_key, peer_key);
    cipher_ = std::make_unique<crypto::AeadCipher>(*shared_key_);
    encryption_enabled_ = true;
    role_ = Role::ANSWERER;

    open_transport();
    transport_->apply_remote_description(offer);
    const auto answer = transport_->create_local_answer();
    transport_->set_local_description(answer);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Answer failed: " << e.what();
    rollback_handshake();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::CRYPTO_FAILURE));
    return;
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Answer failed: " << e.what();
    rollback_handshake();
    post_handshake_error(std::move(handler), code_of(network::NetworkError::TRANSPORT_FAILURE));
    return;
  }

  state_.transition_to(SessionState::State::ANSWER_PENDING);
  BOOST_LOG_TRIVIAL(info) << "Session: Offer accepted, encryption enabled, gathering candidates";
  await_ice_gathering(description_waiter(std::move(public_key_blob), std::move(handler)));
}

boost::system::error_code PeerSession::handle_answer(const std::string& answer_blob,
                                                     const std::string& peer_public_key) {
  if (state_.get_state() != SessionState::State::OFFER_CREATED || !transport_) {
    BOOST_LOG_TRIVIAL(warning) << "Session: handle_answer in state " << state_.get_state_string();
    return code_of(network::NetworkError::INVALID_STATE);
  }

  network::SessionDescription answer;
  try {
    answer = protocol::decode_description(answer_blob);
  } catch (const protocol::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Rejected answer: " << e.what();
    return code_of(network::NetworkError::INVALID_DESCRIPTION);
  }
  if (answer.type != "answer") {
    BOOST_LOG_TRIVIAL(warning) << "Session: Expected an answer, got " << answer.type;
    return code_of(network::NetworkError::INVALID_DESCRIPTION);
  }

  std::optional<crypto::SymmetricKey> key;
  try {
    key = crypto::derive_shared_key(keys_.private_key, crypto::import_public_key(peer_public_key));
  } catch (const crypto::KeyFormatError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Rejected peer key: " << e.what();
    return code_of(network::NetworkError::KEY_FORMAT);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Key agreement failed: " << e.what();
    return code_of(network::NetworkError::CRYPTO_FAILURE);
  }

  try {
    transport_->apply_remote_description(answer);
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Could not apply answer: " << e.what();
    return code_of(network::NetworkError::TRANSPORT_FAILURE);
  }

  shared_key_ = std::move(key);
  cipher_ = std::make_unique<crypto::AeadCipher>(*shared_key_);
  encryption_enabled_ = true;
  enter_keyed();
  return {};
}

//==============================================
// HANDSHAKE HELPERS
//==============================================

void PeerSession::open_transport() {
  transport_ = factory_();
  if (!transport_) {
    throw network::TransportError("Transport factory returned no transport");
  }

  network::PeerTransport::Handlers handlers;
  handlers.on_ice_gathering_state = guarded([this](network::IceGatheringState state) {
    BOOST_LOG_TRIVIAL(debug) << "Session: ICE gathering " << state;
    if (state == network::IceGatheringState::COMPLETE) {
      fire_ice_waiter(boost::system::error_code());
    }
  });
  handlers.on_connection_state = guarded([this](network::ConnectionStatus status) {
    handle_connection_state(status);
  });
  handlers.on_data_channel = guarded([this](std::shared_ptr<network::DataChannel> channel) {
    if (role_ != Role::ANSWERER || channel_) {
      BOOST_LOG_TRIVIAL(warning) << "Session: Ignoring unexpected data channel " << channel->label();
      return;
    }
    BOOST_LOG_TRIVIAL(debug) << "Session: Adopting data channel " << channel->label();
    channel_ = std::move(channel);
    attach_channel(channel_);
  });
  handlers.on_ice_candidate_error = guarded([this](const std::string& message) {
    BOOST_LOG_TRIVIAL(warning) << "Session: ICE candidate error: " << message;
    publish(ControlEvent::Kind::ICE_CANDIDATE_ERROR, message);
  });
  transport_->set_handlers(std::move(handlers));
}

void PeerSession::attach_channel(const std::shared_ptr<network::DataChannel>& channel) {
  channel->set_buffered_amount_low_threshold(config_.buffer_low_threshold);

  network::DataChannel::Handlers handlers;
  handlers.on_open = guarded([this]() { handle_channel_open(); });
  handlers.on_close = guarded([this]() { handle_channel_close(); });
  handlers.on_error = guarded([this](const std::string& message) { handle_channel_error(message); });
  handlers.on_text = guarded([this](const std::string& text) { handle_text(text); });
  handlers.on_binary = guarded([this](const network::Bytes& data) { handle_binary(data); });
  handlers.on_buffered_amount_low = guarded([this]() { flow_->on_buffered_amount_low(); });
  channel->set_handlers(std::move(handlers));

  if (channel->state() == network::ChannelState::OPEN) {
    boost::asio::post(io_, guarded([this]() { handle_channel_open(); }));
  }
}

void PeerSession::await_ice_gathering(IceWaiter waiter) {
  ice_waiter_ = std::move(waiter);

  if (transport_->ice_gathering_state() == network::IceGatheringState::COMPLETE) {
    boost::asio::post(io_, guarded([this]() { fire_ice_waiter(boost::system::error_code()); }));
    return;
  }

  ice_timer_.expires_after(options_.ice_gathering_timeout);
  ice_timer_.async_wait(guarded([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !ice_waiter_) {
      return;
    }
    BOOST_LOG_TRIVIAL(warning) << "Session: ICE gathering timed out after "
                               << options_.ice_gathering_timeout.count() << " ms, using partial candidates";
    fire_ice_waiter(boost::system::error_code());
  }));
}

void PeerSession::fire_ice_waiter(const boost::system::error_code& ec) {
  if (!ice_waiter_) {
    return;
  }
  ice_timer_.cancel();
  auto waiter = std::move(ice_waiter_);
  ice_waiter_ = nullptr;
  waiter(ec);
}

PeerSession::IceWaiter PeerSession::description_waiter(std::string public_key_blob, HandshakeHandler handler) {
  std::weak_ptr<PeerSession> weak = weak_from_this();
  const uint64_t epoch = epoch_;
  return [weak, epoch, public_key_blob = std::move(public_key_blob), handler = std::move(handler)](
             const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self || self->epoch_ != epoch) {
      if (handler) {
        handler(ec ? ec : boost::system::error_code(boost::asio::error::operation_aborted), HandshakeBlobs{});
      }
      return;
    }
    self->finish_description(public_key_blob, handler);
  };
}

void PeerSession::finish_description(const std::string& public_key_blob, const HandshakeHandler& handler) {
  std::optional<network::SessionDescription> description;
  if (transport_) {
    description = transport_->local_description();
  }
  if (!description) {
    BOOST_LOG_TRIVIAL(error) << "Session: Transport has no local description";
    if (handler) {
      handler(code_of(network::NetworkError::TRANSPORT_FAILURE), HandshakeBlobs{});
    }
    return;
  }

  if (role_ == Role::ANSWERER) {
    enter_keyed();
  }

  HandshakeBlobs blobs{protocol::encode_description(*description), public_key_blob};
  BOOST_LOG_TRIVIAL(info) << "Session: " << description->type << " ready (" << blobs.description.size()
                          << " byte blob)";
  if (handler) {
    handler(boost::system::error_code(), std::move(blobs));
  }
}

void PeerSession::enter_keyed() {
  if (!state_.transition_to(SessionState::State::KEYED_AWAITING_OPEN)) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Session: Keyed as " << to_string(role_) << ", waiting for channel";
  if (channel_open_) {
    state_.transition_to(SessionState::State::OPEN);
  }
}

void PeerSession::rollback_handshake() {
  ++epoch_;
  if (channel_) {
    channel_->set_handlers({});
    channel_->close();
    channel_.reset();
  }
  if (transport_) {
    transport_->set_handlers({});
    transport_->close();
    transport_.reset();
  }
  ice_waiter_ = nullptr;
  cipher_.reset();
  shared_key_.reset();
  keys_ = crypto::KeyPair{};
  encryption_enabled_ = false;
  channel_open_ = false;
  role_ = Role::NONE;
}

void PeerSession::post_handshake_error(HandshakeHandler handler, const boost::system::error_code& ec) {
  if (!handler) {
    return;
  }
  boost::asio::post(io_, [handler = std::move(handler), ec]() {
    handler(ec, HandshakeBlobs{});
  });
}

//==============================================
// TRANSPORT EVENTS
//==============================================

void PeerSession::handle_connection_state(network::ConnectionStatus status) {
  ControlEvent event;
  event.kind = ControlEvent::Kind::CONNECTION_STATE;
  event.connection_status = status;
  event.detail = network::to_string(status);

  const bool degraded = status == network::ConnectionStatus::DISCONNECTED ||
                        status == network::ConnectionStatus::FAILED;
  if (degraded) {
    event.error = code_of(network::NetworkError::CONNECTION_DEGRADED);
    BOOST_LOG_TRIVIAL(warning) << "Session: Connection " << status;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Session: Connection " << status;
  }
  events_.publish_message(event);

  if (degraded && options_.restart_ice_on_failure && transport_) {
    BOOST_LOG_TRIVIAL(info) << "Session: Restarting ICE";
    transport_->restart_ice();
  }
}

void PeerSession::handle_channel_open() {
  if (channel_open_) {
    return;
  }
  channel_open_ = true;
  if (state_.get_state() == SessionState::State::KEYED_AWAITING_OPEN) {
    state_.transition_to(SessionState::State::OPEN);
  }
  BOOST_LOG_TRIVIAL(info) << "Session: Channel open (" << state_.get_state_string() << ")";
  publish(ControlEvent::Kind::CHANNEL_OPEN);
}

void PeerSession::handle_channel_close() {
  BOOST_LOG_TRIVIAL(info) << "Session: Channel closed by transport";
  publish(ControlEvent::Kind::CHANNEL_CLOSE);
  disconnect();
}

void PeerSession::handle_channel_error(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Session: Channel error: " << message;
  ControlEvent event;
  event.kind = ControlEvent::Kind::CHANNEL_ERROR;
  event.error = code_of(network::NetworkError::TRANSPORT_FAILURE);
  event.detail = message;
  events_.publish_message(event);
}

//==============================================
// RECEIVE PATH
//==============================================

void PeerSession::handle_text(const std::string& text) {
  protocol::ControlMessage message;
  try {
    message = protocol::decode_control_message(text);
  } catch (const protocol::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Dropped control message: " << e.what();
    return;
  }

  std::visit([this](auto& m) {
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, protocol::FileMeta>) {
      handle_file_meta(m);
    } else if constexpr (std::is_same_v<T, protocol::FileComplete>) {
      handle_file_complete(m);
    } else if constexpr (std::is_same_v<T, protocol::CalibrationPing>) {
      handle_ping(m);
    } else if constexpr (std::is_same_v<T, protocol::CalibrationPong>) {
      if (calibrator_) {
        calibrator_->on_pong(m);
      }
    } else {
      ControlEvent event;
      event.kind = ControlEvent::Kind::PEER_MESSAGE;
      event.message = std::move(m.raw);
      events_.publish_message(event);
    }
  }, message);
}

void PeerSession::handle_file_meta(const protocol::FileMeta& meta) {
  protocol::InboundMeta inbound;
  inbound.id = meta.id;
  inbound.size = meta.size;
  inbound.name = meta.name;
  inbound.mime_type = meta.file_type;

  if (meta.encrypted) {
    try {
      if (!cipher_) {
        throw crypto::AuthenticationError("no shared key for encrypted metadata");
      }
      inbound.name = cipher_->decrypt_string(meta.name);
      inbound.mime_type = cipher_->decrypt_string(meta.file_type);
    } catch (const crypto::CryptoError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Session: Metadata for " << meta.id << " rejected: " << e.what();
      protocol::FileTransfer failed;
      failed.id = meta.id;
      failed.size = meta.size;
      failed.status = protocol::TransferStatus::ERROR;
      failed.direction = protocol::TransferDirection::INBOUND;
      failed.error = "metadata failed authentication";
      events_.publish_file(failed);
      return;
    }
  }

  events_.publish_file(reassembler_.begin(inbound));
}

void PeerSession::handle_file_complete(const protocol::FileComplete& complete) {
  auto transfer = reassembler_.complete(complete.id);
  if (!transfer) {
    BOOST_LOG_TRIVIAL(debug) << "Session: file-complete for unknown transfer " << complete.id;
    return;
  }
  events_.publish_file(*transfer);
}

void PeerSession::handle_ping(const protocol::CalibrationPing& ping) {
  if (!channel_) {
    return;
  }
  try {
    channel_->send_text(protocol::encode_control_message(protocol::CalibrationPong{ping.id, ping.size}));
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Could not answer probe " << ping.id << ": " << e.what();
  }
}

void PeerSession::handle_binary(const network::Bytes& data) {
  const auto id = protocol::peek_transfer_id(data);
  if (!id) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Dropped binary message with truncated header";
    return;
  }
  if (protocol::is_calibration_id(*id)) {
    return;
  }
  if (!reassembler_.contains(*id)) {
    BOOST_LOG_TRIVIAL(debug) << "Session: Dropped chunk for unknown transfer " << *id;
    return;
  }

  const bool encrypted = encryption_enabled_ && cipher_;
  std::vector<uint8_t> chunk;
  try {
    auto frame = protocol::decode_chunk_frame(data, encrypted);
    if (encrypted) {
      chunk = cipher_->decrypt(*frame.iv, frame.payload);
    } else {
      chunk = std::move(frame.payload);
    }
  } catch (const protocol::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Malformed chunk for " << *id << ": " << e.what();
    reassembler_.mark_corrupted(*id);
    return;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Chunk for " << *id << " dropped: " << e.what();
    reassembler_.mark_corrupted(*id);
    return;
  }

  if (auto progress = reassembler_.append(*id, std::move(chunk))) {
    events_.publish_file(*progress);
  }
}

//==============================================
// TRANSFER
//==============================================

std::string PeerSession::send_file(protocol::OutgoingFile file, SendHandler handler) {
  if (!is_connected()) {
    BOOST_LOG_TRIVIAL(warning) << "Session: send_file while " << state_.get_state_string();
    if (handler) {
      boost::asio::post(io_, [handler = std::move(handler)]() {
        handler(code_of(network::NetworkError::CHANNEL_NOT_READY), std::string());
      });
    }
    return {};
  }

  const std::string id = boost::uuids::to_string(boost::uuids::random_generator()());

  std::weak_ptr<PeerSession> weak = weak_from_this();
  const uint64_t epoch = epoch_;
  auto on_progress = guarded([this](const protocol::FileTransfer& transfer) {
    events_.publish_file(transfer);
  });
  auto on_complete = [weak, epoch, handler = std::move(handler)](const boost::system::error_code& ec,
                                                                 const std::string& transfer_id) {
    if (auto self = weak.lock(); self && self->epoch_ == epoch) {
      self->senders_.erase(transfer_id);
    }
    if (handler) {
      handler(ec, transfer_id);
    }
  };

  const std::optional<crypto::SymmetricKey> key = encryption_enabled_ ? shared_key_ : std::nullopt;
  auto sender = std::make_shared<FileSender>(io_, channel_, flow_, key, config_, id, std::move(file),
                                             std::move(on_progress), std::move(on_complete));
  senders_[id] = sender;
  sender->start();
  return id;
}

void PeerSession::calibrate(CalibrationHandler handler) {
  if (!is_connected()) {
    CalibrationResult result;
    result.config = config_;
    if (handler) {
      boost::asio::post(io_, [handler = std::move(handler), result]() {
        handler(code_of(network::NetworkError::CHANNEL_NOT_READY), result);
      });
    }
    return;
  }
  if (calibrator_ && calibrator_->running()) {
    CalibrationResult result;
    result.config = config_;
    if (handler) {
      boost::asio::post(io_, [handler = std::move(handler), result]() {
        handler(code_of(network::NetworkError::INVALID_STATE), result);
      });
    }
    return;
  }

  calibrator_ = std::make_shared<Calibrator>(io_, options_.calibration_sizes, options_.probe_timeout,
                                             options_.clock, options_.initial_config);

  std::weak_ptr<PeerSession> weak = weak_from_this();
  const uint64_t epoch = epoch_;
  calibrator_->start(channel_, [weak, epoch, handler = std::move(handler)](const boost::system::error_code& ec,
                                                                           CalibrationResult result) {
    auto self = weak.lock();
    if (self && self->epoch_ == epoch && !ec) {
      if (self->transport_) {
        result.stats = self->transport_->stats();
      }
      self->apply_config(result.config);
      self->events_.publish_calibration(result);
    }
    if (handler) {
      handler(ec, result);
    }
  });
}

void PeerSession::apply_config(const protocol::TransferConfig& config) {
  config_ = config;
  flow_->configure(config_.buffer_threshold, config_.buffer_low_threshold);
  if (channel_) {
    channel_->set_buffered_amount_low_threshold(config_.buffer_low_threshold);
  }
  BOOST_LOG_TRIVIAL(debug) << "Session: Transfer config " << config_;
}

void PeerSession::publish(ControlEvent::Kind kind, const std::string& detail) {
  ControlEvent event;
  event.kind = kind;
  event.detail = detail;
  events_.publish_message(event);
}

//==============================================
// TEARDOWN
//==============================================

void PeerSession::disconnect() {
  if (state_.is_terminal()) {
    return;
  }
  ++epoch_;
  BOOST_LOG_TRIVIAL(info) << "Session: Disconnecting from " << state_.get_state_string();

  ice_timer_.cancel();
  if (ice_waiter_) {
    auto waiter = std::move(ice_waiter_);
    ice_waiter_ = nullptr;
    boost::asio::post(io_, [waiter]() {
      waiter(boost::asio::error::operation_aborted);
    });
  }

  if (calibrator_) {
    calibrator_->cancel();
    calibrator_.reset();
  }
  for (auto& entry : senders_) {
    entry.second->abort(boost::asio::error::operation_aborted);
  }
  senders_.clear();
  flow_->cancel();

  if (channel_) {
    channel_->set_handlers({});
    channel_->close();
    channel_.reset();
  }
  if (transport_) {
    transport_->set_handlers({});
    transport_->close();
    transport_.reset();
  }

  reassembler_.clear();
  cipher_.reset();
  if (shared_key_) {
    shared_key_->wipe();
    shared_key_.reset();
  }
  keys_ = crypto::KeyPair{};
  encryption_enabled_ = false;
  channel_open_ = false;
  apply_config(options_.initial_config);

  state_.transition_to(SessionState::State::CLOSED);
}

//==============================================
// STATUS
//==============================================

bool PeerSession::is_connected() const {
  return state_.get_state() == SessionState::State::OPEN && channel_ &&
         channel_->state() == network::ChannelState::OPEN;
}

} // namespace session
} // namespace peerdrop
