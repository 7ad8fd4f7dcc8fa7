#include "peerdrop/network/loopback_transport.hpp"
#include <algorithm>
#include <sstream>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace network {

namespace {

constexpr const char* TOKEN_ATTRIBUTE = "a=loopback-token:";

std::chrono::steady_clock::duration transmit_time(std::size_t size, std::size_t bytes_per_second) {
  if (bytes_per_second == 0) {
    return std::chrono::steady_clock::duration::zero();
  }
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(static_cast<double>(size) / static_cast<double>(bytes_per_second)));
}

} // namespace

//==============================================
// HUB
//==============================================

LoopbackHub::LoopbackHub(boost::asio::io_context& io, LoopbackOptions options)
  : io_(io)
  , options_(std::move(options)) {
}

std::shared_ptr<LoopbackHub> LoopbackHub::create(boost::asio::io_context& io, LoopbackOptions options) {
  return std::shared_ptr<LoopbackHub>(new LoopbackHub(io, std::move(options)));
}

TransportFactory LoopbackHub::factory() {
  auto self = shared_from_this();
  return [self]() -> std::shared_ptr<PeerTransport> {
    return self->create_transport();
  };
}

std::shared_ptr<LoopbackTransport> LoopbackHub::create_transport() {
  for (auto it = registry_.begin(); it != registry_.end();) {
    if (it->second.expired()) {
      it = registry_.erase(it);
    } else {
      ++it;
    }
  }

  const std::string token = "lb-" + std::to_string(next_token_++);
  auto transport = std::make_shared<LoopbackTransport>(shared_from_this(), token);
  registry_[token] = transport;
  BOOST_LOG_TRIVIAL(debug) << "Loopback: Created transport " << token;
  return transport;
}

std::shared_ptr<LoopbackTransport> LoopbackHub::find(const std::string& token) const {
  auto it = registry_.find(token);
  if (it == registry_.end()) {
    return nullptr;
  }
  return it->second.lock();
}

//==============================================
// DATA CHANNEL
//==============================================

LoopbackDataChannel::LoopbackDataChannel(boost::asio::io_context& io, std::string label,
                                         const LoopbackOptions& options)
  : io_(io)
  , label_(std::move(label))
  , options_(options)
  , delivery_timer_(io) {
}

LoopbackDataChannel::~LoopbackDataChannel() = default;

void LoopbackDataChannel::set_handlers(Handlers handlers) {
  handlers_ = std::move(handlers);
}

void LoopbackDataChannel::send_binary(const Bytes& data) {
  if (state_ != ChannelState::OPEN) {
    throw TransportError("Channel " + label_ + " is " + to_string(state_));
  }
  enqueue(true, data);
}

void LoopbackDataChannel::send_text(const std::string& text) {
  if (state_ != ChannelState::OPEN) {
    throw TransportError("Channel " + label_ + " is " + to_string(state_));
  }
  enqueue(false, Bytes(text.begin(), text.end()));
}

void LoopbackDataChannel::enqueue(bool binary, Bytes payload) {
  const auto now = std::chrono::steady_clock::now();
  const auto start = std::max(now, link_free_at_);
  link_free_at_ = start + transmit_time(payload.size(), options_.bytes_per_second);

  Message message;
  message.binary = binary;
  message.deliver_at = link_free_at_ + options_.latency;
  buffered_amount_ += payload.size();
  message.payload = std::move(payload);
  outbound_.push_back(std::move(message));

  schedule_delivery();
}

void LoopbackDataChannel::schedule_delivery() {
  if (delivery_scheduled_ || outbound_.empty()) {
    return;
  }
  delivery_scheduled_ = true;
  delivery_timer_.expires_at(outbound_.front().deliver_at);

  std::weak_ptr<LoopbackDataChannel> weak = shared_from_this();
  delivery_timer_.async_wait([weak](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->delivery_scheduled_ = false;
      self->deliver_front();
    }
  });
}

void LoopbackDataChannel::deliver_front() {
  if (outbound_.empty()) {
    return;
  }

  Message message = std::move(outbound_.front());
  outbound_.pop_front();

  const std::size_t before = buffered_amount_;
  buffered_amount_ -= std::min(buffered_amount_, message.payload.size());

  if (auto peer = peer_.lock()) {
    peer->receive(message);
  }

  // Fires only when the amount crosses the low-water mark downwards
  if (state_ == ChannelState::OPEN && before > low_threshold_ && buffered_amount_ <= low_threshold_) {
    auto handler = handlers_.on_buffered_amount_low;
    if (handler) {
      handler();
    }
  }

  schedule_delivery();
}

void LoopbackDataChannel::receive(const Message& message) {
  if (state_ != ChannelState::OPEN) {
    return;
  }
  if (message.binary) {
    auto handler = handlers_.on_binary;
    if (handler) {
      handler(message.payload);
    }
  } else {
    auto handler = handlers_.on_text;
    if (handler) {
      handler(std::string(message.payload.begin(), message.payload.end()));
    }
  }
}

void LoopbackDataChannel::link(const std::shared_ptr<LoopbackDataChannel>& a,
                               const std::shared_ptr<LoopbackDataChannel>& b) {
  a->peer_ = b;
  b->peer_ = a;
}

void LoopbackDataChannel::open() {
  if (state_ != ChannelState::CONNECTING) {
    return;
  }
  state_ = ChannelState::OPEN;
  BOOST_LOG_TRIVIAL(debug) << "Loopback: Channel " << label_ << " open";
  auto handler = handlers_.on_open;
  if (handler) {
    handler();
  }
}

void LoopbackDataChannel::close() {
  if (state_ == ChannelState::CLOSED || state_ == ChannelState::CLOSING) {
    return;
  }
  state_ = ChannelState::CLOSED;
  outbound_.clear();
  buffered_amount_ = 0;
  delivery_timer_.cancel();
  delivery_scheduled_ = false;

  auto peer = peer_.lock();
  peer_.reset();

  auto self = shared_from_this();
  boost::asio::post(io_, [self]() {
    auto handler = self->handlers_.on_close;
    if (handler) {
      handler();
    }
  });
  if (peer) {
    boost::asio::post(io_, [peer]() {
      peer->handle_remote_close();
    });
  }
}

void LoopbackDataChannel::handle_remote_close() {
  if (state_ == ChannelState::CLOSED) {
    return;
  }
  state_ = ChannelState::CLOSED;
  outbound_.clear();
  buffered_amount_ = 0;
  delivery_timer_.cancel();
  delivery_scheduled_ = false;
  peer_.reset();

  BOOST_LOG_TRIVIAL(debug) << "Loopback: Channel " << label_ << " closed by peer";
  auto handler = handlers_.on_close;
  if (handler) {
    handler();
  }
}

//==============================================
// TRANSPORT
//==============================================

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub, std::string token)
  : hub_(std::move(hub))
  , token_(std::move(token))
  , gathering_timer_(hub_->io_context()) {
}

LoopbackTransport::~LoopbackTransport() = default;

void LoopbackTransport::set_handlers(Handlers handlers) {
  handlers_ = std::move(handlers);
}

std::shared_ptr<DataChannel> LoopbackTransport::create_data_channel(const std::string& label, bool ordered) {
  if (closed_) {
    throw TransportError("Transport " + token_ + " is closed");
  }
  if (!ordered) {
    BOOST_LOG_TRIVIAL(warning) << "Loopback: Unordered channels are delivered in order anyway";
  }
  channel_label_ = label;
  channel_ = std::make_shared<LoopbackDataChannel>(hub_->io_context(), label, hub_->options());
  return channel_;
}

SessionDescription LoopbackTransport::create_local_offer() {
  if (closed_) {
    throw TransportError("Transport " + token_ + " is closed");
  }
  if (!channel_) {
    throw TransportError("Offer requires a data channel");
  }
  return SessionDescription{"offer", build_sdp("actpass")};
}

SessionDescription LoopbackTransport::create_local_answer() {
  if (closed_) {
    throw TransportError("Transport " + token_ + " is closed");
  }
  if (!remote_token_) {
    throw TransportError("Answer requires a remote offer");
  }
  return SessionDescription{"answer", build_sdp("active")};
}

std::string LoopbackTransport::build_sdp(const std::string& setup) const {
  std::ostringstream sdp;
  sdp << "v=0\r\n"
      << "o=- " << token_ << " 2 IN IP4 127.0.0.1\r\n"
      << "s=-\r\n"
      << "t=0 0\r\n"
      << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
      << "c=IN IP4 0.0.0.0\r\n"
      << "a=setup:" << setup << "\r\n"
      << "a=sctp-port:5000\r\n"
      << TOKEN_ATTRIBUTE << token_ << "\r\n";
  return sdp.str();
}

std::optional<std::string> LoopbackTransport::parse_token(const std::string& sdp) {
  const auto pos = sdp.find(TOKEN_ATTRIBUTE);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const auto start = pos + std::char_traits<char>::length(TOKEN_ATTRIBUTE);
  const auto end = sdp.find_first_of("\r\n", start);
  std::string token = sdp.substr(start, end == std::string::npos ? std::string::npos : end - start);
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

void LoopbackTransport::set_local_description(const SessionDescription& description) {
  if (closed_) {
    throw TransportError("Transport " + token_ + " is closed");
  }
  local_description_ = description;
  set_gathering_state(IceGatheringState::GATHERING);

  if (!hub_->options().complete_ice_gathering) {
    BOOST_LOG_TRIVIAL(debug) << "Loopback: " << token_ << " will never finish gathering";
    return;
  }

  std::weak_ptr<LoopbackTransport> weak = shared_from_this();
  gathering_timer_.expires_after(hub_->options().ice_gathering_delay);
  gathering_timer_.async_wait([weak](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock(); self && !self->closed_) {
      self->set_gathering_state(IceGatheringState::COMPLETE);
    }
  });
}

std::optional<SessionDescription> LoopbackTransport::local_description() const {
  if (!local_description_) {
    return std::nullopt;
  }
  SessionDescription description = *local_description_;
  if (gathering_state_ == IceGatheringState::COMPLETE) {
    description.sdp += "a=candidate:1 1 udp 2130706431 127.0.0.1 9 typ " + hub_->options().candidate_type + "\r\n";
    description.sdp += "a=end-of-candidates\r\n";
  }
  return description;
}

void LoopbackTransport::apply_remote_description(const SessionDescription& description) {
  if (closed_) {
    throw TransportError("Transport " + token_ + " is closed");
  }

  const auto token = parse_token(description.sdp);
  if (!token) {
    throw TransportError("Description carries no loopback token");
  }
  auto peer = hub_->find(*token);
  if (!peer || peer.get() == this) {
    throw TransportError("No loopback endpoint for token " + *token);
  }

  if (description.type == "offer") {
    if (local_description_) {
      throw TransportError("Offer applied after a local description was set");
    }
    remote_token_ = token;
    set_connection_state(ConnectionStatus::CONNECTING);
  } else if (description.type == "answer") {
    if (!local_description_ || local_description_->type != "offer") {
      throw TransportError("Answer applied without a local offer");
    }
    if (peer->remote_token_ != token_) {
      throw TransportError("Answer from " + *token + " does not match this offer");
    }
    remote_token_ = token;
    set_connection_state(ConnectionStatus::CONNECTING);
    connect_to(peer);
  } else {
    throw TransportError("Unsupported description type: " + description.type);
  }
}

void LoopbackTransport::connect_to(const std::shared_ptr<LoopbackTransport>& answerer) {
  auto self = shared_from_this();
  boost::asio::post(hub_->io_context(), [self, answerer]() {
    if (self->closed_ || answerer->closed_ || !self->channel_) {
      return;
    }
    auto remote = std::make_shared<LoopbackDataChannel>(self->hub_->io_context(), self->channel_label_,
                                                        self->hub_->options());
    LoopbackDataChannel::link(self->channel_, remote);
    answerer->accept_channel(remote);

    self->set_connection_state(ConnectionStatus::CONNECTED);
    answerer->set_connection_state(ConnectionStatus::CONNECTED);

    BOOST_LOG_TRIVIAL(info) << "Loopback: Linked " << self->token_ << " <-> " << answerer->token_;
    self->channel_->open();
    remote->open();
  });
}

void LoopbackTransport::accept_channel(const std::shared_ptr<LoopbackDataChannel>& channel) {
  channel_label_ = channel->label();
  channel_ = channel;
  auto handler = handlers_.on_data_channel;
  if (handler) {
    handler(channel);
  }
}

void LoopbackTransport::set_gathering_state(IceGatheringState state) {
  gathering_state_ = state;
  auto self = shared_from_this();
  boost::asio::post(hub_->io_context(), [self, state]() {
    if (self->closed_) {
      return;
    }
    auto handler = self->handlers_.on_ice_gathering_state;
    if (handler) {
      handler(state);
    }
  });
}

void LoopbackTransport::set_connection_state(ConnectionStatus status) {
  connection_status_ = status;
  auto self = shared_from_this();
  boost::asio::post(hub_->io_context(), [self, status]() {
    if (self->closed_) {
      return;
    }
    auto handler = self->handlers_.on_connection_state;
    if (handler) {
      handler(status);
    }
  });
}

TransportStats LoopbackTransport::stats() const {
  TransportStats stats;
  if (connection_status_ != ConnectionStatus::CONNECTED) {
    return stats;
  }
  stats.rtt_ms = 2.0 * static_cast<double>(hub_->options().latency.count());
  stats.local_candidate_type = hub_->options().candidate_type;
  stats.remote_candidate_type = hub_->options().candidate_type;
  stats.connection_type = hub_->options().candidate_type == "relay" ? "relayed" : "direct";
  return stats;
}

void LoopbackTransport::restart_ice() {
  if (closed_ || !remote_token_) {
    return;
  }
  auto peer = hub_->find(*remote_token_);
  BOOST_LOG_TRIVIAL(info) << "Loopback: ICE restart on " << token_;
  set_connection_state(peer && !peer->closed_ ? ConnectionStatus::CONNECTED : ConnectionStatus::FAILED);
}

void LoopbackTransport::inject_connection_state(ConnectionStatus status) {
  if (closed_) {
    return;
  }
  set_connection_state(status);
}

void LoopbackTransport::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  connection_status_ = ConnectionStatus::CLOSED;
  gathering_timer_.cancel();

  if (channel_) {
    channel_->close();
    channel_.reset();
  }

  if (remote_token_) {
    if (auto peer = hub_->find(*remote_token_)) {
      boost::asio::post(hub_->io_context(), [peer]() {
        peer->inject_connection_state(ConnectionStatus::DISCONNECTED);
      });
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Loopback: Closed transport " << token_;
}

} // namespace network
} // namespace peerdrop
