#include "peerdrop/session/calibrator.hpp"
#include <algorithm>
#include <openssl/rand.h>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "peerdrop/network/network_error.hpp"
#include "peerdrop/protocol/chunk_frame.hpp"

namespace peerdrop {
namespace session {

namespace {

constexpr std::chrono::microseconds MIN_ROUND_TRIP{1};

} // namespace

Calibrator::Calibrator(boost::asio::io_context& io,
                       std::vector<std::size_t> sizes,
                       std::chrono::milliseconds probe_timeout,
                       Clock clock,
                       protocol::TransferConfig fallback)
  : io_(io)
  , sizes_(std::move(sizes))
  , probe_timeout_(probe_timeout)
  , clock_(std::move(clock))
  , fallback_(fallback)
  , timer_(io) {
}

std::chrono::steady_clock::time_point Calibrator::now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

//==============================================
// PROBING
//==============================================

void Calibrator::start(std::shared_ptr<network::DataChannel> channel, CompletionHandler handler) {
  channel_ = std::move(channel);
  handler_ = std::move(handler);
  pending_.clear();
  probes_.clear();
  next_index_ = 0;
  running_ = true;

  BOOST_LOG_TRIVIAL(info) << "Calibrator: Probing " << sizes_.size() << " sizes";
  probe_next();
}

void Calibrator::probe_next() {
  if (!running_) {
    return;
  }
  if (next_index_ >= sizes_.size()) {
    finish(boost::system::error_code(), boost::system::error_code());
    return;
  }

  const std::size_t size = sizes_[next_index_];
  const std::string id = protocol::CALIBRATION_ID_PREFIX + boost::uuids::to_string(boost::uuids::random_generator()());

  protocol::ChunkFrame frame;
  frame.transfer_id = id;
  frame.payload.resize(size);
  if (size > 0 && RAND_bytes(frame.payload.data(), static_cast<int>(size)) != 1) {
    finish(network::make_error_code(network::NetworkError::CRYPTO_FAILURE), boost::system::error_code());
    return;
  }

  pending_[id] = PendingProbe{size, now()};
  try {
    channel_->send_binary(protocol::encode_chunk_frame(frame));
    channel_->send_text(protocol::encode_control_message(protocol::CalibrationPing{id, size}));
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Calibrator: Failed to send probe: " << e.what();
    finish(network::make_error_code(network::NetworkError::SEND_FAILED), boost::system::error_code());
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Calibrator: Probe " << id << " sent (" << size << " bytes)";

  std::weak_ptr<Calibrator> weak = shared_from_this();
  timer_.expires_after(probe_timeout_);
  timer_.async_wait([weak, id](const boost::system::error_code& ec) {
    if (auto self = weak.lock()) {
      self->on_timeout(id, ec);
    }
  });
}

void Calibrator::on_pong(const protocol::CalibrationPong& pong) {
  if (!running_) {
    return;
  }
  auto it = pending_.find(pong.id);
  if (it == pending_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Calibrator: Ignoring pong for unknown probe " << pong.id;
    return;
  }

  const PendingProbe probe = it->second;
  pending_.erase(it);
  timer_.cancel();

  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now() - probe.started);
  elapsed = std::max(elapsed, MIN_ROUND_TRIP);
  const double seconds = std::chrono::duration<double>(elapsed).count();

  ProbeResult result;
  result.size = probe.size;
  result.succeeded = true;
  result.rtt_ms = seconds * 1000.0;
  result.bandwidth = 2.0 * static_cast<double>(probe.size) / seconds;
  probes_.push_back(result);

  BOOST_LOG_TRIVIAL(info) << "Calibrator: " << probe.size << " bytes round trip " << result.rtt_ms
                          << " ms, " << result.bandwidth << " B/s";
  ++next_index_;
  probe_next();
}

void Calibrator::on_timeout(const std::string& id, const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted || !running_) {
    return;
  }
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return;
  }

  ProbeResult result;
  result.size = it->second.size;
  probes_.push_back(result);
  pending_.erase(it);

  BOOST_LOG_TRIVIAL(warning) << "Calibrator: Probe of " << result.size << " bytes timed out, stopping";
  finish(boost::system::error_code(), network::make_error_code(network::NetworkError::PROBE_TIMEOUT));
}

void Calibrator::cancel() {
  if (!running_) {
    return;
  }
  finish(boost::asio::error::operation_aborted, boost::system::error_code());
}

void Calibrator::finish(const boost::system::error_code& ec, const boost::system::error_code& probe_error) {
  running_ = false;
  timer_.cancel();
  pending_.clear();
  channel_.reset();

  CalibrationResult result;
  result.config = select_config(probes_, fallback_);
  result.probes = probes_;
  result.probe_error = probe_error;

  BOOST_LOG_TRIVIAL(info) << "Calibrator: Finished with " << result.config;

  auto handler = std::move(handler_);
  handler_ = nullptr;
  if (handler) {
    boost::asio::post(io_, [handler, ec, result]() {
      handler(ec, result);
    });
  }
}

//==============================================
// SELECTION
//==============================================

protocol::TransferConfig Calibrator::select_config(const std::vector<ProbeResult>& probes,
                                                   const protocol::TransferConfig& fallback) {
  const ProbeResult* best = nullptr;
  std::size_t largest = 0;
  for (const auto& probe : probes) {
    if (!probe.succeeded) {
      continue;
    }
    if (!best || probe.bandwidth > best->bandwidth) {
      best = &probe;
    }
    largest = std::max(largest, probe.size);
  }

  if (!best) {
    protocol::TransferConfig config = fallback;
    config.is_calibrated = false;
    return config;
  }

  protocol::TransferConfig config;
  config.chunk_size = best->size;
  config.buffer_threshold = best->size * 4;
  config.buffer_low_threshold = best->size;
  config.max_message_size = largest;
  config.effective_bandwidth = best->bandwidth;
  config.is_calibrated = true;
  return config;
}

} // namespace session
} // namespace peerdrop
