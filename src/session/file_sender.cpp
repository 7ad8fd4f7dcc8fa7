#include "peerdrop/session/file_sender.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "peerdrop/network/network_error.hpp"
#include "peerdrop/protocol/chunk_frame.hpp"
#include "peerdrop/protocol/control_message.hpp"

namespace peerdrop {
namespace session {

//==============================================
// CONSTRUCTOR
//==============================================

FileSender::FileSender(boost::asio::io_context& io,
                       std::shared_ptr<network::DataChannel> channel,
                       std::shared_ptr<FlowController> flow,
                       const std::optional<crypto::SymmetricKey>& key,
                       protocol::TransferConfig config,
                       std::string id,
                       protocol::OutgoingFile file,
                       ProgressHandler on_progress,
                       CompletionHandler on_complete)
  : io_(io)
  , channel_(std::move(channel))
  , flow_(std::move(flow))
  , config_(config)
  , id_(std::move(id))
  , file_(std::move(file))
  , on_progress_(std::move(on_progress))
  , on_complete_(std::move(on_complete)) {
  if (key) {
    cipher_ = std::make_unique<crypto::AeadCipher>(*key);
  }
  if (config_.chunk_size == 0) {
    config_.chunk_size = protocol::TransferConfig::defaults().chunk_size;
  }
}

//==============================================
// SEND LOOP
//==============================================

void FileSender::start() {
  BOOST_LOG_TRIVIAL(info) << "Sender: Starting " << id_ << " (" << file_.name << ", "
                          << file_.data.size() << " bytes, chunk " << config_.chunk_size
                          << (cipher_ ? ", encrypted" : "") << ")";
  report(protocol::TransferStatus::PENDING, 0);
  send_meta();
  if (!finished_) {
    schedule_step();
  }
}

void FileSender::send_meta() {
  protocol::FileMeta meta;
  meta.id = id_;
  meta.size = file_.data.size();

  try {
    if (cipher_) {
      meta.name = cipher_->encrypt_string(file_.name);
      meta.file_type = cipher_->encrypt_string(file_.mime_type);
      meta.encrypted = true;
    } else {
      meta.name = file_.name;
      meta.file_type = file_.mime_type;
    }
    channel_->send_text(protocol::encode_control_message(meta));
  } catch (const crypto::CryptoError& e) {
    fail(network::make_error_code(network::NetworkError::CRYPTO_FAILURE), e.what());
  } catch (const network::TransportError& e) {
    fail(network::make_error_code(network::NetworkError::SEND_FAILED), e.what());
  }
}

void FileSender::schedule_step() {
  auto self = shared_from_this();
  boost::asio::post(io_, [self]() {
    self->step();
  });
}

void FileSender::step() {
  if (finished_ || aborted_) {
    return;
  }

  if (offset_ >= file_.data.size()) {
    succeed();
    return;
  }

  if (flow_->must_wait(channel_->buffered_amount())) {
    // The parked waiter owns the sender until the low signal or cancel()
    auto self = shared_from_this();
    flow_->wait([self](const boost::system::error_code& ec) {
      if (ec) {
        self->fail(ec, "flow control wait cancelled");
      } else {
        self->step();
      }
    });
    return;
  }

  send_chunk();
  if (!finished_) {
    schedule_step();
  }
}

void FileSender::send_chunk() {
  const std::size_t length = std::min(config_.chunk_size, file_.data.size() - offset_);
  const uint8_t* begin = file_.data.data() + offset_;

  protocol::ChunkFrame frame;
  frame.transfer_id = id_;

  try {
    if (cipher_) {
      auto sealed = cipher_->encrypt(begin, length);
      frame.iv = sealed.iv;
      frame.payload = std::move(sealed.ciphertext);
    } else {
      frame.payload.assign(begin, begin + length);
    }
    channel_->send_binary(protocol::encode_chunk_frame(frame));
  } catch (const crypto::CryptoError& e) {
    fail(network::make_error_code(network::NetworkError::CRYPTO_FAILURE), e.what());
    return;
  } catch (const network::TransportError& e) {
    fail(network::make_error_code(network::NetworkError::SEND_FAILED), e.what());
    return;
  }

  offset_ += length;
  ++chunks_sent_;
  report(protocol::TransferStatus::TRANSFERRING, protocol::compute_progress(offset_, file_.data.size()));
}

void FileSender::succeed() {
  try {
    channel_->send_text(protocol::encode_control_message(protocol::FileComplete{id_}));
  } catch (const network::TransportError& e) {
    fail(network::make_error_code(network::NetworkError::SEND_FAILED), e.what());
    return;
  }

  finished_ = true;
  report(protocol::TransferStatus::COMPLETED, 100);
  BOOST_LOG_TRIVIAL(info) << "Sender: Finished " << id_ << " in " << chunks_sent_ << " chunks";

  auto handler = std::move(on_complete_);
  on_complete_ = nullptr;
  if (handler) {
    handler(boost::system::error_code(), id_);
  }
}

//==============================================
// FAILURE
//==============================================

void FileSender::abort(const boost::system::error_code& ec) {
  if (finished_ || aborted_) {
    return;
  }
  aborted_ = true;
  auto self = shared_from_this();
  boost::asio::post(io_, [self, ec]() {
    self->fail(ec, "transfer aborted");
  });
}

void FileSender::fail(const boost::system::error_code& ec, const std::string& reason) {
  if (finished_) {
    return;
  }
  finished_ = true;
  BOOST_LOG_TRIVIAL(error) << "Sender: Transfer " << id_ << " failed: " << ec.message() << " (" << reason << ")";
  report(protocol::TransferStatus::ERROR, protocol::compute_progress(offset_, file_.data.size()), reason);

  auto handler = std::move(on_complete_);
  on_complete_ = nullptr;
  if (handler) {
    handler(ec, id_);
  }
}

void FileSender::report(protocol::TransferStatus status, int progress, const std::string& error) {
  if (!on_progress_) {
    return;
  }
  protocol::FileTransfer transfer;
  transfer.id = id_;
  transfer.name = file_.name;
  transfer.size = file_.data.size();
  transfer.mime_type = file_.mime_type;
  transfer.progress = progress;
  transfer.status = status;
  transfer.direction = protocol::TransferDirection::OUTBOUND;
  transfer.error = error;
  on_progress_(transfer);
}

} // namespace session
} // namespace peerdrop
