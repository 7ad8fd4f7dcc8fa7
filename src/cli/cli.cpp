#include "peerdrop/cli/cli.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace cli {

std::string guess_mime_type(const std::string& filename) {
  static const std::map<std::string, std::string> types = {
    {"txt", "text/plain"},
    {"html", "text/html"},
    {"json", "application/json"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"zip", "application/zip"},
    {"mp4", "video/mp4"}
  };

  const auto dot = filename.find_last_of('.');
  if (dot == std::string::npos) {
    return "application/octet-stream";
  }
  std::string ext = filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  auto it = types.find(ext);
  return it == types.end() ? "application/octet-stream" : it->second;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(network::LoopbackOptions link_options, session::SessionOptions session_options,
         std::istream& in, std::ostream& out)
  : link_options_(std::move(link_options))
  , session_options_(std::move(session_options))
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}

CLI::~CLI() {
  subscriptions_.clear();
  if (alice_) {
    alice_->disconnect();
  }
  if (bob_) {
    bob_->disconnect();
  }
}

//==============================================
// STARTUP
//==============================================

void CLI::run() {
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "peerdrop> " << std::flush;

  while (std::getline(in_, line)) {
    if (!process_command(line)) {
      break;
    }
    out_ << "peerdrop> " << std::flush;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

// Runs the event loop until the loopback link goes quiet
void CLI::pump() {
  io_.restart();
  io_.run();
}

bool CLI::connected() const {
  return alice_ && bob_ && alice_->is_connected() && bob_->is_connected();
}

//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::process_command(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument;
  iss >> command;
  std::getline(iss >> std::ws, argument);

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  if (command == "connect") {
    handle_connect_command();
  } else if (command == "calibrate") {
    handle_calibrate_command();
  } else if (command == "send" && !argument.empty()) {
    handle_send_command(argument);
  } else if (command == "status") {
    handle_status_command();
  } else if (command == "disconnect") {
    handle_disconnect_command();
  } else if (command == "help") {
    handle_help_command();
  } else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}

void CLI::handle_connect_command() {
  if (connected()) {
    out_ << "Already connected" << std::endl;
    return;
  }

  subscriptions_.clear();
  if (alice_) {
    alice_->disconnect();
  }
  if (bob_) {
    bob_->disconnect();
  }
  sent_files_.clear();

  hub_ = network::LoopbackHub::create(io_, link_options_);
  alice_ = session::PeerSession::create(io_, hub_->factory(), session_options_);
  bob_ = session::PeerSession::create(io_, hub_->factory(), session_options_);
  subscribe("alice", *alice_);
  subscribe("bob", *bob_);

  boost::system::error_code offer_error;
  session::PeerSession::HandshakeBlobs offer;
  alice_->create_offer([&](const boost::system::error_code& ec, session::PeerSession::HandshakeBlobs blobs) {
    offer_error = ec;
    offer = std::move(blobs);
  });
  pump();
  if (offer_error) {
    log_and_display_error("Offer failed", offer_error.message());
    return;
  }
  out_ << "alice: offer " << offer.description.size() << " chars, key " << offer.public_key.size() << " chars"
       << std::endl;

  boost::system::error_code answer_error;
  session::PeerSession::HandshakeBlobs answer;
  bob_->handle_offer(offer.description, offer.public_key,
                     [&](const boost::system::error_code& ec, session::PeerSession::HandshakeBlobs blobs) {
    answer_error = ec;
    answer = std::move(blobs);
  });
  pump();
  if (answer_error) {
    log_and_display_error("Answer failed", answer_error.message());
    return;
  }
  out_ << "bob: answer " << answer.description.size() << " chars, key " << answer.public_key.size() << " chars"
       << std::endl;

  if (auto ec = alice_->handle_answer(answer.description, answer.public_key)) {
    log_and_display_error("Applying answer failed", ec.message());
    return;
  }
  pump();

  out_ << (connected() ? "Connected (encrypted)" : "Connection did not open") << std::endl;
}

void CLI::handle_calibrate_command() {
  if (!connected()) {
    out_ << "Not connected" << std::endl;
    return;
  }

  alice_->calibrate([this](const boost::system::error_code& ec, const session::CalibrationResult& result) {
    if (ec) {
      log_and_display_error("Calibration failed", ec.message());
      return;
    }
    for (const auto& probe : result.probes) {
      out_ << "  probe " << probe.size << " bytes: ";
      if (probe.succeeded) {
        out_ << probe.rtt_ms << " ms, " << probe.bandwidth / (1024.0 * 1024.0) << " MiB/s" << std::endl;
      } else {
        out_ << "timed out" << std::endl;
      }
    }
    if (result.stats.rtt_ms) {
      out_ << "  transport rtt " << *result.stats.rtt_ms << " ms, " << result.stats.connection_type << std::endl;
    }
  });
  pump();
}

void CLI::handle_send_command(const std::string& filename) {
  if (!connected()) {
    out_ << "Not connected" << std::endl;
    return;
  }

  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  protocol::OutgoingFile outgoing;
  const auto slash = filename.find_last_of('/');
  outgoing.name = slash == std::string::npos ? filename : filename.substr(slash + 1);
  outgoing.mime_type = guess_mime_type(filename);
  outgoing.data = data;

  const std::string id = alice_->send_file(std::move(outgoing),
                                           [this](const boost::system::error_code& ec, const std::string& transfer_id) {
    if (ec) {
      log_and_display_error("Send of " + transfer_id + " failed", ec.message());
    }
  });
  if (!id.empty()) {
    sent_files_[id] = std::move(data);
  }
  pump();
}

void CLI::handle_status_command() {
  if (!alice_ || !bob_) {
    out_ << "No session" << std::endl;
    return;
  }
  print_status("alice", *alice_);
  print_status("bob", *bob_);
}

void CLI::handle_disconnect_command() {
  if (!alice_) {
    out_ << "No session" << std::endl;
    return;
  }
  alice_->disconnect();
  pump();
  out_ << "Disconnected" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  connect           Run the offer/answer handshake between alice and bob" << std::endl;
  out_ << "  calibrate         Probe the link and tune chunk size and buffers" << std::endl;
  out_ << "  send <file>       Send <file> from alice to bob" << std::endl;
  out_ << "  status            Show session state for both peers" << std::endl;
  out_ << "  disconnect        Tear down the session" << std::endl;
  out_ << "  quit              Exit the shell" << std::endl << std::endl;
}

//==============================================
// OUTPUT
//==============================================

void CLI::subscribe(const std::string& name, session::PeerSession& peer) {
  subscriptions_.emplace_back(peer.events().on_message([this, name](const session::ControlEvent& event) {
    out_ << name << ": " << session::to_string(event.kind);
    if (!event.detail.empty()) {
      out_ << " " << event.detail;
    }
    if (event.error) {
      out_ << " (" << event.error.message() << ")";
    }
    if (event.kind == session::ControlEvent::Kind::PEER_MESSAGE) {
      out_ << " " << event.message.dump();
    }
    out_ << std::endl;
  }));

  subscriptions_.emplace_back(peer.events().on_file([this, name](const protocol::FileTransfer& transfer) {
    if (transfer.status == protocol::TransferStatus::TRANSFERRING && transfer.progress % 25 != 0) {
      return;
    }
    out_ << name << ": " << transfer.direction << " " << transfer.name << " [" << transfer.status << " "
         << transfer.progress << "%]";
    if (!transfer.error.empty()) {
      out_ << " " << transfer.error;
    }
    if (transfer.payload) {
      auto source = sent_files_.find(transfer.id);
      const bool verified = source != sent_files_.end() && source->second == *transfer.payload;
      out_ << " " << transfer.payload->size() << " bytes, " << (verified ? "verified" : "MISMATCH");
    }
    out_ << std::endl;
  }));

  subscriptions_.emplace_back(peer.events().on_calibration([this, name](const session::CalibrationResult& result) {
    out_ << name << ": calibrated " << result.config << std::endl;
  }));
}

void CLI::print_status(const std::string& name, const session::PeerSession& peer) {
  out_ << name << ": " << peer.state() << ", role " << session::to_string(peer.role())
       << ", " << (peer.is_encryption_enabled() ? "encrypted" : "plaintext")
       << ", " << (peer.is_connected() ? "connected" : "not connected") << std::endl;
  out_ << "  config " << peer.transfer_config() << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace peerdrop
