#include "peerdrop/session/event_dispatcher.hpp"
#include <exception>
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace session {

namespace {

// Keeps one subscriber's failure from reaching the others or the caller
template <typename Arg>
std::function<void(const Arg&)> isolate(std::function<void(const Arg&)> slot, const char* channel) {
  return [slot = std::move(slot), channel](const Arg& value) {
    try {
      slot(value);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Events: Subscriber on " << channel << " threw: " << e.what();
    }
  };
}

} // namespace

const char* to_string(ControlEvent::Kind kind) {
  switch (kind) {
    case ControlEvent::Kind::CHANNEL_OPEN:        return "channel-open";
    case ControlEvent::Kind::CHANNEL_CLOSE:       return "channel-close";
    case ControlEvent::Kind::CHANNEL_ERROR:       return "channel-error";
    case ControlEvent::Kind::CONNECTION_STATE:    return "connection-state";
    case ControlEvent::Kind::ICE_CANDIDATE_ERROR: return "ice-candidate-error";
    case ControlEvent::Kind::PEER_MESSAGE:        return "peer-message";
    default:                                      return "unknown";
  }
}

//==============================================
// SUBSCRIPTION
//==============================================

boost::signals2::connection EventDispatcher::on_message(MessageSlot slot) {
  return message_signal_.connect(isolate(std::move(slot), "messages"));
}

boost::signals2::connection EventDispatcher::on_file(FileSlot slot) {
  return file_signal_.connect(isolate(std::move(slot), "files"));
}

boost::signals2::connection EventDispatcher::on_calibration(CalibrationSlot slot) {
  return calibration_signal_.connect(isolate(std::move(slot), "calibration"));
}

void EventDispatcher::disconnect_all() {
  message_signal_.disconnect_all_slots();
  file_signal_.disconnect_all_slots();
  calibration_signal_.disconnect_all_slots();
}

//==============================================
// PUBLISHING
//==============================================

void EventDispatcher::publish_message(const ControlEvent& event) {
  BOOST_LOG_TRIVIAL(trace) << "Events: " << to_string(event.kind);
  message_signal_(event);
}

void EventDispatcher::publish_file(const protocol::FileTransfer& transfer) {
  BOOST_LOG_TRIVIAL(trace) << "Events: File " << transfer.id << " " << transfer.status
                           << " " << transfer.progress << "%";
  file_signal_(transfer);
}

void EventDispatcher::publish_calibration(const CalibrationResult& result) {
  calibration_signal_(result);
}

} // namespace session
} // namespace peerdrop
