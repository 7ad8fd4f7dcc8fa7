#include "peerdrop/session/flow_controller.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace session {

FlowController::FlowController(boost::asio::io_context& io, std::size_t high_threshold, std::size_t low_threshold)
  : io_(io)
  , high_threshold_(high_threshold)
  , low_threshold_(low_threshold) {
}

void FlowController::configure(std::size_t high_threshold, std::size_t low_threshold) {
  high_threshold_ = high_threshold;
  low_threshold_ = low_threshold;
  BOOST_LOG_TRIVIAL(debug) << "Flow control: High " << high_threshold_ << ", low " << low_threshold_;
}

void FlowController::wait(WaitHandler handler) {
  waiters_.push_back(std::move(handler));
  BOOST_LOG_TRIVIAL(trace) << "Flow control: Sender paused (" << waiters_.size() << " waiting)";
}

void FlowController::on_buffered_amount_low() {
  if (!waiters_.empty()) {
    BOOST_LOG_TRIVIAL(trace) << "Flow control: Resuming " << waiters_.size() << " sender(s)";
  }
  release(boost::system::error_code());
}

void FlowController::cancel() {
  release(boost::asio::error::operation_aborted);
}

void FlowController::release(const boost::system::error_code& ec) {
  std::vector<WaitHandler> waiters;
  waiters.swap(waiters_);
  for (auto& waiter : waiters) {
    boost::asio::post(io_, [waiter = std::move(waiter), ec]() {
      waiter(ec);
    });
  }
}

} // namespace session
} // namespace peerdrop
