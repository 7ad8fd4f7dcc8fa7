#ifndef PEERDROP_SESSION_FLOW_CONTROLLER_HPP
#define PEERDROP_SESSION_FLOW_CONTROLLER_HPP

#include <cstddef>
#include <functional>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

namespace peerdrop {
namespace session {

/**
 * Backpressure gate for the send path. Senders park here while the
 * channel's buffered amount is above the high threshold and resume on
 * the channel's buffered-amount-low signal.
 */
class FlowController {
public:
    using WaitHandler = std::function<void(const boost::system::error_code&)>;

    FlowController(boost::asio::io_context& io, std::size_t high_threshold, std::size_t low_threshold);

    void configure(std::size_t high_threshold, std::size_t low_threshold);
    std::size_t high_threshold() const { return high_threshold_; }
    std::size_t low_threshold() const { return low_threshold_; }

    bool must_wait(std::size_t buffered_amount) const { return buffered_amount > high_threshold_; }

    // Handler runs once, from the io_context, after the next low signal or cancel()
    void wait(WaitHandler handler);
    void on_buffered_amount_low();
    // Completes every parked waiter with operation_aborted
    void cancel();

    std::size_t waiting() const { return waiters_.size(); }

private:
    void release(const boost::system::error_code& ec);

    boost::asio::io_context& io_;
    std::size_t high_threshold_;
    std::size_t low_threshold_;
    std::vector<WaitHandler> waiters_;
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_FLOW_CONTROLLER_HPP
