#ifndef PEERDROP_SESSION_CALIBRATOR_HPP
#define PEERDROP_SESSION_CALIBRATOR_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include "peerdrop/network/transport.hpp"
#include "peerdrop/protocol/control_message.hpp"
#include "peerdrop/protocol/transfer_config.hpp"
#include "peerdrop/session/session_options.hpp"

namespace peerdrop {
namespace session {

struct ProbeResult {
    std::size_t size{0};
    bool succeeded{false};
    double rtt_ms{0.0};
    // Bytes per second
    double bandwidth{0.0};
};

struct CalibrationResult {
    protocol::TransferConfig config = protocol::TransferConfig::defaults();
    std::vector<ProbeResult> probes;
    network::TransportStats stats;
    // PROBE_TIMEOUT when escalation stopped early
    boost::system::error_code probe_error;
};

/**
 * Progressive bandwidth probe. Sizes are tried one at a time in order;
 * each sends a random payload under a calibration id followed by a ping,
 * and waits for the matching pong. The first timeout ends the run.
 */
class Calibrator : public std::enable_shared_from_this<Calibrator> {
public:
    using CompletionHandler = std::function<void(const boost::system::error_code&, CalibrationResult)>;

    Calibrator(boost::asio::io_context& io,
               std::vector<std::size_t> sizes,
               std::chrono::milliseconds probe_timeout,
               Clock clock,
               protocol::TransferConfig fallback);

    void start(std::shared_ptr<network::DataChannel> channel, CompletionHandler handler);
    void on_pong(const protocol::CalibrationPong& pong);
    // Completes with operation_aborted
    void cancel();

    bool running() const { return running_; }
    std::size_t pending_probes() const { return pending_.size(); }

    // Highest-bandwidth successful size wins; fallback when none succeeded
    static protocol::TransferConfig select_config(const std::vector<ProbeResult>& probes,
                                                  const protocol::TransferConfig& fallback);

private:
    struct PendingProbe {
        std::size_t size;
        std::chrono::steady_clock::time_point started;
    };

    void probe_next();
    void on_timeout(const std::string& id, const boost::system::error_code& ec);
    void finish(const boost::system::error_code& ec, const boost::system::error_code& probe_error);
    std::chrono::steady_clock::time_point now() const;

    boost::asio::io_context& io_;
    std::vector<std::size_t> sizes_;
    std::chrono::milliseconds probe_timeout_;
    Clock clock_;
    protocol::TransferConfig fallback_;

    boost::asio::steady_timer timer_;
    std::shared_ptr<network::DataChannel> channel_;
    CompletionHandler handler_;
    std::map<std::string, PendingProbe> pending_;
    std::vector<ProbeResult> probes_;
    std::size_t next_index_{0};
    bool running_{false};
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_CALIBRATOR_HPP
