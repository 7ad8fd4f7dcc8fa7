#ifndef PEERDROP_SESSION_FILE_SENDER_HPP
#define PEERDROP_SESSION_FILE_SENDER_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include "peerdrop/crypto/aead_cipher.hpp"
#include "peerdrop/network/transport.hpp"
#include "peerdrop/protocol/file_transfer.hpp"
#include "peerdrop/protocol/transfer_config.hpp"
#include "peerdrop/session/flow_controller.hpp"

namespace peerdrop {
namespace session {

/**
 * Send loop for one outbound file: file-meta, then one chunk per step of
 * the io_context with a backpressure check before each, then file-complete.
 */
class FileSender : public std::enable_shared_from_this<FileSender> {
public:
    using ProgressHandler = std::function<void(const protocol::FileTransfer&)>;
    using CompletionHandler = std::function<void(const boost::system::error_code&, const std::string&)>;

    FileSender(boost::asio::io_context& io,
               std::shared_ptr<network::DataChannel> channel,
               std::shared_ptr<FlowController> flow,
               const std::optional<crypto::SymmetricKey>& key,
               protocol::TransferConfig config,
               std::string id,
               protocol::OutgoingFile file,
               ProgressHandler on_progress,
               CompletionHandler on_complete);

    void start();
    // Completes the transfer with ec from the io_context; later steps are skipped
    void abort(const boost::system::error_code& ec);

    const std::string& id() const { return id_; }
    bool finished() const { return finished_; }

private:
    void send_meta();
    void step();
    void send_chunk();
    void succeed();
    void fail(const boost::system::error_code& ec, const std::string& reason);
    void report(protocol::TransferStatus status, int progress, const std::string& error = {});
    void schedule_step();

    boost::asio::io_context& io_;
    std::shared_ptr<network::DataChannel> channel_;
    std::shared_ptr<FlowController> flow_;
    std::unique_ptr<crypto::AeadCipher> cipher_;
    protocol::TransferConfig config_;
    std::string id_;
    protocol::OutgoingFile file_;
    ProgressHandler on_progress_;
    CompletionHandler on_complete_;

    std::size_t offset_{0};
    std::size_t chunks_sent_{0};
    bool finished_{false};
    bool aborted_{false};
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_FILE_SENDER_HPP
