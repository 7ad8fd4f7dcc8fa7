#ifndef PEERDROP_CLI_HPP
#define PEERDROP_CLI_HPP

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/signals2/connection.hpp>
#include "peerdrop/network/loopback_transport.hpp"
#include "peerdrop/session/peer_session.hpp"

namespace peerdrop {
namespace cli {

/**
 * Interactive shell hosting two local peers joined by the loopback
 * transport. "alice" offers and sends; "bob" answers and receives.
 */
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(network::LoopbackOptions link_options,
        session::SessionOptions session_options,
        std::istream& in = std::cin,
        std::ostream& out = std::cout);
    ~CLI();


    // ---- STARTUP ----
    void run();
    // Returns false once the shell should exit
    bool process_command(const std::string& line);

private:
    // ---- PARAMETERS ----
    boost::asio::io_context io_;
    network::LoopbackOptions link_options_;
    session::SessionOptions session_options_;
    std::istream& in_;
    std::ostream& out_;

    // ---- PEERS ----
    std::shared_ptr<network::LoopbackHub> hub_;
    std::shared_ptr<session::PeerSession> alice_;
    std::shared_ptr<session::PeerSession> bob_;
    std::vector<boost::signals2::scoped_connection> subscriptions_;
    // Source bytes of outbound files, for verifying what bob receives
    std::map<std::string, std::vector<uint8_t>> sent_files_;


    // ---- COMMAND PROCESSING ----
    void handle_connect_command();
    void handle_calibrate_command();
    void handle_send_command(const std::string& filename);
    void handle_status_command();
    void handle_disconnect_command();
    void handle_help_command();
    void subscribe(const std::string& name, session::PeerSession& session);
    void print_status(const std::string& name, const session::PeerSession& session);
    void log_and_display_error(const std::string& message, const std::string& error);
    void pump();
    bool connected() const;
};

std::string guess_mime_type(const std::string& filename);

} // namespace cli
} // namespace peerdrop

#endif // PEERDROP_CLI_HPP
