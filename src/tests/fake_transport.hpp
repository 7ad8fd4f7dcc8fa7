#ifndef PEERDROP_TEST_FAKE_TRANSPORT_HPP
#define PEERDROP_TEST_FAKE_TRANSPORT_HPP

#include <memory>
#include <string>
#include <vector>
#include "peerdrop/network/transport.hpp"

namespace peerdrop {
namespace test {

// Records everything sent; the buffered amount and state are set by the test.
// Handlers are invoked through copies, as a real channel must.
class FakeDataChannel : public network::DataChannel {
public:
    explicit FakeDataChannel(std::string label = "fileTransfer") : label_(std::move(label)) {}

    void set_handlers(Handlers handlers) override { handlers_ = std::move(handlers); }

    void send_binary(const network::Bytes& data) override {
        if (state_ != network::ChannelState::OPEN || fail_sends) {
            throw network::TransportError("channel not open");
        }
        binary.push_back(data);
        buffered += data.size() * buffer_growth;
    }

    void send_text(const std::string& text) override {
        if (state_ != network::ChannelState::OPEN || fail_sends) {
            throw network::TransportError("channel not open");
        }
        texts.push_back(text);
    }

    void close() override {
        state_ = network::ChannelState::CLOSED;
        ++close_calls;
    }

    network::ChannelState state() const override { return state_; }
    std::size_t buffered_amount() const override { return buffered; }
    std::size_t buffered_amount_low_threshold() const override { return low_threshold; }
    void set_buffered_amount_low_threshold(std::size_t threshold) override { low_threshold = threshold; }
    const std::string& label() const override { return label_; }

    // ---- TEST CONTROLS ----
    void open() {
        state_ = network::ChannelState::OPEN;
        auto handler = handlers_.on_open;
        if (handler) handler();
    }

    void drain(std::size_t remaining = 0) {
        buffered = remaining;
        auto handler = handlers_.on_buffered_amount_low;
        if (handler) handler();
    }

    void deliver_text(const std::string& text) {
        auto handler = handlers_.on_text;
        if (handler) handler(text);
    }

    void deliver_binary(const network::Bytes& data) {
        auto handler = handlers_.on_binary;
        if (handler) handler(data);
    }

    void remote_close() {
        state_ = network::ChannelState::CLOSED;
        auto handler = handlers_.on_close;
        if (handler) handler();
    }

    const Handlers& handlers() const { return handlers_; }

    std::vector<network::Bytes> binary;
    std::vector<std::string> texts;
    std::size_t buffered{0};
    // 0 keeps the buffered amount fixed while sending
    std::size_t buffer_growth{0};
    std::size_t low_threshold{0};
    bool fail_sends{false};
    int close_calls{0};

private:
    std::string label_;
    network::ChannelState state_{network::ChannelState::CONNECTING};
    Handlers handlers_;
};

// Negotiation is scripted: gathering completes only when the test says so
class FakeTransport : public network::PeerTransport {
public:
    void set_handlers(Handlers handlers) override { handlers_ = std::move(handlers); }

    std::shared_ptr<network::DataChannel> create_data_channel(const std::string& label, bool) override {
        channel = std::make_shared<FakeDataChannel>(label);
        return channel;
    }

    network::SessionDescription create_local_offer() override { return {"offer", "v=0\r\na=fake\r\n"}; }
    network::SessionDescription create_local_answer() override { return {"answer", "v=0\r\na=fake\r\n"}; }

    void set_local_description(const network::SessionDescription& description) override {
        local_ = description;
        gathering = network::IceGatheringState::GATHERING;
    }

    std::optional<network::SessionDescription> local_description() const override {
        if (!local_) {
            return std::nullopt;
        }
        auto description = *local_;
        if (gathering == network::IceGatheringState::COMPLETE) {
            description.sdp += "a=candidate:1 1 udp 1 127.0.0.1 9 typ host\r\n";
        }
        return description;
    }

    void apply_remote_description(const network::SessionDescription& description) override {
        if (reject_remote) {
            throw network::TransportError("remote description rejected");
        }
        remote = description;
    }

    network::IceGatheringState ice_gathering_state() const override { return gathering; }
    network::TransportStats stats() const override { return network::TransportStats{12.5, "host", "host", "direct"}; }
    void restart_ice() override { ++restarts; }
    void close() override { ++close_calls; }

    // ---- TEST CONTROLS ----
    void complete_gathering() {
        gathering = network::IceGatheringState::COMPLETE;
        auto handler = handlers_.on_ice_gathering_state;
        if (handler) handler(gathering);
    }

    void report(network::ConnectionStatus status) {
        auto handler = handlers_.on_connection_state;
        if (handler) handler(status);
    }

    void announce_channel(std::shared_ptr<FakeDataChannel> incoming) {
        channel = incoming;
        auto handler = handlers_.on_data_channel;
        if (handler) handler(std::move(incoming));
    }

    std::shared_ptr<FakeDataChannel> channel;
    std::optional<network::SessionDescription> remote;
    network::IceGatheringState gathering{network::IceGatheringState::NEW};
    bool reject_remote{false};
    int restarts{0};
    int close_calls{0};

private:
    Handlers handlers_;
    std::optional<network::SessionDescription> local_;
};

} // namespace test
} // namespace peerdrop

#endif // PEERDROP_TEST_FAKE_TRANSPORT_HPP
