#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include "peerdrop/crypto/base64.hpp"
#include "peerdrop/network/loopback_transport.hpp"
#include "peerdrop/protocol/signaling.hpp"
#include "peerdrop/session/peer_session.hpp"
#include "test_utils.hpp"

namespace peerdrop {
namespace session {
namespace test {

using namespace std::chrono_literals;
using peerdrop::test::run_until;
using Blobs = PeerSession::HandshakeBlobs;

class PeerSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        create_peers(network::LoopbackOptions{});
    }

    void create_peers(network::LoopbackOptions link, SessionOptions options = {}) {
        subscriptions_.clear();
        alice_.reset();
        bob_.reset();
        hub_ = network::LoopbackHub::create(io_, std::move(link));
        alice_ = PeerSession::create(io_, hub_->factory(), options);
        bob_ = PeerSession::create(io_, hub_->factory(), options);
        watch(*alice_, alice_files_, alice_events_);
        watch(*bob_, bob_files_, bob_events_);
    }

    void watch(PeerSession& peer, std::vector<protocol::FileTransfer>& files, std::vector<ControlEvent>& events) {
        subscriptions_.emplace_back(peer.events().on_file([&files](const protocol::FileTransfer& transfer) {
            files.push_back(transfer);
        }));
        subscriptions_.emplace_back(peer.events().on_message([&events](const ControlEvent& event) {
            events.push_back(event);
        }));
    }

    std::optional<Blobs> make_offer() {
        std::optional<Blobs> offer;
        alice_->create_offer([&](const boost::system::error_code& ec, Blobs blobs) {
            EXPECT_FALSE(ec) << ec.message();
            if (!ec) offer = std::move(blobs);
        });
        run_until(io_, [&]() { return offer.has_value(); });
        return offer;
    }

    std::optional<Blobs> make_answer(const Blobs& offer) {
        std::optional<Blobs> answer;
        bob_->handle_offer(offer.description, offer.public_key, [&](const boost::system::error_code& ec, Blobs blobs) {
            EXPECT_FALSE(ec) << ec.message();
            if (!ec) answer = std::move(blobs);
        });
        run_until(io_, [&]() { return answer.has_value(); });
        return answer;
    }

    void connect() {
        auto offer = make_offer();
        ASSERT_TRUE(offer.has_value());
        auto answer = make_answer(*offer);
        ASSERT_TRUE(answer.has_value());
        ASSERT_FALSE(alice_->handle_answer(answer->description, answer->public_key));
        ASSERT_TRUE(run_until(io_, [this]() { return alice_->is_connected() && bob_->is_connected(); }));
    }

    static std::optional<protocol::FileTransfer> final_report(const std::vector<protocol::FileTransfer>& files,
                                                              const std::string& id) {
        for (const auto& transfer : files) {
            if (transfer.id == id && (transfer.status == protocol::TransferStatus::COMPLETED ||
                                      transfer.status == protocol::TransferStatus::ERROR)) {
                return transfer;
            }
        }
        return std::nullopt;
    }

    // Sends from alice and waits for bob's final report
    std::optional<protocol::FileTransfer> transfer(std::vector<uint8_t> data, const std::string& name = "data.bin") {
        const std::string id = alice_->send_file({name, "application/octet-stream", std::move(data)}, nullptr);
        if (id.empty()) {
            return std::nullopt;
        }
        run_until(io_, [&]() { return final_report(bob_files_, id).has_value(); });
        return final_report(bob_files_, id);
    }

    boost::asio::io_context io_;
    std::shared_ptr<network::LoopbackHub> hub_;
    std::shared_ptr<PeerSession> alice_;
    std::shared_ptr<PeerSession> bob_;
    std::vector<boost::signals2::scoped_connection> subscriptions_;
    std::vector<protocol::FileTransfer> alice_files_;
    std::vector<protocol::FileTransfer> bob_files_;
    std::vector<ControlEvent> alice_events_;
    std::vector<ControlEvent> bob_events_;
};

//==============================================
// HANDSHAKE
//==============================================

TEST_F(PeerSessionTest, HandshakeOpensEncryptedChannel) {
    EXPECT_EQ(alice_->state(), SessionState::State::IDLE);
    ASSERT_NO_FATAL_FAILURE(connect());

    EXPECT_EQ(alice_->state(), SessionState::State::OPEN);
    EXPECT_EQ(bob_->state(), SessionState::State::OPEN);
    EXPECT_EQ(alice_->role(), PeerSession::Role::OFFERER);
    EXPECT_EQ(bob_->role(), PeerSession::Role::ANSWERER);
    EXPECT_TRUE(alice_->is_encryption_enabled());
    EXPECT_TRUE(bob_->is_encryption_enabled());

    auto opened = [](const std::vector<ControlEvent>& events) {
        int count = 0;
        for (const auto& event : events) {
            if (event.kind == ControlEvent::Kind::CHANNEL_OPEN) ++count;
        }
        return count;
    };
    EXPECT_EQ(opened(alice_events_), 1);
    EXPECT_EQ(opened(bob_events_), 1);
}

TEST_F(PeerSessionTest, OfferWaitsForGatheredCandidates) {
    auto offer = make_offer();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(alice_->state(), SessionState::State::OFFER_CREATED);
    EXPECT_FALSE(alice_->is_encryption_enabled());

    auto description = protocol::decode_description(offer->description);
    EXPECT_EQ(description.type, "offer");
    EXPECT_THAT(description.sdp, ::testing::HasSubstr("a=candidate:"));
}

TEST_F(PeerSessionTest, GatheringTimeoutUsesPartialCandidates) {
    network::LoopbackOptions link;
    link.complete_ice_gathering = false;
    SessionOptions options;
    options.ice_gathering_timeout = 50ms;
    create_peers(link, options);

    auto offer = make_offer();
    ASSERT_TRUE(offer.has_value());
    auto description = protocol::decode_description(offer->description);
    EXPECT_THAT(description.sdp, ::testing::Not(::testing::HasSubstr("a=candidate:")));
}

TEST_F(PeerSessionTest, AnswererIsKeyedBeforeChannelOpens) {
    auto offer = make_offer();
    ASSERT_TRUE(offer.has_value());
    auto answer = make_answer(*offer);
    ASSERT_TRUE(answer.has_value());

    EXPECT_EQ(bob_->state(), SessionState::State::KEYED_AWAITING_OPEN);
    EXPECT_TRUE(bob_->is_encryption_enabled());
    EXPECT_FALSE(bob_->is_connected());
}

TEST_F(PeerSessionTest, MalformedOfferLeavesSessionRetryable) {
    boost::system::error_code result;
    bob_->handle_offer("not-a-blob!", "also-bad", [&](const boost::system::error_code& ec, Blobs) { result = ec; });
    peerdrop::test::run_all(io_);
    EXPECT_EQ(result, network::make_error_code(network::NetworkError::INVALID_DESCRIPTION));
    EXPECT_EQ(bob_->state(), SessionState::State::IDLE);

    auto offer = make_offer();
    ASSERT_TRUE(offer.has_value());

    bob_->handle_offer(offer->description, crypto::base64_encode(std::string("{}")),
                       [&](const boost::system::error_code& ec, Blobs) { result = ec; });
    peerdrop::test::run_all(io_);
    EXPECT_EQ(result, network::make_error_code(network::NetworkError::KEY_FORMAT));
    EXPECT_EQ(bob_->state(), SessionState::State::IDLE);
    EXPECT_FALSE(bob_->is_encryption_enabled());

    auto answer = make_answer(*offer);
    ASSERT_TRUE(answer.has_value());
    ASSERT_FALSE(alice_->handle_answer(answer->description, answer->public_key));
    EXPECT_TRUE(run_until(io_, [this]() { return alice_->is_connected() && bob_->is_connected(); }));
}

TEST_F(PeerSessionTest, MalformedAnswerLeavesSessionRetryable) {
    auto offer = make_offer();
    ASSERT_TRUE(offer.has_value());
    auto answer = make_answer(*offer);
    ASSERT_TRUE(answer.has_value());

    EXPECT_EQ(alice_->handle_answer("####", answer->public_key),
              network::make_error_code(network::NetworkError::INVALID_DESCRIPTION));
    // An offer is not an answer
    EXPECT_EQ(alice_->handle_answer(offer->description, answer->public_key),
              network::make_error_code(network::NetworkError::INVALID_DESCRIPTION));
    EXPECT_EQ(alice_->handle_answer(answer->description, "bm90IGEga2V5"),
              network::make_error_code(network::NetworkError::KEY_FORMAT));
    EXPECT_EQ(alice_->state(), SessionState::State::OFFER_CREATED);
    EXPECT_FALSE(alice_->is_encryption_enabled());

    ASSERT_FALSE(alice_->handle_answer(answer->description, answer->public_key));
    EXPECT_TRUE(run_until(io_, [this]() { return alice_->is_connected() && bob_->is_connected(); }));
}

TEST_F(PeerSessionTest, HandshakeStepsOutOfOrderAreRejected) {
    EXPECT_EQ(alice_->handle_answer("x", "y"), network::make_error_code(network::NetworkError::INVALID_STATE));

    auto offer = make_offer();
    ASSERT_TRUE(offer.has_value());

    boost::system::error_code result;
    alice_->create_offer([&](const boost::system::error_code& ec, Blobs) { result = ec; });
    peerdrop::test::run_all(io_);
    EXPECT_EQ(result, network::make_error_code(network::NetworkError::INVALID_STATE));
}

TEST_F(PeerSessionTest, DisconnectDuringGatheringAbortsOffer) {
    network::LoopbackOptions link;
    link.complete_ice_gathering = false;
    create_peers(link);

    bool called = false;
    boost::system::error_code result;
    alice_->create_offer([&](const boost::system::error_code& ec, Blobs) {
        called = true;
        result = ec;
    });
    alice_->disconnect();
    peerdrop::test::run_all(io_);

    ASSERT_TRUE(called);
    EXPECT_EQ(result, boost::asio::error::operation_aborted);
    EXPECT_EQ(alice_->state(), SessionState::State::CLOSED);
}

//==============================================
// TRANSFER
//==============================================

TEST_F(PeerSessionTest, MegabyteArrivesIntact) {
    ASSERT_NO_FATAL_FAILURE(connect());
    auto data = peerdrop::test::random_bytes(1024 * 1024);

    auto received = transfer(data, "big.bin");
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, protocol::TransferStatus::COMPLETED);
    EXPECT_EQ(received->name, "big.bin");
    EXPECT_EQ(received->mime_type, "application/octet-stream");
    EXPECT_EQ(received->size, data.size());
    ASSERT_TRUE(received->payload.has_value());
    EXPECT_EQ(*received->payload, data);

    // One report at meta, one per 16 KiB chunk, one at completion
    EXPECT_EQ(bob_files_.size(), 1u + 64u + 1u);
    for (std::size_t i = 1; i < bob_files_.size(); ++i) {
        EXPECT_GE(bob_files_[i].progress, bob_files_[i - 1].progress);
    }

    ASSERT_FALSE(alice_files_.empty());
    EXPECT_EQ(alice_files_.front().status, protocol::TransferStatus::PENDING);
    EXPECT_EQ(alice_files_.back().status, protocol::TransferStatus::COMPLETED);
    EXPECT_EQ(alice_->active_transfers(), 0u);
    EXPECT_EQ(bob_->inbound_transfers(), 0u);
}

TEST_F(PeerSessionTest, TransfersFlowBothWays) {
    ASSERT_NO_FATAL_FAILURE(connect());
    auto data = peerdrop::test::random_bytes(50000, 7);

    const std::string id = bob_->send_file({"reply.txt", "text/plain", data}, nullptr);
    ASSERT_FALSE(id.empty());
    ASSERT_TRUE(run_until(io_, [&]() { return final_report(alice_files_, id).has_value(); }));

    auto received = final_report(alice_files_, id);
    EXPECT_EQ(received->status, protocol::TransferStatus::COMPLETED);
    EXPECT_EQ(received->name, "reply.txt");
    EXPECT_EQ(*received->payload, data);
}

TEST_F(PeerSessionTest, ConcurrentTransfersStayIsolated) {
    ASSERT_NO_FATAL_FAILURE(connect());
    auto first = peerdrop::test::random_bytes(200000, 1);
    auto second = peerdrop::test::random_bytes(90000, 2);

    std::map<std::string, boost::system::error_code> outcomes;
    auto record = [&](const boost::system::error_code& ec, const std::string& id) { outcomes[id] = ec; };
    const std::string a = alice_->send_file({"a.bin", "application/octet-stream", first}, record);
    const std::string b = alice_->send_file({"b.bin", "application/octet-stream", second}, record);
    ASSERT_NE(a, b);
    EXPECT_EQ(alice_->active_transfers(), 2u);

    ASSERT_TRUE(run_until(io_, [&]() {
        return final_report(bob_files_, a).has_value() && final_report(bob_files_, b).has_value();
    }));
    EXPECT_EQ(*final_report(bob_files_, a)->payload, first);
    EXPECT_EQ(*final_report(bob_files_, b)->payload, second);
    EXPECT_FALSE(outcomes[a]);
    EXPECT_FALSE(outcomes[b]);
}

TEST_F(PeerSessionTest, EmptyFileCompletes) {
    ASSERT_NO_FATAL_FAILURE(connect());
    auto received = transfer({}, "empty.txt");
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, protocol::TransferStatus::COMPLETED);
    EXPECT_TRUE(received->payload->empty());
}

TEST_F(PeerSessionTest, ThrottledLinkStillDeliversEverything) {
    network::LoopbackOptions link;
    link.bytes_per_second = 4 * 1024 * 1024;
    link.latency = 2ms;
    create_peers(link);
    ASSERT_NO_FATAL_FAILURE(connect());

    auto data = peerdrop::test::random_bytes(512 * 1024, 3);
    auto received = transfer(data);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received->payload, data);
}

TEST_F(PeerSessionTest, NotReadyBeforeHandshake) {
    boost::system::error_code send_result;
    const std::string id = alice_->send_file({"x", "text/plain", {1, 2, 3}},
                                             [&](const boost::system::error_code& ec, const std::string&) {
        send_result = ec;
    });
    EXPECT_TRUE(id.empty());

    boost::system::error_code calibrate_result;
    alice_->calibrate([&](const boost::system::error_code& ec, const CalibrationResult&) { calibrate_result = ec; });

    peerdrop::test::run_all(io_);
    EXPECT_EQ(send_result, network::make_error_code(network::NetworkError::CHANNEL_NOT_READY));
    EXPECT_EQ(calibrate_result, network::make_error_code(network::NetworkError::CHANNEL_NOT_READY));
    EXPECT_EQ(alice_->state(), SessionState::State::IDLE);
}

//==============================================
// CALIBRATION
//==============================================

TEST_F(PeerSessionTest, CalibrationRetunesTransfers) {
    network::LoopbackOptions link;
    link.latency = 1ms;
    link.bytes_per_second = 32 * 1024 * 1024;
    create_peers(link);
    ASSERT_NO_FATAL_FAILURE(connect());

    std::optional<CalibrationResult> published;
    subscriptions_.emplace_back(alice_->events().on_calibration([&](const CalibrationResult& result) {
        published = result;
    }));

    std::optional<CalibrationResult> result;
    boost::system::error_code result_ec;
    alice_->calibrate([&](const boost::system::error_code& ec, const CalibrationResult& r) {
        result_ec = ec;
        result = r;
    });
    ASSERT_TRUE(run_until(io_, [&]() { return result.has_value(); }));

    EXPECT_FALSE(result_ec);
    EXPECT_EQ(result->probes.size(), 5u);
    EXPECT_TRUE(result->config.is_calibrated);
    EXPECT_GT(result->config.effective_bandwidth, 0.0);
    EXPECT_EQ(result->config.buffer_threshold, 4 * result->config.chunk_size);
    EXPECT_EQ(result->config.max_message_size, 256u * 1024u);
    ASSERT_TRUE(result->stats.rtt_ms.has_value());
    EXPECT_DOUBLE_EQ(*result->stats.rtt_ms, 2.0);
    EXPECT_EQ(result->stats.connection_type, "direct");

    EXPECT_EQ(alice_->transfer_config(), result->config);
    ASSERT_TRUE(published.has_value());
    EXPECT_EQ(published->config, result->config);

    // Probe payloads never surface as transfers
    EXPECT_TRUE(bob_files_.empty());
    EXPECT_EQ(bob_->inbound_transfers(), 0u);

    auto data = peerdrop::test::random_bytes(300000, 9);
    auto received = transfer(data);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received->payload, data);
}

TEST_F(PeerSessionTest, SecondCalibrationWhileRunningRejected) {
    ASSERT_NO_FATAL_FAILURE(connect());

    bool first_done = false;
    alice_->calibrate([&](const boost::system::error_code&, const CalibrationResult&) { first_done = true; });

    boost::system::error_code second;
    alice_->calibrate([&](const boost::system::error_code& ec, const CalibrationResult&) { second = ec; });

    ASSERT_TRUE(run_until(io_, [&]() { return first_done; }));
    EXPECT_EQ(second, network::make_error_code(network::NetworkError::INVALID_STATE));
}

//==============================================
// CONNECTION EVENTS AND TEARDOWN
//==============================================

TEST_F(PeerSessionTest, DegradedConnectionReported) {
    SessionOptions options;
    options.restart_ice_on_failure = true;
    create_peers(network::LoopbackOptions{}, options);
    ASSERT_NO_FATAL_FAILURE(connect());
    peerdrop::test::run_all(io_);
    alice_events_.clear();

    auto transport = hub_->find("lb-1");
    ASSERT_NE(transport, nullptr);
    transport->inject_connection_state(network::ConnectionStatus::DISCONNECTED);

    ASSERT_TRUE(run_until(io_, [this]() { return alice_events_.size() >= 2; }));
    EXPECT_EQ(alice_events_[0].kind, ControlEvent::Kind::CONNECTION_STATE);
    EXPECT_EQ(alice_events_[0].connection_status, network::ConnectionStatus::DISCONNECTED);
    EXPECT_EQ(alice_events_[0].error, network::make_error_code(network::NetworkError::CONNECTION_DEGRADED));
    // The restart brings the link back
    EXPECT_EQ(alice_events_[1].connection_status, network::ConnectionStatus::CONNECTED);
    EXPECT_FALSE(alice_events_[1].error);
    EXPECT_TRUE(alice_->is_connected());
}

TEST_F(PeerSessionTest, DisconnectAbortsTransfersAndClosesPeer) {
    network::LoopbackOptions link;
    link.bytes_per_second = 1024 * 1024;
    create_peers(link);
    ASSERT_NO_FATAL_FAILURE(connect());

    bool completed = false;
    boost::system::error_code result;
    const std::string id = alice_->send_file({"slow.bin", "application/octet-stream",
                                              peerdrop::test::random_bytes(1024 * 1024)},
                                             [&](const boost::system::error_code& ec, const std::string&) {
        completed = true;
        result = ec;
    });
    ASSERT_FALSE(id.empty());
    ASSERT_TRUE(run_until(io_, [&]() { return bob_->inbound_transfers() == 1 && bob_files_.size() > 3; }));

    alice_->disconnect();
    ASSERT_TRUE(run_until(io_, [&]() { return completed && bob_->state() == SessionState::State::CLOSED; }));

    EXPECT_EQ(result, boost::asio::error::operation_aborted);
    EXPECT_EQ(alice_->state(), SessionState::State::CLOSED);
    EXPECT_FALSE(alice_->is_connected());
    EXPECT_FALSE(alice_->is_encryption_enabled());
    EXPECT_EQ(alice_->active_transfers(), 0u);
    EXPECT_EQ(alice_->transfer_config(), protocol::TransferConfig::defaults());

    EXPECT_FALSE(bob_->is_encryption_enabled());
    EXPECT_EQ(bob_->inbound_transfers(), 0u);
    EXPECT_FALSE(final_report(bob_files_, id).has_value());
    bool saw_close = false;
    for (const auto& event : bob_events_) {
        saw_close = saw_close || event.kind == ControlEvent::Kind::CHANNEL_CLOSE;
    }
    EXPECT_TRUE(saw_close);

    // Closed is final
    EXPECT_TRUE(alice_->send_file({"late", "text/plain", {1}}, nullptr).empty());
    alice_->disconnect();
    EXPECT_EQ(alice_->state(), SessionState::State::CLOSED);
}

} // namespace test
} // namespace session
} // namespace peerdrop
