#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "peerdrop/protocol/reassembler.hpp"

namespace peerdrop {
namespace protocol {
namespace test {

class ReassemblerTest : public ::testing::Test {
protected:
    InboundMeta meta(const std::string& id, uint64_t size) {
        return InboundMeta{id, id + ".bin", size, "application/octet-stream"};
    }

    Reassembler reassembler_;
};

TEST_F(ReassemblerTest, BeginReportsTransferring) {
    auto report = reassembler_.begin(meta("a", 10));
    EXPECT_EQ(report.id, "a");
    EXPECT_EQ(report.name, "a.bin");
    EXPECT_EQ(report.status, TransferStatus::TRANSFERRING);
    EXPECT_EQ(report.direction, TransferDirection::INBOUND);
    EXPECT_EQ(report.progress, 0);
    EXPECT_FALSE(report.payload.has_value());
    EXPECT_TRUE(reassembler_.contains("a"));
    EXPECT_EQ(reassembler_.size(), 1u);
}

TEST_F(ReassemblerTest, ConcatenatesInArrivalOrder) {
    reassembler_.begin(meta("a", 6));

    auto first = reassembler_.append("a", {1, 2, 3, 4});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->progress, 67);

    auto second = reassembler_.append("a", {5, 6});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->progress, 100);

    auto done = reassembler_.complete("a");
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->status, TransferStatus::COMPLETED);
    EXPECT_EQ(done->progress, 100);
    ASSERT_TRUE(done->payload.has_value());
    EXPECT_EQ(*done->payload, std::vector<uint8_t>({1, 2, 3, 4, 5, 6}));
    EXPECT_FALSE(reassembler_.contains("a"));
    EXPECT_EQ(reassembler_.size(), 0u);
}

TEST_F(ReassemblerTest, UnknownIdsAreIgnored) {
    EXPECT_FALSE(reassembler_.append("ghost", {1}).has_value());
    EXPECT_FALSE(reassembler_.mark_corrupted("ghost"));
    EXPECT_FALSE(reassembler_.complete("ghost").has_value());
    EXPECT_EQ(reassembler_.size(), 0u);
}

TEST_F(ReassemblerTest, TransfersStayIsolated) {
    reassembler_.begin(meta("a", 2));
    reassembler_.begin(meta("b", 2));

    reassembler_.append("a", {0xa1});
    reassembler_.append("b", {0xb1});
    reassembler_.append("b", {0xb2});
    reassembler_.append("a", {0xa2});

    auto b = reassembler_.complete("b");
    ASSERT_TRUE(b && b->payload);
    EXPECT_EQ(*b->payload, std::vector<uint8_t>({0xb1, 0xb2}));
    EXPECT_TRUE(reassembler_.contains("a"));

    auto a = reassembler_.complete("a");
    ASSERT_TRUE(a && a->payload);
    EXPECT_EQ(*a->payload, std::vector<uint8_t>({0xa1, 0xa2}));
}

TEST_F(ReassemblerTest, CorruptedChunkFailsTheTransfer) {
    reassembler_.begin(meta("a", 4));
    reassembler_.append("a", {1, 2});
    EXPECT_TRUE(reassembler_.mark_corrupted("a"));
    reassembler_.append("a", {3, 4});

    auto result = reassembler_.complete("a");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, TransferStatus::ERROR);
    EXPECT_FALSE(result->payload.has_value());
    EXPECT_FALSE(result->error.empty());
    EXPECT_FALSE(reassembler_.contains("a"));
}

TEST_F(ReassemblerTest, ShortTransferFails) {
    reassembler_.begin(meta("a", 10));
    reassembler_.append("a", {1, 2, 3});

    auto result = reassembler_.complete("a");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, TransferStatus::ERROR);
    EXPECT_EQ(result->progress, 30);
}

TEST_F(ReassemblerTest, DataBeyondDeclaredSizeIsNotBuffered) {
    reassembler_.begin(meta("a", 4));
    ASSERT_TRUE(reassembler_.append("a", {1, 2, 3}).has_value());

    const std::vector<uint8_t> large(1024 * 1024, 0x5a);
    for (int i = 0; i < 8; ++i) {
        EXPECT_FALSE(reassembler_.append("a", large).has_value());
    }
    // Still within the declared size, but the transfer is already spoiled
    EXPECT_TRUE(reassembler_.append("a", {4}).has_value());

    auto result = reassembler_.complete("a");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, TransferStatus::ERROR);
    EXPECT_EQ(result->progress, 100);
    EXPECT_FALSE(result->payload.has_value());
    EXPECT_NE(result->error.find("declared"), std::string::npos);
}

TEST_F(ReassemblerTest, ChunkAfterFullSizeFailsTransfer) {
    reassembler_.begin(meta("a", 4));
    ASSERT_TRUE(reassembler_.append("a", {1, 2}).has_value());
    ASSERT_TRUE(reassembler_.append("a", {3, 4}).has_value());
    EXPECT_FALSE(reassembler_.append("a", {5}).has_value());

    auto result = reassembler_.complete("a");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, TransferStatus::ERROR);
}

TEST_F(ReassemblerTest, EmptyFileCompletes) {
    reassembler_.begin(meta("empty", 0));
    auto result = reassembler_.complete("empty");
    ASSERT_TRUE(result && result->payload);
    EXPECT_EQ(result->status, TransferStatus::COMPLETED);
    EXPECT_TRUE(result->payload->empty());
}

TEST_F(ReassemblerTest, RepeatedMetaRestartsTransfer) {
    reassembler_.begin(meta("a", 2));
    reassembler_.append("a", {9});
    reassembler_.begin(meta("a", 2));
    reassembler_.append("a", {1, 2});

    auto result = reassembler_.complete("a");
    ASSERT_TRUE(result && result->payload);
    EXPECT_EQ(*result->payload, std::vector<uint8_t>({1, 2}));
}

TEST_F(ReassemblerTest, ClearDropsEverything) {
    reassembler_.begin(meta("a", 2));
    reassembler_.begin(meta("b", 2));
    reassembler_.clear();
    EXPECT_EQ(reassembler_.size(), 0u);
    EXPECT_FALSE(reassembler_.append("a", {1}).has_value());
}

} // namespace test
} // namespace protocol
} // namespace peerdrop
