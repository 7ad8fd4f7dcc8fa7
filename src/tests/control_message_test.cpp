#include <gtest/gtest.h>
#include <string>
#include <nlohmann/json.hpp>
#include "peerdrop/protocol/control_message.hpp"
#include "peerdrop/protocol/signaling.hpp"
#include "peerdrop/crypto/base64.hpp"

using namespace peerdrop::protocol;
using json = nlohmann::json;

TEST(ControlMessageTest, FileMetaWireFields) {
    FileMeta meta{"t-1", "bmFtZQ==", 1048576, "dHlwZQ==", true};
    auto value = json::parse(encode_control_message(meta));

    EXPECT_EQ(value["type"], "file-meta");
    EXPECT_EQ(value["id"], "t-1");
    EXPECT_EQ(value["name"], "bmFtZQ==");
    EXPECT_EQ(value["size"], 1048576);
    EXPECT_EQ(value["fileType"], "dHlwZQ==");
    EXPECT_EQ(value["encrypted"], true);
}

TEST(ControlMessageTest, DecodesEachKnownType) {
    auto meta = decode_control_message(
        R"({"type":"file-meta","id":"a","name":"x.txt","size":3,"fileType":"text/plain"})");
    ASSERT_TRUE(std::holds_alternative<FileMeta>(meta));
    EXPECT_EQ(std::get<FileMeta>(meta).size, 3u);
    EXPECT_FALSE(std::get<FileMeta>(meta).encrypted);

    auto complete = decode_control_message(R"({"type":"file-complete","id":"a"})");
    ASSERT_TRUE(std::holds_alternative<FileComplete>(complete));
    EXPECT_EQ(std::get<FileComplete>(complete).id, "a");

    auto ping = decode_control_message(R"({"type":"calibration-ping","id":"calibration-1","size":16384})");
    ASSERT_TRUE(std::holds_alternative<CalibrationPing>(ping));
    EXPECT_EQ(std::get<CalibrationPing>(ping).size, 16384u);

    auto pong = decode_control_message(encode_control_message(CalibrationPong{"calibration-1", 32768}));
    ASSERT_TRUE(std::holds_alternative<CalibrationPong>(pong));
    EXPECT_EQ(std::get<CalibrationPong>(pong).id, "calibration-1");
    EXPECT_EQ(std::get<CalibrationPong>(pong).size, 32768u);
}

TEST(ControlMessageTest, UnknownTypesPassThrough) {
    auto other = decode_control_message(R"({"type":"chat","text":"hi"})");
    ASSERT_TRUE(std::holds_alternative<OtherMessage>(other));
    EXPECT_EQ(std::get<OtherMessage>(other).raw["text"], "hi");

    EXPECT_TRUE(std::holds_alternative<OtherMessage>(decode_control_message(R"({"hello":1})")));
    EXPECT_TRUE(std::holds_alternative<OtherMessage>(decode_control_message(R"({"type":7})")));
    EXPECT_TRUE(std::holds_alternative<OtherMessage>(decode_control_message("[1,2]")));

    OtherMessage message{json{{"type", "chat"}, {"text", "hi"}}};
    EXPECT_EQ(json::parse(encode_control_message(message)), message.raw);
}

TEST(ControlMessageTest, RejectsMalformedKnownTypes) {
    EXPECT_THROW(decode_control_message("{not json"), ProtocolError);
    EXPECT_THROW(decode_control_message(R"({"type":"file-complete"})"), ProtocolError);
    EXPECT_THROW(decode_control_message(R"({"type":"file-meta","id":"a","name":"n","size":-1,"fileType":"t"})"),
                 ProtocolError);
    EXPECT_THROW(decode_control_message(R"({"type":"file-meta","id":"a","name":"n","size":"3","fileType":"t"})"),
                 ProtocolError);
    EXPECT_THROW(decode_control_message(
                     R"({"type":"file-meta","id":"a","name":"n","size":3,"fileType":"t","encrypted":"yes"})"),
                 ProtocolError);
    EXPECT_THROW(decode_control_message(R"({"type":"calibration-ping","id":"c"})"), ProtocolError);
}

TEST(SignalingTest, DescriptionBlobCarriesTypeAndSdp) {
    peerdrop::network::SessionDescription offer{"offer", "v=0\r\no=- 1 2 IN IP4 127.0.0.1\r\n"};
    const std::string blob = encode_description(offer);

    auto value = json::parse(peerdrop::crypto::base64_decode_to_string(blob));
    EXPECT_EQ(value["type"], "offer");
    EXPECT_EQ(value["sdp"], offer.sdp);

    auto decoded = decode_description(blob);
    EXPECT_EQ(decoded.type, "offer");
    EXPECT_EQ(decoded.sdp, offer.sdp);
}

TEST(SignalingTest, RejectsMalformedBlobs) {
    EXPECT_THROW(decode_description("%%%"), ProtocolError);
    EXPECT_THROW(decode_description(peerdrop::crypto::base64_encode(std::string("not json"))), ProtocolError);
    EXPECT_THROW(decode_description(peerdrop::crypto::base64_encode(std::string(R"({"type":"offer"})"))),
                 ProtocolError);
    EXPECT_THROW(decode_description(peerdrop::crypto::base64_encode(std::string(R"({"type":1,"sdp":"x"})"))),
                 ProtocolError);
}
