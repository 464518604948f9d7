// Tests for the datagram envelope and P2P-DID handling.
#include "eufyErrors.hpp"
#include "eufyFrame.hpp"

#include <gtest/gtest.h>

TEST(FrameCodecTest, EncodesTypeAndLengthBigEndian) {
  std::vector<unsigned char> payload = {0xAA, 0xBB, 0xCC};
  std::vector<unsigned char> message = Eufy::EncodeFrame(Eufy::Request::LOOKUP_WITH_KEY, payload);
  ASSERT_EQ(message.size(), 7u);
  EXPECT_EQ(message[0], 0xF1);
  EXPECT_EQ(message[1], 0x26);
  EXPECT_EQ(message[2], 0x00);
  EXPECT_EQ(message[3], 0x03);
  EXPECT_EQ(message[4], 0xAA);
  EXPECT_EQ(message[6], 0xCC);
}

TEST(FrameCodecTest, RoundTripsSharedTypes) {
  std::vector<unsigned char> payload = {0xD1, 0x00, 0x00, 0x01};
  const uint16_t types[] = {Eufy::Request::DATA, Eufy::Request::ACK, Eufy::Request::PING, Eufy::Request::PONG,
                            Eufy::Request::END};
  for (uint16_t type : types) {
    std::vector<unsigned char> message = Eufy::EncodeFrame(type, payload);
    Eufy::Frame frame = Eufy::DecodeFrame(message.data(), (int)message.size());
    EXPECT_EQ(frame.type, type);
    EXPECT_EQ(frame.payload, payload);
  }
}

TEST(FrameCodecTest, AcceptsMaximumPayload) {
  std::vector<unsigned char> payload(EUFY_FRAME_MAX_PAYLOAD, 0x5A);
  std::vector<unsigned char> message = Eufy::EncodeFrame(Eufy::Request::DATA, payload);
  EXPECT_EQ(message.size(), (size_t)(EUFY_FRAME_MAX_PAYLOAD + EUFY_FRAME_HEADER_SIZE));
  EXPECT_EQ(message[2], 0xFF);
  EXPECT_EQ(message[3], 0xFF);
}

TEST(FrameCodecTest, RejectsOversizedPayload) {
  std::vector<unsigned char> payload(EUFY_FRAME_MAX_PAYLOAD + 1, 0x00);
  EXPECT_THROW(Eufy::EncodeFrame(Eufy::Request::DATA, payload), Eufy::ProtocolError);
}

TEST(FrameCodecTest, RejectsUnknownType) {
  const unsigned char message[] = {0x12, 0x34, 0x00, 0x00};
  EXPECT_THROW(Eufy::DecodeFrame(message, sizeof(message)), Eufy::ProtocolError);
}

TEST(FrameCodecTest, RejectsRequestOnlyType) {
  // LOOKUP_WITH_KEY is never sent by a relay or device
  const unsigned char message[] = {0xF1, 0x26, 0x00, 0x00};
  EXPECT_THROW(Eufy::DecodeFrame(message, sizeof(message)), Eufy::ProtocolError);
}

TEST(FrameCodecTest, RejectsTruncatedDatagram) {
  const unsigned char message[] = {0xF1};
  EXPECT_THROW(Eufy::DecodeFrame(message, sizeof(message)), Eufy::ProtocolError);
}

TEST(FrameCodecTest, IgnoresLengthField) {
  // length claims 16 bytes, the datagram carries 2
  const unsigned char message[] = {0xF1, 0x41, 0x00, 0x10, 0x01, 0x02};
  Eufy::Frame frame = Eufy::DecodeFrame(message, sizeof(message));
  EXPECT_EQ(frame.type, Eufy::Response::LOCAL_LOOKUP_RESP);
  ASSERT_EQ(frame.payload.size(), 2u);
  EXPECT_EQ(frame.payload[0], 0x01);
  EXPECT_EQ(frame.payload[1], 0x02);
}

TEST(FrameCodecTest, HeaderOnlyFrameHasEmptyPayload) {
  const unsigned char message[] = {0xF1, 0xF0, 0x00, 0x00};
  Eufy::Frame frame = Eufy::DecodeFrame(message, sizeof(message));
  EXPECT_EQ(frame.type, Eufy::Response::END);
  EXPECT_TRUE(frame.payload.empty());
}

TEST(FrameCodecTest, NamesResponseTypes) {
  EXPECT_STREQ(Eufy::ResponseName(Eufy::Response::LOOKUP_ADDR), "LOOKUP_ADDR");
  EXPECT_STREQ(Eufy::ResponseName(0x1234), "UNKNOWN");
}

TEST(P2PDIDTest, ParsesThreeComponents) {
  Eufy::P2PDID did;
  ASSERT_TRUE(Eufy::ParseP2PDID("ABCD-012345-EFGHI", did));
  EXPECT_EQ(did.prefix, "ABCD");
  EXPECT_EQ(did.serial, 12345u);
  EXPECT_EQ(did.suffix, "EFGHI");
}

TEST(P2PDIDTest, RejectsMalformedIdentifiers) {
  Eufy::P2PDID did;
  EXPECT_FALSE(Eufy::ParseP2PDID("ABCD012345EFGHI", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("ABCD-012345", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("AB-12-34-CD", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("ABCD-01X345-EFGHI", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("ABCD--EFGHI", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("AB-1\xB0" "5-CD", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("AB-12\xFF-CD", did));
}

TEST(P2PDIDTest, RejectsSerialBeyondFiveBytes) {
  Eufy::P2PDID did;
  EXPECT_TRUE(Eufy::ParseP2PDID("AB-1099511627775-CD", did));
  EXPECT_FALSE(Eufy::ParseP2PDID("AB-1099511627776-CD", did));
}

TEST(P2PDIDTest, AppendsSerialAsFiveBytesBigEndian) {
  Eufy::P2PDID did;
  ASSERT_TRUE(Eufy::ParseP2PDID("AB-258-CD", did));
  std::vector<unsigned char> buffer;
  Eufy::AppendP2PDID(buffer, did);
  std::vector<unsigned char> expected = {'A', 'B', 0x00, 0x00, 0x00, 0x01, 0x02, 'C', 'D'};
  EXPECT_EQ(buffer, expected);
}
