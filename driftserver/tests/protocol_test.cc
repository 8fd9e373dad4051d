/**
 * @test DRIFTsync packet codec
 * @brief Layout and validation of the fixed 32-byte packet.
 * @steps
 *  1) Serialize a request and inspect the little-endian byte layout.
 *  2) Parse valid bytes back and compare all fields.
 *  3) Feed wrong sizes, a wrong magic and a request to DecodeReply.
 * @expected
 *  - Layout matches magic/flags/local/remote/reserved in LE order.
 *  - Invalid input yields false and leaves the output untouched.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "driftserver/protocol.hpp"

namespace {

using driftserver::DecodeReply;
using driftserver::kPacketSize;
using driftserver::MakeReply;
using driftserver::MakeRequest;
using driftserver::Packet;
using driftserver::Parse;
using driftserver::Serialize;

TEST(ProtocolTest, SerializeIsLittleEndian) {
  Packet p = MakeRequest(0x0102030405060708LL);
  std::vector<uint8_t> bytes = Serialize(p);

  ASSERT_EQ(bytes.size(), kPacketSize);
  // "drft" in wire order
  EXPECT_EQ(bytes[0], 'd');
  EXPECT_EQ(bytes[1], 'r');
  EXPECT_EQ(bytes[2], 'f');
  EXPECT_EQ(bytes[3], 't');
  for (int i = 4; i < 8; ++i) EXPECT_EQ(bytes[i], 0) << "flags byte " << i;
  EXPECT_EQ(bytes[8], 0x08);
  EXPECT_EQ(bytes[15], 0x01);
  for (size_t i = 16; i < kPacketSize; ++i) {
    EXPECT_EQ(bytes[i], 0) << "remote/reserved byte " << i;
  }
}

TEST(ProtocolTest, ReplyEchoesLocalAndSetsFlag) {
  Packet req = MakeRequest(123456789);
  Packet rep = MakeReply(req, 987654321);

  std::vector<uint8_t> bytes = Serialize(rep);
  Packet out;
  ASSERT_TRUE(DecodeReply(bytes, &out));
  EXPECT_EQ(out.magic, driftserver::kMagic);
  EXPECT_TRUE(driftserver::IsReply(out));
  EXPECT_EQ(out.local, 123456789u);
  EXPECT_EQ(out.remote, 987654321u);
  EXPECT_EQ(out.reserved, 0u);
}

TEST(ProtocolTest, RejectsWrongLength) {
  std::vector<uint8_t> bytes = Serialize(MakeReply(MakeRequest(1), 2));
  Packet out;
  out.local = 42;

  std::vector<uint8_t> shorter(bytes.begin(), bytes.end() - 1);
  EXPECT_FALSE(Parse(shorter, &out));
  std::vector<uint8_t> longer = bytes;
  longer.push_back(0);
  EXPECT_FALSE(Parse(longer, &out));
  EXPECT_FALSE(Parse({}, &out));
  EXPECT_EQ(out.local, 42u);
}

TEST(ProtocolTest, RejectsBadMagic) {
  std::vector<uint8_t> bytes = Serialize(MakeReply(MakeRequest(1), 2));
  bytes[0] ^= 0xff;
  Packet out;
  out.local = 42;
  EXPECT_FALSE(Parse(bytes, &out));
  EXPECT_FALSE(DecodeReply(bytes, &out));
  EXPECT_EQ(out.local, 42u);
}

TEST(ProtocolTest, DecodeReplyRejectsRequest) {
  std::vector<uint8_t> bytes = Serialize(MakeRequest(77));
  Packet out;
  EXPECT_TRUE(Parse(bytes, &out));
  EXPECT_EQ(out.local, 77u);

  Packet reply;
  reply.local = 42;
  EXPECT_FALSE(DecodeReply(bytes, &reply));
  EXPECT_EQ(reply.local, 42u);
}

}  // namespace
