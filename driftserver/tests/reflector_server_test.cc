// Copyright (c) 2025 <Your Name>
#include "driftserver/reflector_server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "driftserver/platform/socket_interface.hpp"
#include "driftserver/protocol.hpp"

namespace driftserver {

namespace {
/** Fixed clock for deterministic replies. */
class FakeClock : public LocalClock {
 public:
  explicit FakeClock(int64_t t) : value_(t) {}
  int64_t NowMicros() override { return value_.load(); }
  void Set(int64_t t) { value_.store(t); }

 private:
  std::atomic<int64_t> value_;
};

/** Client-side socket connected to the server under test. */
std::unique_ptr<platform::ISocket> OpenClient(uint16_t port) {
  auto sock = platform::CreatePlatformSocket();
  if (!sock->Initialize()) return nullptr;
  if (!sock->Connect(platform::Endpoint("127.0.0.1", port))) return nullptr;
  return sock;
}

/** Waits until the server counters satisfy pred or 1 s elapsed. */
template <typename Pred>
bool WaitForStats(const ReflectorServer& server, Pred pred) {
  for (int i = 0; i < 100; ++i) {
    if (pred(server.GetStats())) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}
}  // namespace

/**
 * @test ReflectorServerTest.EchoesLocalAndStampsRemote
 * @brief The server answers a request with the reply flag and its own time.
 *
 * @steps
 * 1. Start the server on an ephemeral port with a fixed FakeClock.
 * 2. Send a request with local=123456 from localhost.
 * 3. Receive and decode the reply.
 *
 * @expected
 * - DecodeReply succeeds.
 * - local equals the request's local timestamp (echoed).
 * - remote equals the FakeClock value.
 */
TEST(ReflectorServerTest, EchoesLocalAndStampsRemote) {
  FakeClock clock(5000000);
  ReflectorServer server;
  ASSERT_TRUE(server.Start(0, &clock));
  ASSERT_NE(server.BoundPort(), 0);

  auto client = OpenClient(server.BoundPort());
  ASSERT_TRUE(client != nullptr);
  ASSERT_TRUE(client->Send(Serialize(MakeRequest(123456))));

  ASSERT_TRUE(client->WaitReadable(1000000)) << "no reply within 1 s";
  std::vector<uint8_t> data;
  ASSERT_TRUE(client->Receive(nullptr, &data, kPacketSize + 1));

  Packet reply;
  ASSERT_TRUE(DecodeReply(data, &reply));
  EXPECT_EQ(reply.local, 123456u);
  EXPECT_EQ(reply.remote, 5000000u);
  EXPECT_EQ(reply.reserved, 0u);

  ServerStats st = server.GetStats();
  EXPECT_EQ(st.packets_received, 1u);
  EXPECT_EQ(st.packets_sent, 1u);
  server.Stop();
}

/**
 * @test ReflectorServerTest.DropsMalformedPackets
 * @brief Short, wrong-magic and reply packets are dropped and counted.
 *
 * @steps
 * 1. Send a 31-byte datagram, a packet with bad magic and a reply packet.
 * 2. Wait until the drop counters change.
 *
 * @expected No response is sent; each drop counter is 1.
 */
TEST(ReflectorServerTest, DropsMalformedPackets) {
  FakeClock clock(1);
  std::atomic<int> logged{0};
  auto opts = Options::Builder()
                  .LogSink([&logged](const std::string&) { ++logged; })
                  .Build();
  ReflectorServer server;
  ASSERT_TRUE(server.Start(0, &clock, opts));

  auto client = OpenClient(server.BoundPort());
  ASSERT_TRUE(client != nullptr);

  std::vector<uint8_t> good = Serialize(MakeRequest(1));
  std::vector<uint8_t> short_pkt(good.begin(), good.end() - 1);
  std::vector<uint8_t> bad_magic = good;
  bad_magic[3] = 'x';
  std::vector<uint8_t> reply = Serialize(MakeReply(MakeRequest(1), 2));

  ASSERT_TRUE(client->Send(short_pkt));
  ASSERT_TRUE(client->Send(bad_magic));
  ASSERT_TRUE(client->Send(reply));

  EXPECT_TRUE(WaitForStats(server, [](const ServerStats& s) {
    return s.drop_short_packets == 1 && s.drop_bad_magic == 1 &&
           s.drop_replies == 1;
  }));
  EXPECT_FALSE(client->WaitReadable(100000));

  ServerStats st = server.GetStats();
  EXPECT_EQ(st.packets_sent, 0u);
  EXPECT_FALSE(st.last_error.empty());
  EXPECT_GE(logged.load(), 3);
  server.Stop();
}

/**
 * @test ReflectorServerTest.StopIsIdempotent
 * @brief Stop may be called repeatedly and the server can restart.
 *
 * @steps
 * 1. Start, Stop twice, Start again on an ephemeral port.
 *
 * @expected No crash; BoundPort() is 0 when stopped and non-zero when
 *           running.
 */
TEST(ReflectorServerTest, StopIsIdempotent) {
  FakeClock clock(1);
  ReflectorServer server;
  ASSERT_TRUE(server.Start(0, &clock));
  server.Stop();
  server.Stop();
  EXPECT_EQ(server.BoundPort(), 0);
  ASSERT_TRUE(server.Start(0, &clock));
  EXPECT_NE(server.BoundPort(), 0);
  server.Stop();
}

}  // namespace driftserver
