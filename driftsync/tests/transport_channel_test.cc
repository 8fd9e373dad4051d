// Copyright (c) 2025 <Your Name>
#include "internal/transport_channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

#include "driftserver/protocol.hpp"
#include "driftserver/reflector_server.hpp"

namespace driftsync {
namespace internal {

using WaitResult = TransportChannel::WaitResult;

/**
 * @test TransportChannelTest.InterruptUnblocksWait
 * @brief A wake-up byte ends a wait with no network traffic.
 *
 * @steps
 * 1. Open towards a local port nobody answers.
 * 2. Interrupt() from another thread after 50 ms.
 *
 * @expected WaitReadable() returns kInterrupted.
 */
TEST(TransportChannelTest, InterruptUnblocksWait) {
  TransportChannel ch;
  ASSERT_TRUE(ch.Open("127.0.0.1", 9)) << ch.GetLastError();

  std::thread waker([&ch]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(ch.Interrupt());
  });
  EXPECT_EQ(ch.WaitReadable(), WaitResult::kInterrupted);
  waker.join();
  ch.Close();
  EXPECT_FALSE(ch.IsOpen());
}

/**
 * @test TransportChannelTest.ExchangesWithReflector
 * @brief A request to a local reflector produces a readable reply.
 */
TEST(TransportChannelTest, ExchangesWithReflector) {
  driftserver::ReflectorServer server;
  ASSERT_TRUE(server.Start(0));

  TransportChannel ch;
  ASSERT_TRUE(ch.Open("localhost", server.BoundPort())) << ch.GetLastError();
  EXPECT_EQ(ch.Remote().port, server.BoundPort());
  ASSERT_TRUE(ch.Send(driftserver::Serialize(driftserver::MakeRequest(42))));

  ASSERT_EQ(ch.WaitReadable(), WaitResult::kReadable);
  std::vector<uint8_t> data;
  ASSERT_TRUE(ch.Receive(&data, driftserver::kPacketSize + 1));

  driftserver::Packet reply;
  ASSERT_TRUE(driftserver::DecodeReply(data, &reply));
  EXPECT_EQ(reply.local, 42u);
  ch.Close();
  server.Stop();
}

TEST(TransportChannelTest, OpenFailures) {
  TransportChannel ch;
  EXPECT_FALSE(ch.Open("no-such-host.invalid", 4318));
  EXPECT_FALSE(ch.GetLastError().empty());
  EXPECT_FALSE(ch.IsOpen());
  EXPECT_FALSE(ch.Interrupt());

  ASSERT_TRUE(ch.Open("127.0.0.1", 9));
  EXPECT_FALSE(ch.Open("127.0.0.1", 9));
  ch.Close();
}

}  // namespace internal
}  // namespace driftsync
