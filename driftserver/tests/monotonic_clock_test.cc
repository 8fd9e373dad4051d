// Copyright (c) 2025 <Your Name>
#include "driftserver/monotonic_clock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <thread>

#include "driftserver/platform/default_local_clock.hpp"

namespace driftserver {

/**
 * @test MonotonicClockTest.TracksRawClock
 * @brief Without offset and rate the reading follows CLOCK_MONOTONIC.
 *
 * @steps
 * 1. Read raw, clock, raw.
 *
 * @expected The clock reading lies between the two raw readings.
 */
TEST(MonotonicClockTest, TracksRawClock) {
  MonotonicClock clock;
  int64_t before = MonotonicClock::RawMicros();
  int64_t now = clock.NowMicros();
  int64_t after = MonotonicClock::RawMicros();
  EXPECT_GE(now, before);
  EXPECT_LE(now, after);
}

/**
 * @test MonotonicClockTest.OffsetShiftsReading
 * @brief AddOffset moves the reading by the given amount.
 *
 * @steps
 * 1. Add +100 ms and compare against the raw clock.
 *
 * @expected Difference is 100 ms within 5 ms of scheduling slack.
 */
TEST(MonotonicClockTest, OffsetShiftsReading) {
  MonotonicClock clock;
  clock.AddOffset(100000);
  int64_t diff = clock.NowMicros() - MonotonicClock::RawMicros();
  EXPECT_NEAR(static_cast<double>(diff), 100000.0, 5000.0);

  clock.Reset();
  diff = clock.NowMicros() - MonotonicClock::RawMicros();
  EXPECT_NEAR(static_cast<double>(diff), 0.0, 5000.0);
}

/**
 * @test MonotonicClockTest.RateScalesElapsed
 * @brief A rate of 2.0 advances twice as fast as real time.
 *
 * @steps
 * 1. Set rate 2.0, sleep 100 ms, compare elapsed readings.
 *
 * @expected Clock elapsed is about twice the raw elapsed; no jump at the
 *           rate change.
 */
TEST(MonotonicClockTest, RateScalesElapsed) {
  MonotonicClock clock;
  int64_t before_change = clock.NowMicros();
  clock.SetRate(2.0);
  EXPECT_DOUBLE_EQ(clock.GetRate(), 2.0);
  int64_t t0 = clock.NowMicros();
  EXPECT_NEAR(static_cast<double>(t0 - before_change), 0.0, 5000.0);

  int64_t r0 = MonotonicClock::RawMicros();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  int64_t t1 = clock.NowMicros();
  int64_t r1 = MonotonicClock::RawMicros();

  double ratio = static_cast<double>(t1 - t0) / static_cast<double>(r1 - r0);
  EXPECT_NEAR(ratio, 2.0, 0.1);
}

TEST(MonotonicClockTest, DefaultClockIsMonotonic) {
  LocalClock& clock = platform::GetDefaultLocalClock();
  int64_t prev = clock.NowMicros();
  for (int i = 0; i < 1000; ++i) {
    int64_t cur = clock.NowMicros();
    ASSERT_GE(cur, prev);
    prev = cur;
  }
  EXPECT_TRUE(platform::CreateDefaultLocalClock() != nullptr);
}

}  // namespace driftserver
