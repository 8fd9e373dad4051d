// Copyright (c) 2025 <Your Name>
#include "internal/playback_rate_advisor.hpp"

#include <gtest/gtest.h>

#include "driftsync/sync_client.hpp"

namespace driftsync {
namespace internal {

/**
 * @test PlaybackRateAdvisorTest.DeadZoneAndClamp
 * @brief Small differences keep normal speed; large ones are clamped.
 *
 * @expected
 * - 0 and 4999 us -> 1.0
 * - 5000 us -> 1.005
 * - +2 s -> 2.0 and +5 s -> 2.0 (clamped)
 * - -3 s -> 0.5 (clamped)
 */
TEST(PlaybackRateAdvisorTest, DeadZoneAndClamp) {
  EXPECT_EQ(PlaybackRateAdvisor::RateForDifference(0.0), 1.0);
  EXPECT_EQ(PlaybackRateAdvisor::RateForDifference(4999.0), 1.0);
  EXPECT_EQ(PlaybackRateAdvisor::RateForDifference(-4999.0), 1.0);
  EXPECT_DOUBLE_EQ(PlaybackRateAdvisor::RateForDifference(5000.0), 1.005);
  EXPECT_DOUBLE_EQ(PlaybackRateAdvisor::RateForDifference(-250000.0), 0.75);
  EXPECT_DOUBLE_EQ(PlaybackRateAdvisor::RateForDifference(2000000.0), 2.0);
  EXPECT_DOUBLE_EQ(PlaybackRateAdvisor::RateForDifference(5000000.0), 2.0);
  EXPECT_DOUBLE_EQ(PlaybackRateAdvisor::RateForDifference(-3000000.0), 0.5);
}

/**
 * @test PlaybackRateAdvisorTest.SuggestConvertsScale
 * @brief Inputs in milliseconds are converted before comparison.
 *
 * @steps
 * 1. Global now is 10 s, playback started at global 4000 ms.
 * 2. Position is 5900 ms, i.e. 100 ms behind.
 *
 * @expected Rate is 1.1.
 */
TEST(PlaybackRateAdvisorTest, SuggestConvertsScale) {
  double rate = PlaybackRateAdvisor::Suggest(10000000.0, 4000.0, 5900.0,
                                             kScaleMilliseconds);
  EXPECT_NEAR(rate, 1.1, 1e-9);

  rate = PlaybackRateAdvisor::Suggest(10000000.0, 4.0, 6.002, kScaleSeconds);
  EXPECT_EQ(rate, 1.0);
}

}  // namespace internal
}  // namespace driftsync
