// Copyright (c) 2025 <Your Name>
/**
 * @file playback_rate_advisor.hpp
 * @brief Playback speed suggestion for media aligned to global time.
 */
#pragma once

#include <algorithm>
#include <cmath>

namespace driftsync {
namespace internal {

/**
 * @brief Proportional playback rate correction.
 *
 * A positive difference means playback lags behind the global timeline and
 * should speed up. One second of difference maps to +/-1.0 of rate.
 */
class PlaybackRateAdvisor {
 public:
  static constexpr double kDeadZoneUs = 5000.0;
  static constexpr double kMinRate = 0.5;
  static constexpr double kMaxRate = 2.0;

  /**
   * @brief Rate for a given lag.
   * @param difference_us Global position minus playback position (us).
   * @return 1.0 when |difference| < 5 ms, else 1 + difference / 1e6 clamped
   *         to [kMinRate, kMaxRate].
   */
  static double RateForDifference(double difference_us) {
    if (std::fabs(difference_us) < kDeadZoneUs) return 1.0;

    double rate = 1.0 + difference_us / 1000.0 / 1000.0;
    return std::min(kMaxRate, std::max(kMinRate, rate));
  }

  /**
   * @brief Rate from the caller's view of playback.
   * @param global_now_us Current global estimate (us, unscaled).
   * @param global_start Global start time in the caller's scale.
   * @param position Playback position in the caller's scale.
   * @param scale Accessor scale (must be positive).
   */
  static double Suggest(double global_now_us, double global_start,
                        double position, double scale) {
    double global_position = global_now_us - global_start / scale;
    return RateForDifference(global_position - position / scale);
  }
};

}  // namespace internal
}  // namespace driftsync
