// Copyright (c) 2025 <Your Name>
/**
 * @file drift_estimator.hpp
 * @brief Sliding window estimation of offset, drift rate and round trip.
 *
 * Keeps windows of round-trip times, accepted (local, remote) samples and
 * their offsets. Offset is the mean of the offset window; the drift rate is
 * the slope between the oldest and newest retained sample. A reply whose
 * round trip strays too far from the median round trip is counted but not
 * used for estimation.
 */
#pragma once

#include <cstddef>
#include <cstdint>

#include "driftsync/sync_client.hpp"
#include "internal/sliding_window.hpp"

namespace driftsync {
namespace internal {

/**
 * @brief One accepted round trip.
 */
struct Sample {
  int64_t local;   ///< Local send time (us)
  int64_t remote;  ///< Remote time reported in the reply (us)
};

/**
 * @brief Offset/drift estimator state.
 *
 * Not thread-safe: the owner serializes every call behind its own lock.
 * All values are in microseconds of the respective clock.
 */
class DriftEstimator {
 public:
  static constexpr int64_t kDefaultOutlierThresholdUs = 10000;

  enum class Verdict { kAccepted, kRejected };

  explicit DriftEstimator(
      int64_t outlier_threshold_us = kDefaultOutlierThresholdUs);

  /**
   * @brief Integrate one decoded reply.
   *
   * Counts the reply, records its round trip and compares it against the
   * median of the round-trip window (including itself). Outliers only bump
   * the rejection counter. Accepted replies update the sample and offset
   * windows and recompute offset and clock rate.
   *
   * A reply whose echoed send time lies after @p now_us cannot belong to a
   * real round trip; it is counted as rejected and its round trip is not
   * recorded.
   *
   * @param local_us Echoed local send time, as carried on the wire.
   * @param remote_us Remote time from the reply, as carried on the wire.
   * @param now_us Local time at which the reply was received.
   */
  Verdict Ingest(uint64_t local_us, uint64_t remote_us, int64_t now_us);

  /** Count one sent request. */
  void NoteRequestSent() { ++stats_.sent_requests; }

  /**
   * @brief Estimate global time for a local reading.
   * @return reference + offset + (now - reference) * rate, where reference is
   *         the newest sample's local time; 0 before any accepted sample.
   */
  double GlobalTimeAt(int64_t now_us) const;

  /** Median of the round-trip window (lower middle); 0 when empty. */
  int64_t MedianRoundTripTime() const;

  double Offset() const { return offset_; }
  double ClockRate() const { return clock_rate_; }
  const Statistics& Stats() const { return stats_; }

  const SlidingWindow<int64_t>& RoundTripTimes() const { return rtts_; }
  const SlidingWindow<Sample>& Samples() const { return samples_; }
  const SlidingWindow<int64_t>& Offsets() const { return offsets_; }

  int64_t OutlierThresholdUs() const { return outlier_threshold_us_; }
  void SetOutlierThresholdUs(int64_t v);

  /** Drop all windows and counters, keeping the threshold. */
  void Reset();

 private:
  void UpdateClockRate();
  void UpdateOffset();

  int64_t outlier_threshold_us_;
  SlidingWindow<int64_t> rtts_{kWindowCapacity};
  SlidingWindow<Sample> samples_{kWindowCapacity};
  SlidingWindow<int64_t> offsets_{kWindowCapacity};
  double offset_ = 0.0;
  double clock_rate_ = 1.0;
  Statistics stats_;
};

}  // namespace internal
}  // namespace driftsync
