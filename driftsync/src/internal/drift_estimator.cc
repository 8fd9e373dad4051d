// Copyright (c) 2025 <Your Name>
#include "internal/drift_estimator.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <vector>

namespace driftsync {
namespace internal {

namespace {

constexpr uint64_t kInt64Max =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

/** a - b modulo 2^64, reinterpreted as two's complement. */
int64_t WrappingDiff(uint64_t a, uint64_t b) {
  const uint64_t d = a - b;
  if (d <= kInt64Max) return static_cast<int64_t>(d);
  return -static_cast<int64_t>(~d) - 1;
}

int64_t WrappingDiff(int64_t a, int64_t b) {
  return WrappingDiff(static_cast<uint64_t>(a), static_cast<uint64_t>(b));
}

}  // namespace

DriftEstimator::DriftEstimator(int64_t outlier_threshold_us)
    : outlier_threshold_us_(std::max<int64_t>(0, outlier_threshold_us)) {}

void DriftEstimator::SetOutlierThresholdUs(int64_t v) {
  outlier_threshold_us_ = std::max<int64_t>(0, v);
}

DriftEstimator::Verdict DriftEstimator::Ingest(uint64_t local_us,
                                               uint64_t remote_us,
                                               int64_t now_us) {
  ++stats_.received_samples;

  const uint64_t rtt_u = static_cast<uint64_t>(now_us) - local_us;
  if (rtt_u > kInt64Max) {
    ++stats_.rejected_samples;
    return Verdict::kRejected;
  }

  // Both operands are non-negative, so the deviation cannot overflow
  const int64_t rtt = static_cast<int64_t>(rtt_u);
  rtts_.Push(rtt);
  if (std::llabs(rtt - MedianRoundTripTime()) > outlier_threshold_us_) {
    ++stats_.rejected_samples;
    return Verdict::kRejected;
  }

  const int64_t local = WrappingDiff(local_us, uint64_t{0});
  samples_.Push(Sample{local, WrappingDiff(remote_us, uint64_t{0})});
  if (samples_.Size() >= 2) UpdateClockRate();

  offsets_.Push(WrappingDiff(remote_us, local_us));
  UpdateOffset();
  return Verdict::kAccepted;
}

double DriftEstimator::GlobalTimeAt(int64_t now_us) const {
  if (samples_.Empty()) return 0.0;

  const int64_t reference = samples_.Back().local;
  return static_cast<double>(reference) + offset_ +
         static_cast<double>(WrappingDiff(now_us, reference)) * clock_rate_;
}

int64_t DriftEstimator::MedianRoundTripTime() const {
  if (rtts_.Empty()) return 0;

  std::vector<int64_t> tmp(rtts_.begin(), rtts_.end());
  const size_t mid = (tmp.size() - 1) / 2;
  std::nth_element(tmp.begin(), tmp.begin() + mid, tmp.end());
  return tmp[mid];
}

void DriftEstimator::Reset() {
  rtts_.Clear();
  samples_.Clear();
  offsets_.Clear();
  offset_ = 0.0;
  clock_rate_ = 1.0;
  stats_ = Statistics{};
}

void DriftEstimator::UpdateClockRate() {
  const Sample& first = samples_.Front();
  const Sample& last = samples_.Back();
  const int64_t dl = WrappingDiff(last.local, first.local);
  // Equal local stamps carry no slope information; keep the last rate
  if (dl == 0) return;

  clock_rate_ = static_cast<double>(WrappingDiff(last.remote, first.remote)) /
                static_cast<double>(dl);
}

void DriftEstimator::UpdateOffset() {
  if (offsets_.Empty()) return;

  double sum = 0.0;
  for (int64_t o : offsets_) sum += static_cast<double>(o);
  offset_ = sum / static_cast<double>(offsets_.Size());
}

}  // namespace internal
}  // namespace driftsync
