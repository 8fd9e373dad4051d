// Copyright (c) 2025 <Your Name>
#include "internal/accuracy_monitor.hpp"

#include <algorithm>
#include <cmath>

namespace driftsync {
namespace internal {

void AccuracyMonitor::Record(int64_t local_before, double global_before,
                             int64_t local_after, double global_after) {
  const double global_delta = global_before - global_after;
  const double local_delta = static_cast<double>(local_before - local_after);
  window_.Push(std::fabs(global_delta - local_delta));
  ++generation_;
}

Accuracy AccuracyMonitor::Summarize() const {
  Accuracy result;
  if (window_.Empty()) return result;

  auto mm = std::minmax_element(window_.begin(), window_.end());
  result.min = *mm.first;
  result.max = *mm.second;

  double sum = 0.0;
  for (double v : window_) sum += v;
  result.average = sum / static_cast<double>(window_.Size());
  return result;
}

}  // namespace internal
}  // namespace driftsync
