// Copyright (c) 2025 <Your Name>
/**
 * @file accuracy_monitor.hpp
 * @brief Self-assessed error bound of the synchronization model.
 *
 * Around each accepted sample the client reads (local, global) once with the
 * model before the update and once after it. Were the model exact, both
 * pairs would advance by the same amount; the absolute mismatch is recorded
 * as the error of this update.
 */
#pragma once

#include <cstddef>
#include <cstdint>

#include "driftsync/sync_client.hpp"
#include "internal/sliding_window.hpp"

namespace driftsync {
namespace internal {

/**
 * @brief Window of accuracy measurements (microseconds).
 *
 * Not thread-safe: guarded by the client's state lock.
 */
class AccuracyMonitor {
 public:
  AccuracyMonitor() = default;

  /**
   * @brief Record |(global_before - global_after) - (local_before -
   *        local_after)|.
   */
  void Record(int64_t local_before, double global_before, int64_t local_after,
              double global_after);

  /** Min/average/max in microseconds; zeros when empty. */
  Accuracy Summarize() const;

  void Clear() { window_.Clear(); }
  size_t Count() const { return window_.Size(); }

  /** Bumped by every Record(); lets waiters detect a new measurement. */
  uint64_t Generation() const { return generation_; }

 private:
  SlidingWindow<double> window_{kWindowCapacity};
  uint64_t generation_ = 0;
};

}  // namespace internal
}  // namespace driftsync
