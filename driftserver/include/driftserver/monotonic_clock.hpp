// Copyright (c) 2025 <Your Name>
/**
 * @file monotonic_clock.hpp
 * @brief POSIX monotonic clock-based LocalClock implementation.
 *
 * Provides a LocalClock implementation using POSIX
 * clock_gettime(CLOCK_MONOTONIC). The reading may be shifted by a constant
 * offset and scaled by a rate, which lets a reflector emulate a remote clock
 * that is ahead of or drifting against the local one.
 */
#pragma once

#include <cstdint>
#include <memory>

#include "driftserver/export.hpp"
#include "driftserver/local_clock.hpp"

namespace driftserver {

/**
 * @brief LocalClock backed by POSIX clock_gettime(CLOCK_MONOTONIC).
 *
 * NowMicros() = anchor_value + rate * (monotonic_now - monotonic_anchor).
 * With the defaults (offset 0, rate 1.0) this is the raw monotonic reading.
 *
 * Thread-safe: All methods use internal locking.
 */
class DRIFT_SERVER_API MonotonicClock : public LocalClock {
 public:
  MonotonicClock();
  ~MonotonicClock() override;

  // Non-copyable, non-movable
  MonotonicClock(const MonotonicClock&) = delete;
  MonotonicClock& operator=(const MonotonicClock&) = delete;
  MonotonicClock(MonotonicClock&&) = delete;
  MonotonicClock& operator=(MonotonicClock&&) = delete;

  int64_t NowMicros() override;

  /** Shifts the current reading by delta_us (may be negative). */
  void AddOffset(int64_t delta_us);

  /** Sets progression rate multiplier (1.0 = real time). */
  void SetRate(double rate);

  /** Returns current progression rate multiplier. */
  double GetRate() const;

  /** Drops offset and rate and follows the raw monotonic clock again. */
  void Reset();

  /** Raw CLOCK_MONOTONIC reading in microseconds. */
  static int64_t RawMicros();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace driftserver
