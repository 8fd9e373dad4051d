// Copyright (c) 2025 <Your Name>
/**
 * @file local_clock.hpp
 * @brief Minimal local clock interface (microsecond tick provider).
 */
#pragma once

#include <cstdint>

namespace driftserver {

/**
 * Interface for local clocks.
 * Provides a monotonic reading in microseconds with an arbitrary epoch.
 */
class LocalClock {
 public:
  virtual ~LocalClock() = default;

  /** Returns the current reading in microseconds. */
  virtual int64_t NowMicros() = 0;
};

}  // namespace driftserver
