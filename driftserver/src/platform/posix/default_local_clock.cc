// Copyright (c) 2025 <Your Name>
/**
 * @file default_local_clock.cc (POSIX)
 * @brief POSIX implementation - creates MonotonicClock instance.
 */
#include "driftserver/platform/default_local_clock.hpp"

#include <memory>

#include "driftserver/monotonic_clock.hpp"

namespace driftserver {
namespace platform {

std::unique_ptr<LocalClock> CreateDefaultLocalClock() {
  return std::make_unique<MonotonicClock>();
}

LocalClock& GetDefaultLocalClock() {
  static MonotonicClock clock;
  return clock;
}

}  // namespace platform
}  // namespace driftserver
