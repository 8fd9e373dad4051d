// Copyright (c) 2025 <Your Name>
/**
 * @file default_local_clock.hpp
 * @brief Platform-specific default LocalClock.
 */
#pragma once

#include <memory>

#include "driftserver/export.hpp"
#include "driftserver/local_clock.hpp"

namespace driftserver {
namespace platform {

/**
 * @brief Creates a platform-specific default LocalClock.
 * @return Unique pointer to a MonotonicClock.
 */
DRIFT_SERVER_API std::unique_ptr<LocalClock> CreateDefaultLocalClock();

/**
 * @brief Process-wide default clock used when callers pass nullptr.
 */
DRIFT_SERVER_API LocalClock& GetDefaultLocalClock();

}  // namespace platform
}  // namespace driftserver
