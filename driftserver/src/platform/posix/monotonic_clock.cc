// Copyright (c) 2025 <Your Name>
/**
 * @file monotonic_clock.cc
 * @brief POSIX-specific implementation using clock_gettime().
 */
#include "driftserver/monotonic_clock.hpp"

#include <time.h>

#include <cmath>
#include <memory>
#include <mutex>

namespace driftserver {

struct MonotonicClock::Impl {
  mutable std::mutex mtx_;
  int64_t mono_t0_us_{0};  // Monotonic anchor (microseconds)
  int64_t start_us_{0};    // Reported value at anchor
  double rate_{1.0};       // Time rate multiplier

  // Reported value at mono_now (caller holds mtx_)
  int64_t ValueAt(int64_t mono_now) const {
    double elapsed = static_cast<double>(mono_now - mono_t0_us_);
    return start_us_ + static_cast<int64_t>(std::llround(elapsed * rate_));
  }

  // Move the anchor to mono_now without changing the reported value
  void Reanchor(int64_t mono_now) {
    start_us_ = ValueAt(mono_now);
    mono_t0_us_ = mono_now;
  }
};

MonotonicClock::MonotonicClock() : impl_(std::make_unique<Impl>()) {
  Reset();
}

MonotonicClock::~MonotonicClock() = default;

int64_t MonotonicClock::RawMicros() {
  timespec ts{};
  if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) return 0;
  return static_cast<int64_t>(ts.tv_sec) * 1'000'000LL +
         static_cast<int64_t>(ts.tv_nsec) / 1000;
}

int64_t MonotonicClock::NowMicros() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return impl_->ValueAt(RawMicros());
}

void MonotonicClock::AddOffset(int64_t delta_us) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  impl_->Reanchor(RawMicros());
  impl_->start_us_ += delta_us;
}

void MonotonicClock::SetRate(double new_rate) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  // Keep the reading continuous across the rate change
  impl_->Reanchor(RawMicros());
  impl_->rate_ = new_rate;
}

double MonotonicClock::GetRate() const {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return impl_->rate_;
}

void MonotonicClock::Reset() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  int64_t mono_now = RawMicros();
  impl_->mono_t0_us_ = mono_now;
  impl_->start_us_ = mono_now;
  impl_->rate_ = 1.0;
}

}  // namespace driftserver
