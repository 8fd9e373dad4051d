// Copyright (c) 2025 <Your Name>
/**
 * @file sliding_window.hpp
 * @brief Fixed-capacity FIFO window used by the estimators.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>

namespace driftsync {
namespace internal {

/**
 * @brief Ordered sequence with FIFO eviction.
 *
 * When a Push() would exceed the capacity, the oldest element is dropped
 * first. Iteration is oldest-first. Not thread-safe.
 */
template <typename T>
class SlidingWindow {
 public:
  using const_iterator = typename std::deque<T>::const_iterator;

  explicit SlidingWindow(size_t capacity)
      : capacity_(std::max<size_t>(1, capacity)) {}

  void Push(const T& value) {
    if (items_.size() >= capacity_) items_.pop_front();
    items_.push_back(value);
  }

  void Clear() { items_.clear(); }

  size_t Size() const { return items_.size(); }
  size_t Capacity() const { return capacity_; }
  bool Empty() const { return items_.empty(); }

  /** Oldest element. Window must not be empty. */
  const T& Front() const { return items_.front(); }
  /** Newest element. Window must not be empty. */
  const T& Back() const { return items_.back(); }

  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }

 private:
  size_t capacity_;
  std::deque<T> items_;
};

}  // namespace internal
}  // namespace driftsync
