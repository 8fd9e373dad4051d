// Copyright (c) 2025 <Your Name>
#include "internal/sliding_window.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace driftsync {
namespace internal {

/**
 * @test SlidingWindowTest.EvictsOldestWhenFull
 * @brief The 11th push into a window of 10 drops the first element.
 *
 * @expected Size stays at capacity; iteration yields 2..11 oldest-first.
 */
TEST(SlidingWindowTest, EvictsOldestWhenFull) {
  SlidingWindow<int> w(10);
  for (int i = 1; i <= 11; ++i) w.Push(i);

  EXPECT_EQ(w.Size(), 10u);
  EXPECT_EQ(w.Front(), 2);
  EXPECT_EQ(w.Back(), 11);

  std::vector<int> got(w.begin(), w.end());
  std::vector<int> want = {2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
  EXPECT_EQ(got, want);
}

TEST(SlidingWindowTest, ClearAndCapacity) {
  SlidingWindow<int> w(3);
  EXPECT_TRUE(w.Empty());
  w.Push(7);
  w.Push(8);
  EXPECT_EQ(w.Size(), 2u);
  w.Clear();
  EXPECT_TRUE(w.Empty());
  EXPECT_EQ(w.Capacity(), 3u);

  // zero capacity is clamped to one
  SlidingWindow<int> tiny(0);
  tiny.Push(1);
  tiny.Push(2);
  EXPECT_EQ(tiny.Size(), 1u);
  EXPECT_EQ(tiny.Front(), 2);
}

}  // namespace internal
}  // namespace driftsync
