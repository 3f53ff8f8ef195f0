/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <functional>

namespace batchgate {

// Everything that schedules or throttles runs off a monotonic clock.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

inline double secondsBetween(TimePoint from, TimePoint to) {
  return
    std::chrono::duration_cast<std::chrono::duration<double>>(to - from)
      .count();
}

inline std::chrono::milliseconds ceilMs(std::chrono::duration<double> d) {
  return std::chrono::ceil<std::chrono::milliseconds>(d);
}

}  // namespace batchgate
