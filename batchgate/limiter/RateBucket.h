/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>

#include "batchgate/utils/Time.h"

namespace batchgate {

/**
 * A token bucket with continuous, lazy refill.  Holds up to `limit` units,
 * and regains `limit` units every `period`, linearly.  Nothing happens in
 * the background: the owner calls refill() with the current time before
 * deciding whether to consume.
 *
 * Capacity is fractional, so a fractional refill is never lost to
 * rounding, and consuming 0 is always possible.  The bucket starts full.
 *
 * Not thread-safe; lives on the scheduler's EventBase.
 */
class RateBucket {
public:
  using Quota = double;

  RateBucket(Quota limit, std::chrono::duration<double> period, TimePoint now);

  // Credit the time elapsed since the last refill, clamped to `limit`.
  // Time going backwards (e.g. out-of-order synthetic clocks) credits 0.
  void refill(TimePoint now);

  bool canConsume(Quota amount) const { return capacity_ >= amount; }

  // The caller must check canConsume() first -- this never blocks, and
  // never lets the capacity go negative.
  void consume(Quota amount);

  // How long until `amount` becomes available, assuming no consumption in
  // the meantime.  Zero if it is available now.
  std::chrono::duration<double> timeUntilAvailable(Quota amount) const;

  Quota capacity() const { return capacity_; }
  Quota limit() const { return limit_; }
  std::chrono::duration<double> period() const { return period_; }
  TimePoint lastRefillTime() const { return lastRefillTime_; }

  folly::dynamic toDynamic() const;

private:
  const Quota limit_;
  const std::chrono::duration<double> period_;
  Quota capacity_;
  TimePoint lastRefillTime_;
};

}  // namespace batchgate
