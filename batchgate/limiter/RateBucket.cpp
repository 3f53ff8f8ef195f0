/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/limiter/RateBucket.h"

#include <algorithm>
#include <glog/logging.h>

#include "batchgate/utils/Exception.h"

namespace batchgate {

RateBucket::RateBucket(
    Quota limit,
    std::chrono::duration<double> period,
    TimePoint now)
  : limit_(limit),
    period_(period),
    // Start full, so the first `limit` units go out without waiting.
    capacity_(limit),
    lastRefillTime_(now) {
  if (!(limit_ > 0)) {
    throw BatchGateException("Rate limit must be positive, got ", limit_);
  }
  if (!(period_.count() > 0)) {
    throw BatchGateException(
      "Rate limit period must be positive, got ", period_.count(), " sec"
    );
  }
}

void RateBucket::refill(TimePoint now) {
  if (now <= lastRefillTime_) {
    return;
  }
  const double elapsed = secondsBetween(lastRefillTime_, now);
  capacity_ = std::min(
    capacity_ + elapsed * limit_ / period_.count(),
    limit_
  );
  lastRefillTime_ = now;
}

void RateBucket::consume(Quota amount) {
  CHECK_GE(amount, 0.0) << "Cannot consume a negative amount";
  CHECK(canConsume(amount))
    << "Consumed " << amount << " with only " << capacity_ << " available";
  capacity_ -= amount;
}

std::chrono::duration<double> RateBucket::timeUntilAvailable(
    Quota amount) const {
  if (canConsume(amount)) {
    return std::chrono::duration<double>(0);
  }
  return period_ * ((amount - capacity_) / limit_);
}

folly::dynamic RateBucket::toDynamic() const {
  return folly::dynamic::object
    ("limit", limit_)
    ("period_sec", period_.count())
    ("capacity", capacity_);
}

}  // namespace batchgate
