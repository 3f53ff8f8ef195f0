/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/statuses/StatusTracker.h"

#include <glog/logging.h>

namespace batchgate {

void StatusTracker::recordSucceeded() {
  CHECK_GT(inProgress, 0);
  --inProgress;
  ++succeeded;
}

void StatusTracker::recordFailed() {
  CHECK_GT(inProgress, 0);
  --inProgress;
  ++failed;
}

void StatusTracker::recordAttemptFailure(FailureKind kind, TimePoint now) {
  switch (kind) {
    case FailureKind::RateLimit:
      ++rateLimitErrors;
      lastRateLimitErrorTime = now;
      break;
    case FailureKind::ApiError:
      ++apiErrors;
      break;
    case FailureKind::Transport:
      ++otherErrors;
      break;
  }
}

std::chrono::duration<double> StatusTracker::cooldownRemaining(
    TimePoint now,
    std::chrono::duration<double> window) const {
  if (!lastRateLimitErrorTime.has_value()) {
    return std::chrono::duration<double>(0);
  }
  auto remaining =
    window.count() - secondsBetween(*lastRateLimitErrorTime, now);
  return std::chrono::duration<double>(remaining > 0 ? remaining : 0);
}

bool StatusTracker::inCooldown(
    TimePoint now,
    std::chrono::duration<double> window) const {
  return cooldownRemaining(now, window).count() > 0;
}

folly::dynamic StatusTracker::toDynamic() const {
  return folly::dynamic::object
    ("started", started)
    ("in_progress", inProgress)
    ("succeeded", succeeded)
    ("failed", failed)
    ("rate_limit_errors", rateLimitErrors)
    ("api_errors", apiErrors)
    ("other_errors", otherErrors);
}

}  // namespace batchgate
