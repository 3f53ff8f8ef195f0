/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/Optional.h>

#include "batchgate/jobs/Job.h"
#include "batchgate/utils/Time.h"

namespace batchgate {

/**
 * Progress counters for one run.  There is exactly one per run, shared by
 * the AdmissionLoop (which starts jobs) and the Dispatcher (which finishes
 * them).  Both live on the same EventBase, so no locking.
 *
 * Invariant: started == succeeded + failed + inProgress, at any point
 * between two callbacks.  Nothing derived is cached -- the run is over
 * exactly when inProgress reaches 0 and there is nothing left to read.
 */
struct StatusTracker {
  void recordStarted() {
    ++started;
    ++inProgress;
  }
  void recordSucceeded();
  void recordFailed();
  // Counts one failed attempt.  A rate-limit rejection also restarts the
  // cooldown window at `now`.
  void recordAttemptFailure(FailureKind kind, TimePoint now);

  // True iff a rate-limit rejection happened less than `window` ago.
  bool inCooldown(TimePoint now, std::chrono::duration<double> window) const;
  // Zero unless inCooldown().
  std::chrono::duration<double> cooldownRemaining(
    TimePoint now,
    std::chrono::duration<double> window
  ) const;

  bool invariantHolds() const {
    return started == succeeded + failed + inProgress;
  }

  folly::dynamic toDynamic() const;

  int64_t started{0};
  int64_t inProgress{0};
  int64_t succeeded{0};
  int64_t failed{0};
  int64_t rateLimitErrors{0};
  int64_t apiErrors{0};  // Excluding rate-limit errors, counted above
  int64_t otherErrors{0};
  // Unset until the first rate-limit rejection.
  folly::Optional<TimePoint> lastRateLimitErrorTime;
};

}  // namespace batchgate
