/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/ExceptionWrapper.h>
#include <folly/io/async/AsyncTimeout.h>

#include "batchgate/jobs/Job.h"
#include "batchgate/limiter/RateBucket.h"
#include "batchgate/utils/Time.h"

namespace batchgate {

class Config;
class CostEstimator;
class Dispatcher;
class JobSource;
class RetryQueue;
struct StatusTracker;

/**
 * The scheduler: decides when each job gets to start an attempt.
 *
 * Each pass of the loop (scheduleOnce):
 *  1) FETCHING: unless a job is already held, take the next one --
 *     retries first, then new lines from the JobSource.  At most one job
 *     waits for capacity, so memory stays flat however big the input is.
 *  2) CAPACITY_CHECK: refill both token buckets for the elapsed time.
 *  3) DISPATCH: if the held job fits in both buckets (1 request, and
 *     job.cost resource units), and no cooldown is in effect, charge both
 *     buckets, count the attempt, and hand the job to the Dispatcher
 *     without waiting for the call to finish.
 *  4) DRAINED: if the input is exhausted, nothing is held or waiting to
 *     be retried, and nothing is in progress, the run is over.
 *  5) WAIT: otherwise, sleep briefly so that calls can complete, and then
 *     COOLDOWN: if a rate-limit rejection arrived less than `cooldown`
 *     ago, sleep out the rest of that window before the next pass.  This
 *     is a global pause -- nothing new starts, even with spare capacity.
 *
 * Concurrency: the loop is an AsyncTimeout on the same EventBase as all
 * Dispatcher completions.  The only suspension points are the WAIT and
 * COOLDOWN timeouts, and the in-flight calls' I/O -- all state changes
 * happen between them, so nothing needs locking.
 *
 * If the JobSource yields a malformed line, or the Dispatcher fails to
 * save a result, the loop stops admitting, waits for the calls already in
 * flight, and then run() rethrows that error.  Jobs waiting for a retry
 * at that point are abandoned.
 */
class AdmissionLoop : public folly::AsyncTimeout {
public:
  enum class State {
    Fetching,
    CapacityCheck,
    Dispatch,
    Wait,
    Cooldown,
    Drained,
  };

  AdmissionLoop(
    folly::EventBase* evb,
    const Config& config,
    JobSource* source,
    RetryQueue* retry_queue,
    StatusTracker* status,
    Dispatcher* dispatcher,
    const CostEstimator* estimator,
    NowFn now = &Clock::now
  );

  /**
   * Runs the EventBase until the loop is DRAINED.  Throws the
   * MalformedInputError or OutputPathError that aborted the run, if any.
   */
  void run();

  /**
   * One pass of steps 1-4, at time `now`.  Returns how long to WAIT
   * before the cooldown check and the next pass, or 0 once DRAINED.
   * Exposed for tests, which drive the loop with synthetic time.
   */
  std::chrono::milliseconds scheduleOnce(TimePoint now);

  /**
   * The COOLDOWN step: how long to pause, at time `now`, before the next
   * pass may admit anything.  Zero if no rate-limit rejection is recent.
   */
  std::chrono::milliseconds cooldownRemaining(TimePoint now) const;

  State state() const { return state_; }
  bool aborted() const { return bool(abortError_); }
  bool holdingJob() const { return bool(held_); }
  const Job* heldJob() const { return held_.get(); }
  // Dispatch attempts started, retries included.
  int64_t numAdmitted() const { return numAdmitted_; }
  const RateBucket& requestBucket() const { return requestBucket_; }
  const RateBucket& costBucket() const { return costBucket_; }

protected:
  void timeoutExpired() noexcept override;

private:
  void fetch();
  JobPtr makeJob(folly::dynamic request);
  bool admissible(TimePoint now) const;
  bool isDrained() const;

  folly::EventBase* const evb_;
  const Config& config_;
  JobSource* const source_;
  RetryQueue* const retryQueue_;
  StatusTracker* const status_;
  Dispatcher* const dispatcher_;
  const CostEstimator* const estimator_;
  NowFn now_;

  RateBucket requestBucket_;
  RateBucket costBucket_;

  State state_{State::Fetching};
  JobPtr held_;
  Job::ID nextJobID_{0};
  int64_t numAdmitted_{0};
  folly::exception_wrapper abortError_;
};

const char* stateName(AdmissionLoop::State state);

}  // namespace batchgate
