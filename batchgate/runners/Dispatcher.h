/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/ExceptionWrapper.h>
#include <folly/Optional.h>
#include <folly/Try.h>
#include <memory>
#include <string>

#include "batchgate/jobs/Job.h"
#include "batchgate/utils/Time.h"

namespace folly { class EventBase; }

namespace batchgate {

class ResultWriter;
class RetryQueue;
class Transport;
struct StatusTracker;

/**
 * Runs one attempt of an admitted job, and decides what happens next:
 *
 *  - success => the response goes to the result log,
 *  - a rate-limit rejection, an API error, or a transport failure =>
 *    the failure joins the job's history, and the job goes back on the
 *    RetryQueue if it has attempts left, or to the result log if not.
 *
 * Only terminal outcomes are logged, each exactly once.  If that write
 * fails, the error is kept in writeError() for the scheduler to abort on.
 *
 * dispatch() returns as soon as the request is sent.  Completions run
 * later, on the EventBase, which is also where the scheduler lives, so
 * none of the shared state needs locking.  The Dispatcher must outlive
 * all its in-flight calls (see numInFlight()).
 */
class Dispatcher {
public:
  Dispatcher(
    folly::EventBase* evb,
    std::shared_ptr<Transport> transport,
    StatusTracker* status,
    RetryQueue* retry_queue,
    ResultWriter* results,
    // A provider "error.message" containing this is a rate-limit rejection.
    std::string rate_limit_signature,
    NowFn now = &Clock::now
  );

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // The job must already be counted as started, and have had its attempt
  // counted via startAttempt().
  void dispatch(JobPtr job);

  size_t numInFlight() const { return numInFlight_; }

  // The first failure to save a terminal outcome, if any.  The job still
  // counts as finished, but the run has lost a result line.
  const folly::exception_wrapper& writeError() const { return writeError_; }

  /**
   * Classifies a finished call: none for success, or the failure record.
   * Public for the unit test.
   */
  static folly::Optional<FailureRecord> classify(
    const folly::Try<folly::dynamic>& result,
    const std::string& rate_limit_signature
  );

private:
  void onComplete(JobPtr job, folly::Try<folly::dynamic>&& result) noexcept;
  void writeResult(const Job& job, const folly::dynamic& line) noexcept;

  folly::EventBase* const evb_;
  std::shared_ptr<Transport> transport_;
  StatusTracker* const status_;
  RetryQueue* const retryQueue_;
  ResultWriter* const results_;
  const std::string rateLimitSignature_;
  NowFn now_;
  size_t numInFlight_{0};
  folly::exception_wrapper writeError_;
};

}  // namespace batchgate
