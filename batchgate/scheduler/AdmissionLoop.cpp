/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/scheduler/AdmissionLoop.h"

#include <folly/io/async/EventBase.h>
#include <glog/logging.h>

#include "batchgate/config/Config.h"
#include "batchgate/cost/CostEstimator.h"
#include "batchgate/jobs/JobSource.h"
#include "batchgate/jobs/RetryQueue.h"
#include "batchgate/runners/Dispatcher.h"
#include "batchgate/statuses/StatusTracker.h"
#include "batchgate/utils/Exception.h"

namespace batchgate {

namespace {
  // One request per admission.
  const RateBucket::Quota kRequestUnits = 1;
}

const char* stateName(AdmissionLoop::State state) {
  switch (state) {
    case AdmissionLoop::State::Fetching:
      return "FETCHING";
    case AdmissionLoop::State::CapacityCheck:
      return "CAPACITY_CHECK";
    case AdmissionLoop::State::Dispatch:
      return "DISPATCH";
    case AdmissionLoop::State::Wait:
      return "WAIT";
    case AdmissionLoop::State::Cooldown:
      return "COOLDOWN";
    case AdmissionLoop::State::Drained:
      return "DRAINED";
  }
  LOG(FATAL) << "Unknown state " << static_cast<int>(state);
  return "";  // Not reached
}

AdmissionLoop::AdmissionLoop(
    folly::EventBase* evb,
    const Config& config,
    JobSource* source,
    RetryQueue* retry_queue,
    StatusTracker* status,
    Dispatcher* dispatcher,
    const CostEstimator* estimator,
    NowFn now)
  : AsyncTimeout(evb),
    evb_(evb),
    config_(config),
    source_(source),
    retryQueue_(retry_queue),
    status_(status),
    dispatcher_(dispatcher),
    estimator_(estimator),
    now_(std::move(now)),
    requestBucket_(config.maxRequestsPerPeriod, config.requestPeriod, now_()),
    costBucket_(config.maxCostPerPeriod, config.costPeriod, now_()) {
  CHECK(source_);
  CHECK(retryQueue_);
  CHECK(status_);
  CHECK(dispatcher_);
  CHECK(estimator_);
}

void AdmissionLoop::run() {
  CHECK(state_ != State::Drained) << "A run cannot be restarted";
  scheduleTimeout(0);
  evb_->loopForever();
  CHECK(state_ == State::Drained);
  if (abortError_) {
    abortError_.throw_exception();
  }
}

std::chrono::milliseconds AdmissionLoop::scheduleOnce(TimePoint now) {
  CHECK(state_ != State::Drained);

  state_ = State::Fetching;
  if (!abortError_ && dispatcher_->writeError()) {
    LOG(ERROR) << "Aborting the run: " << dispatcher_->writeError().what()
      << ". Waiting for " << dispatcher_->numInFlight() << " requests in "
      << "flight.";
    abortError_ = dispatcher_->writeError();
  }
  if (!held_ && !abortError_) {
    try {
      fetch();
    } catch (const MalformedInputError& ex) {
      LOG(ERROR) << "Aborting the run: " << ex.what() << ". Waiting for "
        << dispatcher_->numInFlight() << " requests in flight, and giving "
        << "up on " << retryQueue_->size() << " waiting to be retried.";
      abortError_ = folly::exception_wrapper(std::current_exception());
    }
  }

  state_ = State::CapacityCheck;
  requestBucket_.refill(now);
  costBucket_.refill(now);

  if (held_ && admissible(now)) {
    state_ = State::Dispatch;
    requestBucket_.consume(kRequestUnits);
    costBucket_.consume(held_->cost());
    held_->startAttempt();
    ++numAdmitted_;
    dispatcher_->dispatch(std::move(held_));
  } else if (held_) {
    VLOG(1) << "Request #" << held_->id() << " waits for capacity: requests "
      << requestBucket_.capacity() << ", cost " << costBucket_.capacity()
      << " of " << held_->cost();
  }

  if (isDrained()) {
    state_ = State::Drained;
    return std::chrono::milliseconds(0);
  }
  state_ = State::Wait;
  return config_.loopSleep;
}

std::chrono::milliseconds AdmissionLoop::cooldownRemaining(
    TimePoint now) const {
  return ceilMs(status_->cooldownRemaining(now, config_.cooldown));
}

void AdmissionLoop::fetch() {
  held_ = retryQueue_->pop();
  if (held_) {
    VLOG(1) << "Retrying request #" << held_->id() << ", "
      << held_->attemptsRemaining() << " attempts left";
    return;
  }
  if (source_->exhausted()) {
    return;
  }
  if (auto request = source_->next()) {
    held_ = makeJob(std::move(*request));
    status_->recordStarted();
    VLOG(1) << "Read request #" << held_->id() << " from line "
      << source_->lineNumber() << ", cost " << held_->cost();
  }
}

JobPtr AdmissionLoop::makeJob(folly::dynamic request) {
  auto job = std::make_unique<Job>(
    nextJobID_, std::move(request), config_.maxAttempts
  );
  try {
    job->setCost(estimator_->estimate(job->payload()));
  } catch (const std::exception& ex) {
    throw MalformedInputError(
      source_->lineNumber(),
      folly::to<std::string>("cannot estimate cost: ", ex.what())
    );
  }
  // Such a job would wait for capacity forever, stalling everything
  // queued behind it.
  if (job->cost() > costBucket_.limit()) {
    throw MalformedInputError(source_->lineNumber(), folly::to<std::string>(
      "cost ", job->cost(), " exceeds the limit of ", costBucket_.limit(),
      " per period, so it could never be sent"
    ));
  }
  ++nextJobID_;
  return job;
}

bool AdmissionLoop::admissible(TimePoint now) const {
  return !abortError_
    && !status_->inCooldown(now, config_.cooldown)
    && requestBucket_.canConsume(kRequestUnits)
    && costBucket_.canConsume(held_->cost());
}

bool AdmissionLoop::isDrained() const {
  if (abortError_) {
    return dispatcher_->numInFlight() == 0;
  }
  return !held_
    && source_->exhausted()
    && retryQueue_->empty()
    && status_->inProgress == 0;
}

void AdmissionLoop::timeoutExpired() noexcept {
  const auto now = now_();
  if (state_ == State::Wait) {
    auto cooldown = cooldownRemaining(now);
    if (cooldown.count() > 0) {
      state_ = State::Cooldown;
      LOG(WARNING) << "Pausing for " << cooldown.count() << " ms to cool "
        << "down after a rate limit error";
      scheduleTimeout(cooldown);
      return;
    }
  }
  auto wait = scheduleOnce(now);
  if (state_ == State::Drained) {
    evb_->terminateLoopSoon();
    return;
  }
  scheduleTimeout(wait);
}

}  // namespace batchgate
