/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <deque>
#include <glog/logging.h>

#include "batchgate/jobs/Job.h"

namespace batchgate {

/**
 * Jobs waiting for another attempt, in the order their attempts failed.
 * Unbounded, and always drained before new jobs are read, which is all the
 * starvation protection retries need.
 *
 * Not thread-safe; lives on the scheduler's EventBase.
 */
class RetryQueue {
public:
  void push(JobPtr job) {
    CHECK(job);
    jobs_.emplace_back(std::move(job));
  }

  // nullptr when empty
  JobPtr pop() {
    if (jobs_.empty()) {
      return nullptr;
    }
    auto job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
  }

  bool empty() const { return jobs_.empty(); }
  size_t size() const { return jobs_.size(); }

  // Hands every waiting job back to the caller, e.g. when a run aborts.
  std::deque<JobPtr> drain() {
    std::deque<JobPtr> jobs;
    jobs.swap(jobs_);
    return jobs;
  }

private:
  std::deque<JobPtr> jobs_;
};

}  // namespace batchgate
