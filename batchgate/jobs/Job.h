/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/Optional.h>
#include <memory>
#include <vector>

namespace batchgate {

/**
 * How one dispatch attempt failed.  All three kinds are retryable; only
 * RateLimit additionally triggers the global cooldown.
 */
enum class FailureKind : unsigned char {
  RateLimit = 0,
  ApiError = 1,
  Transport = 2,
};

const char* failureKindName(FailureKind kind);

struct FailureRecord {
  FailureKind kind;
  // The provider's "error" object for RateLimit / ApiError, the exception
  // message for Transport.
  folly::dynamic error;

  folly::dynamic toDynamic() const;
};

/**
 * One unit of outbound work.  The payload is opaque to the scheduler,
 * except that the cost estimator looks at it once, at creation.
 *
 * A Job is owned by exactly one place at a time -- the scheduler's held
 * slot, a pending dispatch, or the RetryQueue -- and moves between them as
 * a unique_ptr.  It is destroyed once its terminal line is written.
 */
class Job {
public:
  using ID = int64_t;

  // The reserved key that is stripped from the payload and carried through
  // to the output.
  static constexpr const char* kMetadataKey = "metadata";

  /**
   * Takes ownership of a parsed input object.  A non-null "metadata" entry
   * moves out of the payload into metadata(); a null one is just dropped.
   */
  Job(ID id, folly::dynamic request, int max_attempts);

  ID id() const { return id_; }
  const folly::dynamic& payload() const { return payload_; }
  const folly::Optional<folly::dynamic>& metadata() const { return metadata_; }

  double cost() const { return cost_; }
  void setCost(double cost);

  int attemptsRemaining() const { return attemptsRemaining_; }
  // Called at admission, once per dispatch attempt.
  void startAttempt();

  const std::vector<FailureRecord>& errorHistory() const {
    return errorHistory_;
  }
  void recordFailure(FailureRecord record) {
    errorHistory_.emplace_back(std::move(record));
  }

  // [payload, response] or [payload, response, metadata]
  folly::dynamic successLine(folly::dynamic response) const;
  // [payload, [failure records...]] or [payload, [...], metadata]
  folly::dynamic failureLine() const;

private:
  folly::dynamic resultLine(folly::dynamic outcome) const;

  const ID id_;
  folly::dynamic payload_;
  folly::Optional<folly::dynamic> metadata_;
  double cost_{0};
  int attemptsRemaining_;
  std::vector<FailureRecord> errorHistory_;
};

using JobPtr = std::unique_ptr<Job>;

}  // namespace batchgate
