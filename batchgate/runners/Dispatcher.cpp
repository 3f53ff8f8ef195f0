/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/runners/Dispatcher.h"

#include <folly/io/async/EventBase.h>
#include <folly/json.h>
#include <glog/logging.h>

#include "batchgate/jobs/RetryQueue.h"
#include "batchgate/runners/Transport.h"
#include "batchgate/statuses/StatusTracker.h"
#include "batchgate/utils/ResultWriter.h"

namespace batchgate {

namespace {
const char* kErrorKey = "error";
const char* kMessageKey = "message";
}  // anonymous namespace

Dispatcher::Dispatcher(
    folly::EventBase* evb,
    std::shared_ptr<Transport> transport,
    StatusTracker* status,
    RetryQueue* retry_queue,
    ResultWriter* results,
    std::string rate_limit_signature,
    NowFn now)
  : evb_(evb),
    transport_(std::move(transport)),
    status_(status),
    retryQueue_(retry_queue),
    results_(results),
    rateLimitSignature_(std::move(rate_limit_signature)),
    now_(std::move(now)) {
  CHECK(evb_);
  CHECK(transport_);
}

void Dispatcher::dispatch(JobPtr job) {
  CHECK(job);
  LOG(INFO) << "Starting request #" << job->id();
  if (job->metadata().has_value()) {
    VLOG(1) << "Request #" << job->id() << " metadata: "
      << folly::toJson(*job->metadata());
  }
  ++numInFlight_;
  // A transport that throws instead of failing the future is still just a
  // transport failure for this one job.
  auto transport = transport_;
  const auto& payload = job->payload();
  folly::makeSemiFutureWith([&transport, &payload]() {
    return transport->post(payload);
  })
    .via(evb_)
    .thenTry([this, job = std::move(job)](
        folly::Try<folly::dynamic>&& result) mutable noexcept {
      --numInFlight_;
      onComplete(std::move(job), std::move(result));
    });
}

folly::Optional<FailureRecord> Dispatcher::classify(
    const folly::Try<folly::dynamic>& result,
    const std::string& rate_limit_signature) {
  if (result.hasException()) {
    return FailureRecord{
      FailureKind::Transport,
      folly::to<std::string>(result.exception().what())
    };
  }
  const auto& response = result.value();
  auto* error = response.isObject() ? response.get_ptr(kErrorKey) : nullptr;
  if (!error) {
    return folly::none;
  }
  folly::StringPiece message;
  if (error->isString()) {
    message = error->stringPiece();
  } else if (error->isObject()) {
    auto* m = error->get_ptr(kMessageKey);
    if (m && m->isString()) {
      message = m->stringPiece();
    }
  }
  const bool is_rate_limit = !rate_limit_signature.empty()
    && message.find(rate_limit_signature) != folly::StringPiece::npos;
  return FailureRecord{
    is_rate_limit ? FailureKind::RateLimit : FailureKind::ApiError,
    *error
  };
}

void Dispatcher::onComplete(
    JobPtr job,
    folly::Try<folly::dynamic>&& result) noexcept {
  auto failure = classify(result, rateLimitSignature_);
  if (!failure.has_value()) {
    writeResult(*job, job->successLine(std::move(result.value())));
    status_->recordSucceeded();
    VLOG(1) << "Request #" << job->id() << " saved to "
      << results_->path().native();
    return;  // The job is done, and destroyed here.
  }

  LOG(WARNING) << "Request #" << job->id() << " failed with "
    << failureKindName(failure->kind) << " error "
    << folly::toJson(failure->error);
  status_->recordAttemptFailure(failure->kind, now_());
  job->recordFailure(std::move(*failure));

  if (job->attemptsRemaining() > 0) {
    retryQueue_->push(std::move(job));
    return;
  }
  LOG(ERROR) << "Request #" << job->id() << " "
    << folly::toJson(job->payload()) << " failed after all attempts, "
    << "saving its " << job->errorHistory().size() << " errors";
  writeResult(*job, job->failureLine());
  status_->recordFailed();
}

void Dispatcher::writeResult(
    const Job& job,
    const folly::dynamic& line) noexcept {
  try {
    results_->write(line);
  } catch (const std::exception& ex) {
    // The result is at least in the log, but the run must fail.
    LOG(ERROR) << "Failed to save the result of request #" << job.id()
      << ": " << ex.what() << ", result: " << folly::toJson(line);
    if (!writeError_) {
      writeError_ = folly::exception_wrapper(std::current_exception());
    }
  }
}

}  // namespace batchgate
