/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/BatchGate.h"

#include <boost/filesystem.hpp>
#include <folly/io/async/EventBase.h>
#include <folly/json.h>
#include <glog/logging.h>

#include "batchgate/config/Config.h"
#include "batchgate/cost/CostEstimator.h"
#include "batchgate/cost/CostEstimatorRegistry.h"
#include "batchgate/jobs/JobSource.h"
#include "batchgate/jobs/RetryQueue.h"
#include "batchgate/runners/Dispatcher.h"
#include "batchgate/runners/Transport.h"
#include "batchgate/scheduler/AdmissionLoop.h"
#include "batchgate/utils/Exception.h"
#include "batchgate/utils/ResultWriter.h"

namespace batchgate {

BatchGate::BatchGate(
    const Config& config,
    TransportFactory make_transport,
    NowFn now)
  : config_(config),
    makeTransport_(std::move(make_transport)),
    now_(std::move(now)) {
  CHECK(makeTransport_);
}

RunSummary BatchGate::run() {
  RunSummary summary;
  JobSource source(config_.requestsPath);  // Throws if missing
  auto estimator = makeCostEstimator(
    config_.costEstimatorName, config_.requestURL, config_.tokenEncoding
  );

  if (config_.dryRun) {
    if (boost::filesystem::exists(config_.savePath)) {
      throw OutputPathError(folly::to<std::string>(
        "Output file ", config_.savePath.native(), " already exists"
      ));
    }
    LOG(INFO) << "Dry run: would send the requests from "
      << config_.requestsPath.native() << " to " << config_.requestURL
      << ", saving results to " << config_.savePath.native();
    return summary;
  }

  // The declaration order matters: the EventBase must outlive everything
  // with callbacks on it, and the writer must outlive the dispatcher.
  folly::EventBase evb;
  auto transport = makeTransport_(&evb);
  RetryQueue retry_queue;
  ResultWriter writer(config_.savePath);
  Dispatcher dispatcher(
    &evb,
    std::move(transport),
    &summary.status,
    &retry_queue,
    &writer,
    config_.rateLimitSignature,
    now_
  );
  AdmissionLoop loop(
    &evb,
    config_,
    &source,
    &retry_queue,
    &summary.status,
    &dispatcher,
    estimator.get(),
    now_
  );

  LOG(INFO) << "Sending requests from " << config_.requestsPath.native()
    << " to " << config_.requestURL;
  loop.run();
  CHECK(summary.status.invariantHolds());
  writer.close();

  summary.resultsPath = writer.path();
  renameIfFailed(&summary);
  logSummary(summary);
  return summary;
}

void BatchGate::renameIfFailed(RunSummary* summary) const {
  if (!config_.renameOnFailure || summary->status.failed == 0) {
    return;
  }
  auto new_path = withErrorsPath(summary->resultsPath);
  if (boost::filesystem::exists(new_path)) {
    LOG(WARNING) << "Not renaming " << summary->resultsPath.native()
      << " since " << new_path.native() << " already exists";
    return;
  }
  boost::filesystem::rename(summary->resultsPath, new_path);
  summary->resultsPath = new_path;
}

void BatchGate::logSummary(const RunSummary& summary) const {
  const auto& status = summary.status;
  LOG(INFO) << "Parallel processing complete. Results saved to "
    << summary.resultsPath.native();
  if (status.failed > 0) {
    LOG(WARNING) << status.failed << " / " << status.started
      << " requests failed. Errors logged to "
      << summary.resultsPath.native();
  }
  if (status.rateLimitErrors > 0) {
    LOG(WARNING) << status.rateLimitErrors << " rate limit errors "
      << "received. Consider running at a lower rate.";
  }
  VLOG(1) << "Final counters: " << folly::toJson(status.toDynamic());
}

}  // namespace batchgate
