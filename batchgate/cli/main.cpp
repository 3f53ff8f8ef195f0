/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/filesystem.hpp>
#include <folly/FileUtil.h>
#include <folly/experimental/AutoTimer.h>
#include <folly/init/Init.h>
#include <folly/json.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "batchgate/BatchGate.h"
#include "batchgate/config/Config.h"
#include "batchgate/config/Credentials.h"
#include "batchgate/cost/CostEstimatorRegistry.h"
#include "batchgate/runners/CurlTransport.h"
#include "batchgate/utils/Exception.h"

DEFINE_string(
  config_file, "",
  "JSON object with any of the settings below; flags given on the command "
  "line override it"
);
DEFINE_string(requests_filepath, "", "JSONL file with one request per line");
DEFINE_string(
  save_filepath, "",
  "Where to write the results; defaults to <requests>_results.jsonl"
);
DEFINE_string(
  request_url, "https://api.openai.com/v1/embeddings",
  "The endpoint that receives every request"
);
DEFINE_double(
  max_requests_per_period, 3500 * 0.75,
  "Send at most this many requests per --request_period_sec"
);
DEFINE_double(request_period_sec, 60, "See --max_requests_per_period");
DEFINE_double(
  max_cost_per_period, 90000 * 0.75,
  "Send at most this much estimated cost (e.g. tokens) per "
  "--cost_period_sec"
);
DEFINE_double(cost_period_sec, 60, "See --max_cost_per_period");
DEFINE_int32(max_attempts, 5, "Give up on a request after this many tries");
DEFINE_double(
  cooldown_sec, 15,
  "After a rate limit error, start no new requests for this long"
);
DEFINE_int32(loop_sleep_ms, 1, "Pause between scheduler iterations");
DEFINE_string(
  cost_estimator, "openai",
  "How to estimate request cost: 'openai' counts tokens, 'zero' disables "
  "the cost limit"
);
DEFINE_string(
  token_encoding, "cl100k_base",
  "Token encoding for the 'openai' cost estimator"
);
DEFINE_string(
  rate_limit_signature, "Rate limit",
  "An API error whose message contains this is a rate limit error"
);
DEFINE_bool(
  rename_on_failure, true,
  "If any request fails, rename the results to *_with_errors.jsonl"
);
DEFINE_bool(
  dry_run, false,
  "Check the settings and the input file, but send nothing"
);
DEFINE_string(
  api_key, "",
  "Sent as a bearer token; if empty, read from $OPENAI_API_KEY"
);
DEFINE_int32(
  request_timeout_ms, 0,
  "Fail an individual request after this long; 0 means no deadline"
);
DEFINE_bool(log_performance, false, "Log how long the whole run took");

using namespace std;
using namespace batchgate;

namespace {

bool isSet(const char* flag) {
  return !gflags::GetCommandLineFlagInfoOrDie(flag).is_default;
}

// A flag overrides the config file if it was given explicitly, or if the
// file does not have the key.
template <typename T>
void mergeFlag(folly::dynamic* d, folly::StringPiece key, const T& value) {
  auto name = key.str();
  if (isSet(name.c_str()) || !d->count(name)) {
    (*d)[name] = value;
  }
}

folly::dynamic loadSettings() {
  folly::dynamic d = folly::dynamic::object;
  if (!FLAGS_config_file.empty()) {
    std::string contents;
    if (!folly::readFile(FLAGS_config_file.c_str(), contents)) {
      throw BatchGateException(
        "Cannot read config file ", FLAGS_config_file, ": ", strError()
      );
    }
    d = folly::parseJson(contents);
    if (!d.isObject()) {
      throw BatchGateException(
        "Config file ", FLAGS_config_file, " must contain a JSON object"
      );
    }
  }
  if (!FLAGS_requests_filepath.empty()) {
    mergeFlag(&d, kRequestsFilepath, FLAGS_requests_filepath);
  }
  if (!FLAGS_save_filepath.empty()) {
    mergeFlag(&d, kSaveFilepath, FLAGS_save_filepath);
  }
  mergeFlag(&d, kRequestURL, FLAGS_request_url);
  mergeFlag(&d, kMaxRequestsPerPeriod, FLAGS_max_requests_per_period);
  mergeFlag(&d, kRequestPeriodSec, FLAGS_request_period_sec);
  mergeFlag(&d, kMaxCostPerPeriod, FLAGS_max_cost_per_period);
  mergeFlag(&d, kCostPeriodSec, FLAGS_cost_period_sec);
  mergeFlag(&d, kMaxAttempts, FLAGS_max_attempts);
  mergeFlag(&d, kCooldownSec, FLAGS_cooldown_sec);
  mergeFlag(&d, kLoopSleepMs, FLAGS_loop_sleep_ms);
  mergeFlag(&d, kCostEstimator, FLAGS_cost_estimator);
  mergeFlag(&d, kTokenEncoding, FLAGS_token_encoding);
  mergeFlag(&d, kRateLimitSignature, FLAGS_rate_limit_signature);
  mergeFlag(&d, kRenameOnFailure, FLAGS_rename_on_failure);
  mergeFlag(&d, kDryRun, FLAGS_dry_run);
  return d;
}

int runBatch() {
  registerDefaultCostEstimators();
  Config config(loadSettings());
  VLOG(1) << "Config: " << folly::toJson(config.toDynamic());

  auto headers = requestHeaders(resolveApiKey(FLAGS_api_key));
  auto timeout = std::chrono::milliseconds(FLAGS_request_timeout_ms);
  BatchGate batch_gate(
    config,
    [&config, &headers, timeout](folly::EventBase* evb) {
      return std::make_shared<CurlTransport>(
        evb, config.requestURL, headers, timeout
      );
    }
  );

  folly::AutoTimer<> timer;
  auto summary = batch_gate.run();
  if (FLAGS_log_performance) {
    timer.log("Sent ", summary.status.started, " requests");
  }
  return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  FLAGS_logtostderr = 1;
  folly::init(&argc, &argv);

  try {
    return runBatch();
  } catch (const std::exception& ex) {
    LOG(ERROR) << ex.what();
    return 1;
  }
}
