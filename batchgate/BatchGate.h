/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/noncopyable.hpp>
#include <functional>
#include <memory>

#include "batchgate/statuses/StatusTracker.h"
#include "batchgate/utils/Time.h"

namespace folly { class EventBase; }

namespace batchgate {

class Config;
class Transport;

// Makes the transport for a run, bound to the run's EventBase.
using TransportFactory =
  std::function<std::shared_ptr<Transport>(folly::EventBase*)>;

struct RunSummary {
  StatusTracker status;
  // Where the results ended up, after any renaming.  Empty for dry runs.
  boost::filesystem::path resultsPath;
};

/**
 * Runs one batch from start to finish: reads every request in the input
 * file, sends each one (retrying failures) as fast as the rate limits
 * allow, and writes one result line per request.
 *
 * Throws if the run cannot start (missing input, existing output, bad
 * estimator settings), or if it hits a malformed input line -- in that
 * case, the calls already in flight are finished and saved first.
 * Individual request failures never throw; they are saved as results.
 */
class BatchGate : boost::noncopyable {
public:
  BatchGate(
    const Config& config,
    TransportFactory make_transport,
    NowFn now = &Clock::now
  );

  RunSummary run();

private:
  void renameIfFailed(RunSummary* summary) const;
  void logSummary(const RunSummary& summary) const;

  const Config& config_;
  TransportFactory makeTransport_;
  NowFn now_;
};

}  // namespace batchgate
