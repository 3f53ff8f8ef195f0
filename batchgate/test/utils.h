/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <folly/dynamic.h>
#include <folly/experimental/TestUtil.h>
#include <string>
#include <vector>

#include "batchgate/utils/Time.h"

namespace batchgate {

/**
 * Synthetic time for the scheduler.  Starts at an arbitrary fixed point,
 * and only moves when a test says so.
 */
class FakeClock {
public:
  FakeClock() : now_(TimePoint() + std::chrono::hours(1)) {}

  TimePoint now() const { return now_; }
  void advance(std::chrono::duration<double> d) {
    now_ += std::chrono::duration_cast<Clock::duration>(d);
  }
  NowFn nowFn() { return [this]() { return now_; }; }

private:
  TimePoint now_;
};

inline TimePoint plusSec(TimePoint t, double sec) {
  return t + std::chrono::duration_cast<Clock::duration>(
    std::chrono::duration<double>(sec)
  );
}

// A path inside a temporary directory, as a boost path.
inline boost::filesystem::path pathIn(
    const folly::test::TemporaryDirectory& dir,
    const std::string& name) {
  return boost::filesystem::path(dir.path().string()) / name;
}

void writeLines(
  const boost::filesystem::path& path,
  const std::vector<std::string>& lines
);

// Parses every line of a JSONL file.
std::vector<folly::dynamic> readJsonLines(const boost::filesystem::path& path);

/**
 * Settings for a run that finishes quickly in real time: generous limits,
 * no cooldown, the zero cost estimator.  Callers tweak from here.
 */
folly::dynamic fastConfig(const boost::filesystem::path& requests_path);

}  // namespace batchgate
