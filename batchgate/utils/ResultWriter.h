/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <folly/dynamic.h>
#include <folly/File.h>

namespace batchgate {

/**
 * The append-only JSONL file receiving one line per terminal job outcome.
 * It is opened once per run, and refuses to open a file that already
 * exists, so results from two runs are never interleaved.
 *
 * Each write() is a single write(2) of the whole line, so a crash leaves
 * at most one truncated line at the end.  Not thread-safe: all writes come
 * from the scheduler's EventBase.
 */
class ResultWriter {
public:
  // Creates missing parent directories.  Throws OutputPathError if the
  // file exists or cannot be created.
  explicit ResultWriter(const boost::filesystem::path& path);

  ResultWriter(const ResultWriter&) = delete;
  ResultWriter& operator=(const ResultWriter&) = delete;

  // Throws OutputPathError if the line cannot be written, or after close().
  void write(const folly::dynamic& line);

  const boost::filesystem::path& path() const { return path_; }
  size_t linesWritten() const { return linesWritten_; }

  // Closes the file.  Idempotent.
  void close();

private:
  boost::filesystem::path path_;
  folly::File file_;
  size_t linesWritten_{0};
};

// "dir/reqs.jsonl" => "dir/reqs_results.jsonl"
boost::filesystem::path defaultResultsPath(
  const boost::filesystem::path& requests_path
);

// "dir/reqs_results.jsonl" => "dir/reqs_results_with_errors.jsonl"
boost::filesystem::path withErrorsPath(const boost::filesystem::path& path);

}  // namespace batchgate
