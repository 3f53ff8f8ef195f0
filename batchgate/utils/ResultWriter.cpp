/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/utils/ResultWriter.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <fcntl.h>
#include <folly/FileUtil.h>
#include <folly/json.h>
#include <glog/logging.h>

#include "batchgate/utils/Exception.h"

namespace batchgate {

namespace {
  const std::string kJsonlSuffix = ".jsonl";

  folly::File createExclusive(const boost::filesystem::path& path) {
    if (boost::filesystem::exists(path)) {
      throw OutputPathError(folly::to<std::string>(
        "Results file ", path.native(), " already exists. Please delete it "
        "or choose a different save path."
      ));
    }
    try {
      auto dir = path.parent_path();
      if (!dir.empty()) {
        boost::filesystem::create_directories(dir);
      }
    } catch (const boost::filesystem::filesystem_error& ex) {
      throw OutputPathError(folly::to<std::string>(
        "Cannot create the directory for results file ", path.native(), ": ",
        ex.what()
      ));
    }
    // O_EXCL also catches a file that appeared after the check above.
    int fd = ::open(
      path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC, 0644
    );
    if (fd == -1) {
      throw OutputPathError(folly::to<std::string>(
        "Cannot create results file ", path.native(), ": ", strError()
      ));
    }
    return folly::File(fd, /*ownsFd=*/ true);
  }
}  // anonymous namespace

ResultWriter::ResultWriter(const boost::filesystem::path& path)
  : path_(path), file_(createExclusive(path)) {
  LOG(INFO) << "Writing results to " << path_.native();
}

void ResultWriter::write(const folly::dynamic& line) {
  if (!file_) {
    throw OutputPathError(folly::to<std::string>(
      "Results file ", path_.native(), " is already closed"
    ));
  }
  auto s = folly::toJson(line);
  s.push_back('\n');
  if (folly::writeFull(file_.fd(), s.data(), s.size()) == -1) {
    throw OutputPathError(folly::to<std::string>(
      "Cannot write to results file ", path_.native(), ": ", strError()
    ));
  }
  ++linesWritten_;
}

void ResultWriter::close() {
  if (file_) {
    file_.close();
  }
}

boost::filesystem::path defaultResultsPath(
    const boost::filesystem::path& requests_path) {
  auto s = requests_path.native();
  if (boost::ends_with(s, kJsonlSuffix)) {
    s.resize(s.size() - kJsonlSuffix.size());
  }
  return boost::filesystem::path(s + "_results" + kJsonlSuffix);
}

boost::filesystem::path withErrorsPath(const boost::filesystem::path& path) {
  auto s = path.native();
  if (boost::ends_with(s, kJsonlSuffix)) {
    s.resize(s.size() - kJsonlSuffix.size());
  }
  return boost::filesystem::path(s + "_with_errors" + kJsonlSuffix);
}

}  // namespace batchgate
