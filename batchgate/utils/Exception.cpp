/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/utils/Exception.h"

#include <cerrno>
#include <folly/String.h>

namespace batchgate {

std::string strError() {
  const int err = errno;
  return folly::to<std::string>(folly::errnoStr(err), " (errno ", err, ")");
}

}  // namespace batchgate
