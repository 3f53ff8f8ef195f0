/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/config/Credentials.h"

#include <cstdlib>
#include <folly/Conv.h>
#include <glog/logging.h>

namespace batchgate {

std::string resolveApiKey(const std::string& explicit_key) {
  if (!explicit_key.empty()) {
    return explicit_key;
  }
  if (const char* env = std::getenv(kApiKeyEnvVar)) {
    if (*env) {
      return env;
    }
  }
  LOG(WARNING) << "No API key given, and " << kApiKeyEnvVar << " is unset. "
    << "Sending requests without an Authorization header.";
  return "";
}

std::vector<std::string> requestHeaders(const std::string& api_key) {
  std::vector<std::string> headers{"Content-Type: application/json"};
  if (!api_key.empty()) {
    headers.emplace_back(folly::to<std::string>(
      "Authorization: Bearer ", api_key
    ));
  }
  return headers;
}

}  // namespace batchgate
