/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

namespace batchgate {

// The environment variable consulted when no key is given explicitly.
constexpr const char* kApiKeyEnvVar = "OPENAI_API_KEY";

/**
 * Returns `explicit_key` if non-empty, else the value of $OPENAI_API_KEY,
 * else "" (with a warning, since local & mock endpoints work without one).
 */
std::string resolveApiKey(const std::string& explicit_key);

// The HTTP headers sent with every request.
std::vector<std::string> requestHeaders(const std::string& api_key);

}  // namespace batchgate
