// Copyright 2024 Andrew Karasyov
//
// Copyright 2018 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <curl/curl.h>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace rup {
namespace internal {

/// Hold a CURL* handle and automatically clean it up.
using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

/// Hold a curl_slist* and automatically clean it up.
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

/// Hold a character string created by CURL use correct deleter.
using CurlString = std::unique_ptr<char, decltype(&curl_free)>;

/// Received headers, keyed by their lower-cased names.
using CurlReceivedHeaders = std::multimap<std::string, std::string>;

/**
 * Parses one header line received by libcurl and appends it to @p receivedHeaders.
 *
 * Lines without a colon (the status line, the empty line ending the headers)
 * are ignored. Header names are case-insensitive, they are stored in lower
 * case, values are stored without the surrounding whitespace.
 *
 * @return @p size, the number of bytes consumed, as libcurl expects.
 */
std::size_t CurlAppendHeaderData(CurlReceivedHeaders& receivedHeaders, char const* data, std::size_t size);

/**
 * Initializes libcurl once per process.
 *
 * `curl_global_init()` is not thread safe, every code path creating handles
 * calls this function first.
 */
void CurlInitializeOnce();

}  // namespace internal
}  // namespace rup
