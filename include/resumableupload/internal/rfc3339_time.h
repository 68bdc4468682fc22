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

#include "resumableupload/status_or_val.h"
#include <chrono>
#include <string>

namespace rup {
namespace internal {

/**
 * Parses @p timestamp assuming it is in RFC-3339 format.
 *
 * Accepts `YYYY-MM-DD[Tt]HH:MM:SS[.s+](Z|[+-]HH:MM)`. Fractional seconds
 * beyond nanoseconds are dropped.
 *
 * @see https://tools.ietf.org/html/rfc3339
 */
StatusOrVal<std::chrono::system_clock::time_point> ParseRfc3339(std::string const& timestamp);

/**
 * Formats @p tp as a RFC-3339 timestamp in UTC.
 *
 * Always uses `YYYY-MM-DDTHH:MM:SS[.FFF]Z`, with the fractional part printed
 * with millisecond, microsecond or nanosecond digits, whichever is the shortest
 * exact representation.
 */
std::string FormatRfc3339(std::chrono::system_clock::time_point tp);

}  // namespace internal
}  // namespace rup
