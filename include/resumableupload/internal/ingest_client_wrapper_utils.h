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

#include "resumableupload/internal/ingest_client.h"
#include <type_traits>

namespace rup {
namespace internal {
/**
 * Defines types to wrap `IngestClient` function calls.
 *
 * Decorators of `IngestClient` (e.g. `LoggingIngestClient`) wrap every member
 * function with the same additional behavior. Instead of hand-coding every
 * wrapped function we use a helper to wrap it, and in turn those helpers use
 * the meta-functions defined here.
 */

/**
 * Metafunction to determine if @p F is a pointer to member function with the
 * expected signature for an `IngestClient` member function.
 *
 * This is the generic case, where the type does not match the expected
 * signature and so member type aliases do not exist.
 *
 * @tparam F the type to check against the expected signature.
 */
template <typename F>
struct Signature
{
};

/**
 * Partial specialization for the above `Signature` metafunction.
 *
 * This is the case where the type actually matches the expected signature. The
 * class also extracts the request and response types of the call.
 *
 * @tparam Request the request type.
 * @tparam Response the response type.
 */
template <typename Request, typename Response>
struct Signature<StatusOrVal<Response> (IngestClient::*)(Request const&)>
{
    using RequestType = Request;
    using ReturnType = StatusOrVal<Response>;
};

}  // namespace internal
}  // namespace rup
