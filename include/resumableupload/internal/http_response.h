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

#include "resumableupload/status.h"
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace rup {
namespace internal {

enum HttpStatusCode
{
    MinContinue = 100,
    MinSuccess = 200,
    MinRedirects = 300,
    MinRequestErrors = 400,
    MinInternalErrors = 500,
    MinInvalidCode = 600,

    Ok = 200,
    Created = 201,
    NoContent = 204,

    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    // The offset of a PATCH does not match the offset of the resource.
    Conflict = 409,
    Gone = 410,
    // The server does not support the requested protocol version.
    PreconditionFailed = 412,
    PayloadTooLarge = 413,
    UnsupportedMediaType = 415,
    TooManyRequests = 429,

    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/**
 * Contains the results of a HTTP request.
 *
 * Header names are stored in lower case, libcurl delivers them as received.
 */
struct HttpResponse
{
    long m_statusCode = 0;
    std::string m_payload;
    std::multimap<std::string, std::string> m_headers;

    /// The first value of header @p name (lower case), if any.
    std::optional<std::string> Header(std::string const& name) const;
};

/**
 * Maps a HTTP response to a `Status`.
 *
 * The mapping decides whether a failed request is retried:
 * - [100,300) -> Ok.
 * - 408, 429, 500, 502, 503, 504 -> Unavailable, the request may succeed later.
 * - 404, 410 -> NotFound, the remote resource is gone.
 * - 409 -> Aborted, the client and the server disagree about the offset.
 * - 401 -> Unauthenticated, 403 and 405 -> PermissionDenied.
 * - 412 -> FailedPrecondition, 413 -> OutOfRange.
 * - other [400,500) -> InvalidArgument, other [500,600) -> Internal.
 * - anything else -> Unknown.
 *
 * @return A status with the code corresponding to @p httpResponse.m_statusCode,
 *     the error message in the status is initialized with
 *     @p httpResponse.m_payload.
 */
Status AsStatus(HttpResponse const& httpResponse);

std::ostream& operator<<(std::ostream& os, HttpResponse const& rhs);

}  // namespace internal
}  // namespace rup
