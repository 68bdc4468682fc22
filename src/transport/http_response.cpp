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

#include "resumableupload/internal/http_response.h"
#include <iostream>

namespace rup {
namespace internal {

std::optional<std::string> HttpResponse::Header(std::string const& name) const
{
    auto it = m_headers.find(name);
    if (it == m_headers.end())
        return std::nullopt;
    return it->second;
}

Status AsStatus(HttpResponse const& httpResponse)
{
    auto const code = httpResponse.m_statusCode;
    if (HttpStatusCode::MinContinue <= code && code < HttpStatusCode::MinRedirects)
    {
        // libcurl swallows the 100s, the 200s are successes.
        return Status();
    }

    switch (code)
    {
    case HttpStatusCode::Unauthorized:
        return Status(StatusCode::Unauthenticated, httpResponse.m_payload);
    case HttpStatusCode::Forbidden:
    case HttpStatusCode::MethodNotAllowed:
        return Status(StatusCode::PermissionDenied, httpResponse.m_payload);
    case HttpStatusCode::NotFound:
    case HttpStatusCode::Gone:
        return Status(StatusCode::NotFound, httpResponse.m_payload);
    case HttpStatusCode::Conflict:
        return Status(StatusCode::Aborted, httpResponse.m_payload);
    case HttpStatusCode::PreconditionFailed:
        return Status(StatusCode::FailedPrecondition, httpResponse.m_payload);
    case HttpStatusCode::PayloadTooLarge:
        return Status(StatusCode::OutOfRange, httpResponse.m_payload);
    case HttpStatusCode::RequestTimeout:
    case HttpStatusCode::TooManyRequests:
    case HttpStatusCode::InternalServerError:
    case HttpStatusCode::BadGateway:
    case HttpStatusCode::ServiceUnavailable:
    case HttpStatusCode::GatewayTimeout:
        return Status(StatusCode::Unavailable, httpResponse.m_payload);
    default:
        break;
    }

    if (HttpStatusCode::MinRequestErrors <= code && code < HttpStatusCode::MinInternalErrors)
        return Status(StatusCode::InvalidArgument, httpResponse.m_payload);
    if (HttpStatusCode::MinInternalErrors <= code && code < HttpStatusCode::MinInvalidCode)
        return Status(StatusCode::Internal, httpResponse.m_payload);
    // Redirects are followed by libcurl, seeing one here is as unexpected as
    // a code outside of [100, 600).
    return Status(StatusCode::Unknown, httpResponse.m_payload);
}

std::ostream& operator<<(std::ostream& os, HttpResponse const& rhs)
{
    os << "m_statusCode=" << rhs.m_statusCode << ", {";
    char const* sep = "";
    for (auto const& kv : rhs.m_headers)
    {
        os << sep << kv.first << ": " << kv.second;
        sep = ", ";
    }
    return os << "}, payload=<" << rhs.m_payload << ">";
}

}  // namespace internal
}  // namespace rup
