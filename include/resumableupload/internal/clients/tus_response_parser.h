// Copyright 2024 Andrew Karasyov
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

#include "resumableupload/internal/http_response.h"
#include "resumableupload/internal/ingest_requests.h"
#include "resumableupload/status_or_val.h"
#include <string>

namespace rup {
namespace internal {

/**
 * Converts tus responses into `IngestResponse`.
 *
 * Error responses are mapped with `AsStatus()`. A successful response that
 * violates the protocol (a missing or malformed `Location` or `Upload-Offset`
 * header) is reported as `StatusCode::DataLoss`: the client cannot trust its
 * view of the remote resource anymore.
 */
class TusResponseParser
{
public:
    TusResponseParser() = delete;

    /// Expects `201 Created` with a `Location` header.
    static StatusOrVal<IngestResponse> ParseCreateResponse(std::string const& endpoint, HttpResponse const& response);

    /**
     * Expects `200 OK` or `204 No Content` with an `Upload-Offset` header and an
     * optional `Upload-Length` header.
     *
     * 403, 404 and 410 all mean the resource is gone: `StatusCode::NotFound`.
     */
    static StatusOrVal<IngestResponse> ParseQueryResponse(std::string const& resourceHandle,
                                                          HttpResponse const& response);

    /// Expects `204 No Content` with an `Upload-Offset` header, or `409 Conflict`.
    static StatusOrVal<IngestResponse> ParseTransferResponse(std::string const& resourceHandle,
                                                             HttpResponse const& response);
};

}  // namespace internal
}  // namespace rup
