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

#include "resumableupload/internal/ingest_requests.h"
#include "resumableupload/status_or_val.h"

namespace rup {
namespace internal {

/**
 * Defines the interface of the remote ingest endpoint.
 *
 * The four calls are the whole conversation of an upload: create the remote
 * resource once, then query its durable offset and append windows at that
 * offset until it is complete, or release it.
 *
 * Implementations report transport and HTTP failures through the returned
 * status, using the codes of `AsStatus()`. They never retry, retries are the
 * engine's decision.
 */
class IngestClient
{
public:
    virtual ~IngestClient() = default;

    /// Returns the handle of the new resource, `m_committedBytes` is zero.
    virtual StatusOrVal<IngestResponse> CreateUpload(CreateUploadRequest const& request) = 0;

    /**
     * Returns the durable offset of the resource.
     *
     * @return `StatusCode::NotFound` when the resource does not exist anymore.
     */
    virtual StatusOrVal<IngestResponse> QueryOffset(QueryOffsetRequest const& request) = 0;

    /**
     * Appends the payload at the request offset.
     *
     * @return the new durable offset, or `OffsetState::Conflict` when the
     *     request offset does not match the server offset.
     */
    virtual StatusOrVal<IngestResponse> TransferChunk(TransferChunkRequest const& request) = 0;

    virtual StatusOrVal<EmptyResponse> ReleaseUpload(ReleaseUploadRequest const& request) = 0;
};

}  // namespace internal
}  // namespace rup
