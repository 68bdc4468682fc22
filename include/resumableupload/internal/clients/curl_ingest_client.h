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

#include "resumableupload/internal/curl_handle_factory.h"
#include "resumableupload/internal/curl_request_builder.h"
#include "resumableupload/internal/ingest_client.h"
#include "resumableupload/options.h"
#include <memory>
#include <string>

namespace rup {
namespace internal {

/**
 * Implements `IngestClient` with libcurl, speaking tus 1.0.0.
 *
 * - CreateUpload: `POST` to the endpoint with `Upload-Length` and `Upload-Metadata`.
 * - QueryOffset: `HEAD` of the resource, reads `Upload-Offset`.
 * - TransferChunk: `PATCH` of the resource at `Upload-Offset`.
 * - ReleaseUpload: `DELETE` of the resource (termination extension).
 *
 * Requests are aborted from the libcurl progress callback once the request's
 * cancellation token is cancelled.
 */
class CurlIngestClient : public IngestClient
{
public:
    static std::shared_ptr<CurlIngestClient> Create(Options options);

    explicit CurlIngestClient(Options options);
    ~CurlIngestClient() override = default;

    CurlIngestClient(CurlIngestClient const& rhs) = delete;
    CurlIngestClient(CurlIngestClient&& rhs) = delete;
    CurlIngestClient& operator=(CurlIngestClient const& rhs) = delete;
    CurlIngestClient& operator=(CurlIngestClient&& rhs) = delete;

    Options const& GetOptions() const { return m_options; }

    StatusOrVal<IngestResponse> CreateUpload(CreateUploadRequest const& request) override;
    StatusOrVal<IngestResponse> QueryOffset(QueryOffsetRequest const& request) override;
    StatusOrVal<IngestResponse> TransferChunk(TransferChunkRequest const& request) override;
    StatusOrVal<EmptyResponse> ReleaseUpload(ReleaseUploadRequest const& request) override;

private:
    // Applies the options and the headers common to all tus requests.
    CurlRequestBuilder MakeBuilder(std::string url, std::string method, IngestRequest const& request,
                                   TransferChunkRequest::ProgressCallback progress = {});

    Options m_options;
    std::shared_ptr<CurlHandleFactory> m_factory;
};

}  // namespace internal
}  // namespace rup
