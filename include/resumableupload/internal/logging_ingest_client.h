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
#include <memory>

namespace rup {
namespace internal {

/**
 * A decorator for `IngestClient` that logs each operation.
 */
class LoggingIngestClient : public IngestClient
{
public:
    explicit LoggingIngestClient(std::shared_ptr<IngestClient> client);
    ~LoggingIngestClient() override = default;

    StatusOrVal<IngestResponse> CreateUpload(CreateUploadRequest const& request) override;
    StatusOrVal<IngestResponse> QueryOffset(QueryOffsetRequest const& request) override;
    StatusOrVal<IngestResponse> TransferChunk(TransferChunkRequest const& request) override;
    StatusOrVal<EmptyResponse> ReleaseUpload(ReleaseUploadRequest const& request) override;

private:
    std::shared_ptr<IngestClient> m_client;
};

}  // namespace internal
}  // namespace rup
