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

#include "resumableupload/internal/ingest_client.h"
#include <gmock/gmock.h>

namespace rup {
namespace internal {

class MockIngestClient : public IngestClient
{
public:
    MOCK_METHOD(StatusOrVal<IngestResponse>, CreateUpload, (CreateUploadRequest const&), (override));
    MOCK_METHOD(StatusOrVal<IngestResponse>, QueryOffset, (QueryOffsetRequest const&), (override));
    MOCK_METHOD(StatusOrVal<IngestResponse>, TransferChunk, (TransferChunkRequest const&), (override));
    MOCK_METHOD(StatusOrVal<EmptyResponse>, ReleaseUpload, (ReleaseUploadRequest const&), (override));
};

inline IngestResponse CreatedAt(std::string handle)
{
    IngestResponse response;
    response.m_resourceHandle = std::move(handle);
    return response;
}

inline IngestResponse CommittedAt(std::uint64_t offset)
{
    IngestResponse response;
    response.m_committedBytes = offset;
    return response;
}

inline IngestResponse OffsetConflict()
{
    IngestResponse response;
    response.m_offsetState = IngestResponse::OffsetState::Conflict;
    return response;
}

}  // namespace internal
}  // namespace rup
