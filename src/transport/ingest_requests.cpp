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

#include "resumableupload/internal/ingest_requests.h"
#include <iostream>

namespace rup {
namespace internal {

std::ostream& operator<<(std::ostream& os, CreateUploadRequest const& r)
{
    os << "CreateUploadRequest={endpoint=" << r.GetEndpoint() << ", totalBytes=" << r.GetTotalBytes()
       << ", metadata={";
    char const* sep = "";
    for (auto const& kv : r.GetMetadata())
    {
        os << sep << kv.first << "=" << kv.second;
        sep = ", ";
    }
    return os << "}}";
}

std::ostream& operator<<(std::ostream& os, QueryOffsetRequest const& r)
{
    return os << "QueryOffsetRequest={resourceHandle=" << r.GetResourceHandle() << "}";
}

std::ostream& operator<<(std::ostream& os, TransferChunkRequest const& r)
{
    return os << "TransferChunkRequest={resourceHandle=" << r.GetResourceHandle() << ", offset=" << r.GetOffset()
              << ", payloadSize=" << r.GetPayloadSize() << "}";
}

std::ostream& operator<<(std::ostream& os, ReleaseUploadRequest const& r)
{
    return os << "ReleaseUploadRequest={resourceHandle=" << r.GetResourceHandle() << "}";
}

bool operator==(IngestResponse const& lhs, IngestResponse const& rhs)
{
    return lhs.m_resourceHandle == rhs.m_resourceHandle && lhs.m_committedBytes == rhs.m_committedBytes &&
           lhs.m_totalBytes == rhs.m_totalBytes && lhs.m_offsetState == rhs.m_offsetState;
}

bool operator!=(IngestResponse const& lhs, IngestResponse const& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& os, IngestResponse const& r)
{
    os << "IngestResponse={resourceHandle=" << r.m_resourceHandle << ", committedBytes=" << r.m_committedBytes
       << ", totalBytes=";
    if (r.m_totalBytes)
        os << *r.m_totalBytes;
    else
        os << "{}";
    return os << ", offsetState="
              << (r.m_offsetState == IngestResponse::OffsetState::Conflict ? "CONFLICT" : "COMMITTED") << "}";
}

std::ostream& operator<<(std::ostream& os, EmptyResponse const&) { return os << "EmptyResponse={}"; }

}  // namespace internal
}  // namespace rup
