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

#include "resumableupload/internal/cancellation_token.h"
#include "resumableupload/upload_session.h"
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace rup {
namespace internal {

/**
 * Common state of all the requests sent to the ingest endpoint.
 *
 * A request without a cancellation token cannot be aborted.
 */
class IngestRequest
{
public:
    std::shared_ptr<CancellationToken> const& GetCancellationToken() const { return m_cancellationToken; }
    void SetCancellationToken(std::shared_ptr<CancellationToken> token) { m_cancellationToken = std::move(token); }

    bool IsCancelled() const { return m_cancellationToken && m_cancellationToken->IsCancelled(); }

protected:
    IngestRequest() = default;
    ~IngestRequest() = default;

private:
    std::shared_ptr<CancellationToken> m_cancellationToken;
};

/**
 * A request to create the remote resource of a new upload.
 */
class CreateUploadRequest : public IngestRequest
{
public:
    CreateUploadRequest() = default;
    CreateUploadRequest(std::string endpoint, std::uint64_t totalBytes, UploadMetadata metadata)
        : m_endpoint(std::move(endpoint)), m_totalBytes(totalBytes), m_metadata(std::move(metadata))
    {
    }

    std::string const& GetEndpoint() const { return m_endpoint; }
    std::uint64_t GetTotalBytes() const { return m_totalBytes; }
    UploadMetadata const& GetMetadata() const { return m_metadata; }

private:
    std::string m_endpoint;
    std::uint64_t m_totalBytes = 0;
    UploadMetadata m_metadata;
};

std::ostream& operator<<(std::ostream& os, CreateUploadRequest const& r);

/**
 * A request for the number of bytes the server durably stored.
 */
class QueryOffsetRequest : public IngestRequest
{
public:
    QueryOffsetRequest() = default;
    explicit QueryOffsetRequest(std::string resourceHandle) : m_resourceHandle(std::move(resourceHandle)) {}

    std::string const& GetResourceHandle() const { return m_resourceHandle; }

private:
    std::string m_resourceHandle;
};

std::ostream& operator<<(std::ostream& os, QueryOffsetRequest const& r);

/**
 * A request to append one window of the source at a given offset.
 */
class TransferChunkRequest : public IngestRequest
{
public:
    /// Receives the number of payload bytes sent so far.
    using ProgressCallback = std::function<void(std::uint64_t bytesSent)>;

    TransferChunkRequest() = default;
    TransferChunkRequest(std::string resourceHandle, std::uint64_t offset, std::string payload)
        : m_resourceHandle(std::move(resourceHandle)), m_offset(offset), m_payload(std::move(payload))
    {
    }

    std::string const& GetResourceHandle() const { return m_resourceHandle; }
    std::uint64_t GetOffset() const { return m_offset; }
    std::string const& GetPayload() const { return m_payload; }
    std::size_t GetPayloadSize() const { return m_payload.size(); }

    ProgressCallback const& GetProgressCallback() const { return m_progressCallback; }
    void SetProgressCallback(ProgressCallback callback) { m_progressCallback = std::move(callback); }

private:
    std::string m_resourceHandle;
    std::uint64_t m_offset = 0;
    std::string m_payload;
    ProgressCallback m_progressCallback;
};

std::ostream& operator<<(std::ostream& os, TransferChunkRequest const& r);

/**
 * A request to terminate an upload and free its remote resource.
 */
class ReleaseUploadRequest : public IngestRequest
{
public:
    ReleaseUploadRequest() = default;
    explicit ReleaseUploadRequest(std::string resourceHandle) : m_resourceHandle(std::move(resourceHandle)) {}

    std::string const& GetResourceHandle() const { return m_resourceHandle; }

private:
    std::string m_resourceHandle;
};

std::ostream& operator<<(std::ostream& os, ReleaseUploadRequest const& r);

/**
 * The answer of the ingest endpoint to a create, query or transfer request.
 */
struct IngestResponse
{
    enum class OffsetState
    {
        // m_committedBytes holds the server offset.
        Committed,
        // The transfer offset did not match the server offset, it is unknown
        // until queried.
        Conflict,
    };

    std::string m_resourceHandle;
    std::uint64_t m_committedBytes = 0;
    std::optional<std::uint64_t> m_totalBytes;
    OffsetState m_offsetState = OffsetState::Committed;
};

bool operator==(IngestResponse const& lhs, IngestResponse const& rhs);
bool operator!=(IngestResponse const& lhs, IngestResponse const& rhs);

std::ostream& operator<<(std::ostream& os, IngestResponse const& r);

/**
 * Represents the response from a request that carries no data.
 */
struct EmptyResponse
{
};

std::ostream& operator<<(std::ostream& os, EmptyResponse const& r);

}  // namespace internal
}  // namespace rup
