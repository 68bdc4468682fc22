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

#include "resumableupload/upload_engine.h"
#include "resumableupload/internal/clients/curl_ingest_client.h"
#include "resumableupload/internal/log.h"
#include "resumableupload/internal/logging_ingest_client.h"
#include <algorithm>

namespace rup {

namespace {
std::size_t ValidChunkSize(Options const& options)
{
    auto const chunkSize = options.Get<ChunkSizeOption>();
    if (chunkSize == 0)
        throw RuntimeStatusError(Status(StatusCode::InvalidArgument, "ChunkSizeOption must be positive"));
    return chunkSize;
}

UploadError MakeUploadError(UploadErrorReason reason, Status status)
{
    UploadError error;
    error.m_reason = reason;
    error.m_status = std::move(status);
    return error;
}

// The reason of a fatal failure of a query or transfer.
UploadError ClassifyFatal(Status status)
{
    switch (status.Code())
    {
    case StatusCode::NotFound:
        return MakeUploadError(UploadErrorReason::ResourceNotFound, std::move(status));
    case StatusCode::DataLoss:
        return MakeUploadError(UploadErrorReason::ProtocolError, std::move(status));
    default:
        return MakeUploadError(UploadErrorReason::ClientError, std::move(status));
    }
}
}  // namespace

UploadEngine::UploadEngine(std::shared_ptr<internal::IngestClient> client, std::shared_ptr<SessionStore> store,
                           Options options)
    : m_client(std::move(client)),
      m_store(std::move(store)),
      m_options(internal::DefaultUploadOptions(std::move(options))),
      m_scheduler(RetryScheduler::Create(m_options).Value()),
      m_chunkSize(ValidChunkSize(m_options)),
      m_eventCallback(m_options.Get<EventCallbackOption>()),
      m_estimator(0, m_options.Get<ProgressIntervalOption>())
{
    internal::CheckExpectedOptions(UploadEngineOptionList{}, m_options, __func__);
}

UploadEngine::~UploadEngine()
{
    bool running = false;
    bool created = false;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        running = m_running && m_session.m_status == UploadStatus::Uploading;
        created = !m_session.m_resourceHandle.empty();
    }
    if (running && created)
    {
        auto status = Pause();
        if (!status.Ok())
            RUP_LOG_DEBUG("Upload {} stopped before it could be paused: {}", m_session.m_id, status);
    }
    else if (running)
    {
        StopCreation();
    }
    if (m_worker.joinable())
        m_worker.join();
}

void UploadEngine::StopCreation()
{
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_token->Cancel();
    }
    if (m_worker.joinable())
        m_worker.join();

    // Nothing refers to a resource created after the stop, drop it.
    auto const session = GetSession();
    RUP_LOG_INFO("Stopped upload {} while creating its resource", session.m_id);
    if (session.m_resourceHandle.empty())
        return;
    auto released = m_client->ReleaseUpload(internal::ReleaseUploadRequest(session.m_resourceHandle));
    if (!released)
    {
        RUP_LOG_WARNING("Cannot release resource {} of upload {}: {}", session.m_resourceHandle, session.m_id,
                        released.GetStatus());
    }
}

bool UploadEngine::OnWorkerThread() const { return m_worker.get_id() == std::this_thread::get_id(); }

StatusOrVal<std::string> UploadEngine::Start(std::shared_ptr<ByteSource> source, UploadMetadata metadata)
{
    if (OnWorkerThread())
        return Status(StatusCode::FailedPrecondition, "Start() cannot be called from the event callback");
    if (!source)
        return Status(StatusCode::InvalidArgument, "Start() requires a byte source");

    std::lock_guard<std::mutex> control(m_controlMu);
    std::unique_lock<std::mutex> lk(m_mu);
    if (m_running)
        return Status(StatusCode::FailedPrecondition, "Upload " + m_session.m_id + " is in progress");
    lk.unlock();
    if (m_worker.joinable())
        m_worker.join();
    lk.lock();

    auto const now = std::chrono::system_clock::now();
    UploadSession session;
    session.m_id = GenerateSessionId(now);
    session.m_totalBytes = source->Size();
    session.m_sourceName = source->Name();
    session.m_createdAt = now;
    session.m_updatedAt = now;
    if (!session.m_sourceName.empty())
        metadata.emplace("filename", session.m_sourceName);
    metadata.emplace("sessionId", session.m_id);
    session.m_metadata = std::move(metadata);

    m_session = std::move(session);
    m_source = std::move(source);
    RUP_LOG_INFO("Starting upload {} of {} ({} bytes)", m_session.m_id, m_session.m_sourceName,
                 m_session.m_totalBytes);
    auto id = m_session.m_id;
    auto status = Launch(lk, RunMode::Create);
    if (!status.Ok())
        return status;
    return id;
}

Status UploadEngine::Resume()
{
    if (OnWorkerThread())
        return Status(StatusCode::FailedPrecondition, "Resume() cannot be called from the event callback");

    std::lock_guard<std::mutex> control(m_controlMu);
    std::unique_lock<std::mutex> lk(m_mu);
    if (m_session.m_status != UploadStatus::Paused)
    {
        return Status(StatusCode::FailedPrecondition,
                      "Only a paused upload can be resumed, upload is " + UploadStatusToString(m_session.m_status));
    }
    lk.unlock();
    if (m_worker.joinable())
        m_worker.join();
    lk.lock();

    RUP_LOG_INFO("Resuming upload {} at {}/{}", m_session.m_id, m_session.m_committedBytes, m_session.m_totalBytes);
    return Launch(lk, m_session.m_resourceHandle.empty() ? RunMode::Create : RunMode::Reconcile);
}

Status UploadEngine::Resume(std::string const& sessionId, std::shared_ptr<ByteSource> source)
{
    if (OnWorkerThread())
        return Status(StatusCode::FailedPrecondition, "Resume() cannot be called from the event callback");
    if (!source)
        return Status(StatusCode::InvalidArgument, "Resume() requires a byte source");

    std::lock_guard<std::mutex> control(m_controlMu);
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_running)
            return Status(StatusCode::FailedPrecondition, "Upload " + m_session.m_id + " is in progress");
    }
    if (m_worker.joinable())
        m_worker.join();

    auto session = m_store->Load(sessionId);
    if (!session)
        return std::move(session).GetStatus();
    if (IsTerminal(session->m_status))
    {
        return Status(StatusCode::FailedPrecondition,
                      "Upload " + sessionId + " is " + UploadStatusToString(session->m_status));
    }
    if (session->m_status == UploadStatus::Failed && session->m_lastError && !session->m_lastError->IsResumable())
    {
        return Status(StatusCode::FailedPrecondition,
                      "Upload " + sessionId + " failed with " +
                          UploadErrorReasonToString(session->m_lastError->m_reason) +
                          " and cannot be resumed, Start() a new upload instead");
    }
    if (source->Size() != session->m_totalBytes)
    {
        return Status(StatusCode::InvalidArgument, "The source has " + std::to_string(source->Size()) +
                                                       " bytes, upload " + sessionId + " expects " +
                                                       std::to_string(session->m_totalBytes));
    }

    std::unique_lock<std::mutex> lk(m_mu);
    m_session = *std::move(session);
    m_source = std::move(source);
    RUP_LOG_INFO("Resuming saved upload {} at {}/{}", m_session.m_id, m_session.m_committedBytes,
                 m_session.m_totalBytes);
    return Launch(lk, m_session.m_resourceHandle.empty() ? RunMode::Create : RunMode::Reconcile);
}

Status UploadEngine::Retry()
{
    if (OnWorkerThread())
        return Status(StatusCode::FailedPrecondition, "Retry() cannot be called from the event callback");

    std::lock_guard<std::mutex> control(m_controlMu);
    std::unique_lock<std::mutex> lk(m_mu);
    if (m_session.m_status != UploadStatus::Failed)
    {
        return Status(StatusCode::FailedPrecondition,
                      "Only a failed upload can be retried, upload is " + UploadStatusToString(m_session.m_status));
    }
    if (m_session.m_lastError && !m_session.m_lastError->IsResumable())
    {
        return Status(StatusCode::FailedPrecondition,
                      "Upload " + m_session.m_id + " failed with " +
                          UploadErrorReasonToString(m_session.m_lastError->m_reason) +
                          " and cannot be retried, Start() a new upload instead");
    }
    lk.unlock();
    if (m_worker.joinable())
        m_worker.join();
    lk.lock();

    RUP_LOG_INFO("Retrying upload {} at {}/{}", m_session.m_id, m_session.m_committedBytes, m_session.m_totalBytes);
    // Creation failures are retried by creating the resource again.
    return Launch(lk, m_session.m_resourceHandle.empty() ? RunMode::Create : RunMode::Reconcile);
}

Status UploadEngine::Pause()
{
    if (OnWorkerThread())
        return Status(StatusCode::FailedPrecondition, "Pause() cannot be called from the event callback");

    std::lock_guard<std::mutex> control(m_controlMu);
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_session.m_status != UploadStatus::Uploading)
        {
            return Status(StatusCode::FailedPrecondition,
                          "Only a running upload can be paused, upload is " +
                              UploadStatusToString(m_session.m_status));
        }
        // A paused session must be resumable, i.e. have a resource.
        if (m_session.m_resourceHandle.empty())
        {
            return Status(StatusCode::FailedPrecondition,
                          "Upload " + m_session.m_id + " is creating its resource, pause it once created");
        }
        // The worker checks the token before every change, nothing moves once
        // it is cancelled.
        m_token->Cancel();
        m_session.m_status = UploadStatus::Paused;
    }
    if (m_worker.joinable())
        m_worker.join();

    UploadSession session;
    UploadEvent event;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_estimator.Reset();
        m_speedBytesPerSecond = 0.0;
        m_estimatedSecondsRemaining.reset();
        session = TouchLocked();
        event = MakeEventLocked();
    }
    RUP_LOG_INFO("Paused upload {} at {}/{}", session.m_id, session.m_committedBytes, session.m_totalBytes);
    Persist(session);
    Emit(event);
    return Status();
}

Status UploadEngine::Cancel()
{
    if (OnWorkerThread())
        return Status(StatusCode::FailedPrecondition, "Cancel() cannot be called from the event callback");

    std::lock_guard<std::mutex> control(m_controlMu);
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_session.m_id.empty())
            return Status(StatusCode::FailedPrecondition, "There is no upload to cancel");
        if (IsTerminal(m_session.m_status))
        {
            return Status(StatusCode::FailedPrecondition,
                          "Upload " + m_session.m_id + " is already " + UploadStatusToString(m_session.m_status));
        }
        if (m_token)
            m_token->Cancel();
        m_session.m_status = UploadStatus::Cancelled;
    }
    if (m_worker.joinable())
        m_worker.join();

    UploadSession session;
    UploadEvent event;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_estimator.Reset();
        m_speedBytesPerSecond = 0.0;
        m_estimatedSecondsRemaining.reset();
        session = TouchLocked();
        event = MakeEventLocked();
    }

    if (!session.m_resourceHandle.empty())
    {
        // Sent without the cancelled token, a failure only leaves garbage on
        // the server.
        auto released = m_client->ReleaseUpload(internal::ReleaseUploadRequest(session.m_resourceHandle));
        if (!released)
        {
            RUP_LOG_WARNING("Cannot release resource {} of upload {}: {}", session.m_resourceHandle, session.m_id,
                            released.GetStatus());
        }
    }
    auto status = m_store->Delete(session.m_id);
    if (!status.Ok())
        RUP_LOG_WARNING("Cannot delete the record of upload {}: {}", session.m_id, status);

    RUP_LOG_INFO("Cancelled upload {} at {}/{}", session.m_id, session.m_committedBytes, session.m_totalBytes);
    Emit(event);
    return Status();
}

UploadStatus UploadEngine::Wait()
{
    std::unique_lock<std::mutex> lk(m_mu);
    if (!OnWorkerThread())
        m_cv.wait(lk, [this] { return !m_running; });
    return m_session.m_status;
}

UploadEvent UploadEngine::GetSnapshot() const
{
    std::lock_guard<std::mutex> lk(m_mu);
    return MakeEventLocked();
}

UploadSession UploadEngine::GetSession() const
{
    std::lock_guard<std::mutex> lk(m_mu);
    return m_session;
}

std::vector<std::chrono::milliseconds> UploadEngine::WaitedDelays() const
{
    std::lock_guard<std::mutex> lk(m_mu);
    return m_waitedDelays;
}

Status UploadEngine::Launch(std::unique_lock<std::mutex>& lk, RunMode mode)
{
    m_session.m_status = UploadStatus::Uploading;
    m_session.m_lastError.reset();
    m_estimator = ThroughputEstimator(m_session.m_totalBytes, m_options.Get<ProgressIntervalOption>());
    m_speedBytesPerSecond = 0.0;
    m_estimatedSecondsRemaining.reset();
    m_waitedDelays.clear();
    m_token = std::make_shared<internal::CancellationToken>();
    m_running = true;
    auto session = TouchLocked();
    auto event = MakeEventLocked();
    auto token = m_token;
    lk.unlock();

    // A new session is saved once its resource exists.
    if (mode == RunMode::Reconcile)
        Persist(session);
    Emit(event);
    m_worker = std::thread(&UploadEngine::Run, this, std::move(token), mode);
    return Status();
}

void UploadEngine::Run(std::shared_ptr<internal::CancellationToken> token, RunMode mode)
{
    std::optional<UploadError> failure;
    if (mode == RunMode::Create)
    {
        failure = CreateResource(token);
        if (!failure)
            failure = TransferAll(token, false);
    }
    else
    {
        failure = TransferAll(token, true);
    }
    Finish(*token, std::move(failure));
}

std::optional<UploadError> UploadEngine::CreateResource(std::shared_ptr<internal::CancellationToken> const& token)
{
    internal::CreateUploadRequest request;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        request = internal::CreateUploadRequest(m_options.Get<EndpointOption>(), m_session.m_totalBytes,
                                                m_session.m_metadata);
    }
    request.SetCancellationToken(token);

    auto response = m_client->CreateUpload(request);
    if (!response)
    {
        if (token->IsCancelled())
            return std::nullopt;
        RUP_LOG_ERROR("Cannot create the upload resource at {}: {}", request.GetEndpoint(), response.GetStatus());
        return MakeUploadError(UploadErrorReason::ResourceCreationFailed, std::move(response).GetStatus());
    }
    if (response->m_resourceHandle.empty())
    {
        if (token->IsCancelled())
            return std::nullopt;
        return MakeUploadError(UploadErrorReason::ResourceCreationFailed,
                               Status(StatusCode::DataLoss, "The endpoint returned no resource handle"));
    }

    UploadSession session;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        // Kept after a stop too, whoever stopped the run releases it.
        m_session.m_resourceHandle = response->m_resourceHandle;
        if (token->IsCancelled())
            return std::nullopt;
        session = TouchLocked();
    }
    RUP_LOG_INFO("Upload {} created resource {}", session.m_id, session.m_resourceHandle);
    Persist(session);
    return std::nullopt;
}

std::optional<UploadError> UploadEngine::TransferAll(std::shared_ptr<internal::CancellationToken> const& token,
                                                     bool queryFirst)
{
    int attempt = 0;
    bool needsQuery = queryFirst;
    bool lastWasConflict = false;

    for (;;)
    {
        if (token->IsCancelled())
            return std::nullopt;

        std::string handle;
        std::uint64_t offset = 0;
        std::uint64_t total = 0;
        std::shared_ptr<ByteSource> source;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            handle = m_session.m_resourceHandle;
            offset = m_session.m_committedBytes;
            total = m_session.m_totalBytes;
            source = m_source;
        }

        Status failure;
        if (needsQuery)
        {
            internal::QueryOffsetRequest request(handle);
            request.SetCancellationToken(token);
            auto response = m_client->QueryOffset(request);
            if (token->IsCancelled())
                return std::nullopt;
            if (!response)
            {
                if (ClassifyStatus(response.GetStatus()) == ErrorClass::Fatal)
                    return ClassifyFatal(std::move(response).GetStatus());
                failure = std::move(response).GetStatus();
            }
            else
            {
                auto error = ApplyServerOffset(*response, *token);
                if (error)
                    return error;
                if (response->m_committedBytes > offset)
                {
                    // The server took the window, the next one starts with a
                    // clean count.
                    attempt = 0;
                    lastWasConflict = false;
                }
                needsQuery = false;
                continue;
            }
        }
        else
        {
            if (offset >= total)
                return std::nullopt;

            auto const length = static_cast<std::size_t>(std::min<std::uint64_t>(m_chunkSize, total - offset));
            auto payload = source->Read(offset, length);
            if (!payload)
            {
                RUP_LOG_ERROR("Cannot read {} bytes at {} of {}: {}", length, offset, source->Name(),
                              payload.GetStatus());
                return MakeUploadError(UploadErrorReason::SourceReadError, std::move(payload).GetStatus());
            }

            internal::TransferChunkRequest request(handle, offset, *std::move(payload));
            request.SetCancellationToken(token);
            request.SetProgressCallback([this, offset](std::uint64_t bytesSent) { OnProgress(offset + bytesSent); });
            auto response = m_client->TransferChunk(request);
            if (token->IsCancelled())
                return std::nullopt;

            if (!response)
            {
                if (ClassifyStatus(response.GetStatus()) == ErrorClass::Fatal)
                    return ClassifyFatal(std::move(response).GetStatus());
                failure = std::move(response).GetStatus();
            }
            else if (response->m_offsetState == internal::IngestResponse::OffsetState::Conflict)
            {
                RUP_LOG_WARNING("Offset conflict at {} for upload resource {}", offset, handle);
                if (lastWasConflict)
                    failure = Status(StatusCode::Unavailable, "The offset conflict persists after a query");
                lastWasConflict = true;
                needsQuery = true;
                if (failure.Ok())
                    continue;
            }
            else
            {
                lastWasConflict = false;
                auto const serverOffset = response->m_committedBytes;
                if (serverOffset == offset)
                {
                    failure = Status(StatusCode::Unavailable,
                                     "The server committed none of the " + std::to_string(length) + " bytes sent");
                }
                else
                {
                    auto error = ApplyServerOffset(*response, *token);
                    if (error)
                        return error;
                    if (serverOffset < offset + length)
                    {
                        RUP_LOG_DEBUG("Short write, server committed {} of {} bytes at {}", serverOffset - offset,
                                      length, offset);
                    }
                    attempt = 0;
                    continue;
                }
            }
        }

        ++attempt;
        auto delay = m_scheduler.NextDelay(attempt, ClassifyStatus(failure));
        if (!delay)
        {
            RUP_LOG_ERROR("Giving up on offset {} of resource {} after {} attempts: {}", offset, handle, attempt,
                          failure);
            return MakeUploadError(UploadErrorReason::RetryExhausted, std::move(failure));
        }
        RUP_LOG_WARNING("Attempt {} at offset {} failed, retrying in {}ms: {}", attempt, offset, delay->count(),
                        failure);
        Backoff(*delay, *token);
        needsQuery = true;
    }
}

std::optional<UploadError> UploadEngine::ApplyServerOffset(internal::IngestResponse const& response,
                                                           internal::CancellationToken const& token)
{
    UploadSession session;
    std::optional<ThroughputReport> report;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (token.IsCancelled())
            return std::nullopt;

        auto const serverOffset = response.m_committedBytes;
        if (serverOffset > m_session.m_totalBytes)
        {
            return MakeUploadError(UploadErrorReason::ProtocolError,
                                   Status(StatusCode::DataLoss, "The server offset " + std::to_string(serverOffset) +
                                                                    " is beyond the upload length " +
                                                                    std::to_string(m_session.m_totalBytes)));
        }
        if (response.m_totalBytes && *response.m_totalBytes != m_session.m_totalBytes)
        {
            return MakeUploadError(UploadErrorReason::ProtocolError,
                                   Status(StatusCode::DataLoss, "The server upload length " +
                                                                    std::to_string(*response.m_totalBytes) +
                                                                    " does not match " +
                                                                    std::to_string(m_session.m_totalBytes)));
        }
        if (serverOffset < m_session.m_committedBytes)
        {
            return MakeUploadError(UploadErrorReason::OffsetRollback,
                                   Status(StatusCode::FailedPrecondition,
                                          "The server offset " + std::to_string(serverOffset) +
                                              " is behind the committed offset " +
                                              std::to_string(m_session.m_committedBytes)));
        }
        if (serverOffset == m_session.m_committedBytes)
            return std::nullopt;

        m_session.m_committedBytes = serverOffset;
        session = TouchLocked();
        report = m_estimator.AddSample(serverOffset, std::chrono::steady_clock::now());
        if (report)
        {
            m_speedBytesPerSecond = report->m_speedBytesPerSecond;
            m_estimatedSecondsRemaining = report->m_estimatedSecondsRemaining;
        }
    }
    RUP_LOG_DEBUG("Upload {} committed {}/{}", session.m_id, session.m_committedBytes, session.m_totalBytes);
    // The last window is followed by Finish(), which removes the record.
    if (session.m_committedBytes < session.m_totalBytes)
        Persist(session);
    if (report)
        Emit(GetSnapshot());
    return std::nullopt;
}

void UploadEngine::Finish(internal::CancellationToken const& token, std::optional<UploadError> failure)
{
    UploadSession session;
    UploadEvent event;
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        stopped = token.IsCancelled();
        if (!stopped)
        {
            if (failure)
            {
                m_session.m_status = UploadStatus::Failed;
                m_session.m_lastError = std::move(failure);
            }
            else
            {
                m_session.m_status = UploadStatus::Completed;
            }
            m_speedBytesPerSecond = 0.0;
            m_estimatedSecondsRemaining.reset();
            session = TouchLocked();
            event = MakeEventLocked();
        }
    }

    if (!stopped)
    {
        if (session.m_status == UploadStatus::Completed)
        {
            RUP_LOG_INFO("Upload {} completed, {} bytes", session.m_id, session.m_totalBytes);
            auto status = m_store->Delete(session.m_id);
            if (!status.Ok())
                RUP_LOG_WARNING("Cannot delete the record of upload {}: {}", session.m_id, status);
        }
        else
        {
            RUP_LOG_ERROR("Upload {} failed at {}/{}: {}", session.m_id, session.m_committedBytes,
                          session.m_totalBytes, *session.m_lastError);
            Persist(session);
        }
        Emit(event);
    }

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_running = false;
    }
    m_cv.notify_all();
}

void UploadEngine::Backoff(std::chrono::milliseconds delay, internal::CancellationToken& token)
{
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_waitedDelays.push_back(delay);
    }
    if (m_options.Has<internal::SleepFunctionOption>())
    {
        m_options.Get<internal::SleepFunctionOption>()(delay);
        return;
    }
    if (delay.count() > 0)
        token.WaitFor(delay);
}

void UploadEngine::OnProgress(std::uint64_t bytesUploaded)
{
    std::optional<ThroughputReport> report;
    UploadEvent event;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        report = m_estimator.AddSample(bytesUploaded, std::chrono::steady_clock::now());
        if (!report)
            return;
        m_speedBytesPerSecond = report->m_speedBytesPerSecond;
        m_estimatedSecondsRemaining = report->m_estimatedSecondsRemaining;
        event = MakeEventLocked();
    }
    RUP_LOG_TRACE("Upload {}: {}", event.m_sessionId, *report);
    Emit(event);
}

void UploadEngine::Persist(UploadSession const& session)
{
    auto status = m_store->Save(session);
    if (!status.Ok())
        RUP_LOG_WARNING("Cannot save upload {}, continuing: {}", session.m_id, status);
}

void UploadEngine::Emit(UploadEvent const& event)
{
    if (m_eventCallback)
        m_eventCallback(event);
}

UploadEvent UploadEngine::MakeEventLocked() const
{
    UploadEvent event;
    event.m_sessionId = m_session.m_id;
    event.m_status = m_session.m_status;
    event.m_committedBytes = m_session.m_committedBytes;
    event.m_totalBytes = m_session.m_totalBytes;
    event.m_speedBytesPerSecond = m_speedBytesPerSecond;
    event.m_estimatedSecondsRemaining = m_estimatedSecondsRemaining;
    event.m_lastError = m_session.m_lastError;
    return event;
}

UploadSession const& UploadEngine::TouchLocked()
{
    m_session.m_updatedAt = std::chrono::system_clock::now();
    return m_session;
}

std::unique_ptr<UploadEngine> MakeUploadEngine(Options options)
{
    options = internal::DefaultUploadOptions(std::move(options));

    std::shared_ptr<internal::IngestClient> client = internal::CurlIngestClient::Create(options);
    auto const& tracing = options.Get<TracingComponentsOption>();
    if (tracing.count("raw-client") != 0)
    {
        RUP_LOG_INFO("Enabled logging for the ingest client calls");
        client = std::make_shared<internal::LoggingIngestClient>(std::move(client));
    }
    auto store = std::make_shared<FileSessionStore>(options.Get<SessionStoreDirectoryOption>(),
                                                    options.Get<SaveCoalesceIntervalOption>());
    return std::make_unique<UploadEngine>(std::move(client), std::move(store), std::move(options));
}

}  // namespace rup
