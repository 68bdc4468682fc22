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

#include "resumableupload/byte_source.h"
#include "resumableupload/internal/cancellation_token.h"
#include "resumableupload/internal/ingest_client.h"
#include "resumableupload/options.h"
#include "resumableupload/retry_scheduler.h"
#include "resumableupload/session_store.h"
#include "resumableupload/status_or_val.h"
#include "resumableupload/throughput_estimator.h"
#include "resumableupload/upload_options.h"
#include "resumableupload/upload_session.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rup {

/**
 * Drives one upload session through its lifecycle.
 *
 * @code
 *   idle --Start()--> uploading --all bytes committed--> completed
 *   uploading --Pause()--> paused --Resume()--> uploading
 *   uploading --fatal error--> failed --Retry()--> uploading
 *   any non-terminal state --Cancel()--> cancelled
 * @endcode
 *
 * The network conversation runs on a worker thread owned by the engine, one
 * request at a time. The source is sent in windows of `ChunkSizeOption` bytes
 * and `m_committedBytes` only ever moves to the offset reported by the server.
 * Retryable failures (network errors, timeouts, throttling, server errors) are
 * re-attempted after the delays of the `RetryScheduler`; every re-attempt is
 * preceded by an offset query.
 *
 * The session record is saved to the `SessionStore` after the resource is
 * created, after every committed window and on every status change. It is
 * deleted once the upload completed or was cancelled. Failures to save are
 * logged and do not stop the transfer.
 *
 * Control operations return `FailedPrecondition` when the session is not in a
 * state that allows them. They must not be called from the event callback.
 *
 * Destroying an engine with a running upload pauses it, the record stays in
 * the store and the session can be resumed by another engine. An upload still
 * creating its resource is stopped instead and a resource created meanwhile is
 * released.
 */
class UploadEngine
{
public:
    /**
     * @throws RuntimeStatusError if the retry options or the chunk size are
     *     invalid.
     */
    UploadEngine(std::shared_ptr<internal::IngestClient> client, std::shared_ptr<SessionStore> store,
                 Options options = {});
    ~UploadEngine();

    UploadEngine(UploadEngine const&) = delete;
    UploadEngine& operator=(UploadEngine const&) = delete;

    /**
     * Creates a new session for @p source and starts uploading it.
     *
     * The `filename` and `sessionId` metadata keys are added unless
     * @p metadata already has them.
     *
     * @return the id of the new session.
     */
    StatusOrVal<std::string> Start(std::shared_ptr<ByteSource> source, UploadMetadata metadata = {});

    /// Continues the paused session of this engine.
    Status Resume();

    /**
     * Continues a session saved in the store, e.g. by a previous process.
     *
     * @p source must have exactly the size recorded in the session. The
     * committed offset is reconciled with the server before any byte is sent.
     */
    Status Resume(std::string const& sessionId, std::shared_ptr<ByteSource> source);

    /// Refused until the remote resource exists.
    Status Pause();
    /// Also releases a resource whose creation completed after the call.
    Status Cancel();

    /// Continues a failed session, refused if the failure cannot be recovered.
    Status Retry();

    /// Blocks until the worker stops, returns the resulting status.
    UploadStatus Wait();

    UploadEvent GetSnapshot() const;
    UploadSession GetSession() const;

    /// The backoff delays waited by the current run, in order.
    std::vector<std::chrono::milliseconds> WaitedDelays() const;

    Options const& GetOptions() const { return m_options; }

private:
    enum class RunMode
    {
        // Create the remote resource first.
        Create,
        // Query the server offset first.
        Reconcile,
    };

    bool OnWorkerThread() const;
    void StopCreation();
    Status Launch(std::unique_lock<std::mutex>& lk, RunMode mode);

    void Run(std::shared_ptr<internal::CancellationToken> token, RunMode mode);
    std::optional<UploadError> CreateResource(std::shared_ptr<internal::CancellationToken> const& token);
    std::optional<UploadError> TransferAll(std::shared_ptr<internal::CancellationToken> const& token,
                                           bool queryFirst);
    std::optional<UploadError> ApplyServerOffset(internal::IngestResponse const& response,
                                                 internal::CancellationToken const& token);
    void Finish(internal::CancellationToken const& token, std::optional<UploadError> failure);

    void Backoff(std::chrono::milliseconds delay, internal::CancellationToken& token);
    void OnProgress(std::uint64_t bytesUploaded);
    void Persist(UploadSession const& session);
    void Emit(UploadEvent const& event);

    UploadEvent MakeEventLocked() const;
    UploadSession const& TouchLocked();

    std::shared_ptr<internal::IngestClient> m_client;
    std::shared_ptr<SessionStore> m_store;
    Options m_options;
    RetryScheduler m_scheduler;
    std::size_t m_chunkSize;
    EventCallbackOption::Type m_eventCallback;

    // Serializes the control operations.
    std::mutex m_controlMu;

    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    UploadSession m_session;
    std::shared_ptr<ByteSource> m_source;
    ThroughputEstimator m_estimator;
    double m_speedBytesPerSecond = 0.0;
    std::optional<double> m_estimatedSecondsRemaining;
    std::vector<std::chrono::milliseconds> m_waitedDelays;
    std::shared_ptr<internal::CancellationToken> m_token;
    bool m_running = false;

    std::thread m_worker;
};

/**
 * Creates an engine talking tus 1.0.0 to `EndpointOption` through libcurl and
 * saving sessions into a `FileSessionStore` at `SessionStoreDirectoryOption`.
 *
 * Every call to the endpoint is logged when `TracingComponentsOption` contains
 * `raw-client`.
 */
std::unique_ptr<UploadEngine> MakeUploadEngine(Options options = {});

}  // namespace rup
