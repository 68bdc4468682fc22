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

#include "resumableupload/status_or_val.h"
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace rup {

enum class UploadStatus
{
    Idle,
    Uploading,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

/// Lower-case name, also used as the persisted representation.
std::string UploadStatusToString(UploadStatus status);
StatusOrVal<UploadStatus> ParseUploadStatus(std::string const& str);
std::ostream& operator<<(std::ostream& os, UploadStatus status);

/// Completed and Cancelled sessions never change again.
inline bool IsTerminal(UploadStatus status)
{
    return status == UploadStatus::Completed || status == UploadStatus::Cancelled;
}

/**
 * Stable, machine-readable reason of a failed session.
 */
enum class UploadErrorReason
{
    ResourceCreationFailed,
    ResourceNotFound,
    OffsetRollback,
    RetryExhausted,
    ClientError,
    ProtocolError,
    SourceReadError,
};

std::string UploadErrorReasonToString(UploadErrorReason reason);
StatusOrVal<UploadErrorReason> ParseUploadErrorReason(std::string const& str);
std::ostream& operator<<(std::ostream& os, UploadErrorReason reason);

/**
 * The error a session failed with.
 *
 * `m_status` keeps the underlying transport or store error for diagnostics,
 * `m_reason` is what callers should branch on.
 */
struct UploadError
{
    UploadErrorReason m_reason = UploadErrorReason::ClientError;
    Status m_status;

    /**
     * Whether `UploadEngine::Retry()` may continue the session.
     *
     * A missing or rolled back remote resource cannot be recovered, the caller
     * must start a fresh session.
     */
    bool IsResumable() const
    {
        return m_reason != UploadErrorReason::ResourceNotFound && m_reason != UploadErrorReason::OffsetRollback;
    }
};

inline bool operator==(UploadError const& lhs, UploadError const& rhs)
{
    return lhs.m_reason == rhs.m_reason && lhs.m_status == rhs.m_status;
}

inline bool operator!=(UploadError const& lhs, UploadError const& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& os, UploadError const& rhs);

/// Descriptive fields of the uploaded media, sent once at creation.
using UploadMetadata = std::map<std::string, std::string>;

/**
 * One logical attempt to transfer one file to completion.
 *
 * A session may span several process lifetimes: its durable projection lives
 * in a `SessionStore`, and `m_committedBytes` is the only cursor used to
 * continue it.
 */
struct UploadSession
{
    std::string m_id;
    // Empty until the ingest endpoint created the remote resource.
    std::string m_resourceHandle;
    std::uint64_t m_totalBytes = 0;
    // Server-acknowledged durable prefix, never decreases.
    std::uint64_t m_committedBytes = 0;
    UploadStatus m_status = UploadStatus::Idle;
    UploadMetadata m_metadata;
    std::optional<UploadError> m_lastError;
    std::chrono::system_clock::time_point m_createdAt;
    std::chrono::system_clock::time_point m_updatedAt;
    std::string m_sourceName;
};

bool operator==(UploadSession const& lhs, UploadSession const& rhs);
inline bool operator!=(UploadSession const& lhs, UploadSession const& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& os, UploadSession const& rhs);

/**
 * Creates a session identifier: `upload_<unix-millis>_<9 chars of [0-9a-z]>`.
 */
std::string GenerateSessionId(std::chrono::system_clock::time_point now);

/**
 * A snapshot of the session delivered to the event callback.
 *
 * Emitted on every status transition and at the throughput sampling cadence.
 */
struct UploadEvent
{
    std::string m_sessionId;
    UploadStatus m_status = UploadStatus::Idle;
    std::uint64_t m_committedBytes = 0;
    std::uint64_t m_totalBytes = 0;
    double m_speedBytesPerSecond = 0.0;
    // Unset while the speed is unknown or zero.
    std::optional<double> m_estimatedSecondsRemaining;
    std::optional<UploadError> m_lastError;
};

std::ostream& operator<<(std::ostream& os, UploadEvent const& rhs);

}  // namespace rup
