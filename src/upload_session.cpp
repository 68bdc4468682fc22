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

#include "resumableupload/upload_session.h"
#include "resumableupload/internal/random.h"
#include "resumableupload/internal/rfc3339_time.h"
#include <iostream>
#include <mutex>

namespace rup {

namespace {
auto constexpr SessionIdAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
int constexpr SessionIdSuffixLength = 9;

struct StatusName
{
    UploadStatus m_status;
    char const* m_name;
};

StatusName const StatusNames[] = {
    {UploadStatus::Idle, "idle"},           {UploadStatus::Uploading, "uploading"},
    {UploadStatus::Paused, "paused"},       {UploadStatus::Completed, "completed"},
    {UploadStatus::Failed, "failed"},       {UploadStatus::Cancelled, "cancelled"},
};

struct ReasonName
{
    UploadErrorReason m_reason;
    char const* m_name;
};

ReasonName const ReasonNames[] = {
    {UploadErrorReason::ResourceCreationFailed, "RESOURCE_CREATION_FAILED"},
    {UploadErrorReason::ResourceNotFound, "RESOURCE_NOT_FOUND"},
    {UploadErrorReason::OffsetRollback, "OFFSET_ROLLBACK"},
    {UploadErrorReason::RetryExhausted, "RETRY_EXHAUSTED"},
    {UploadErrorReason::ClientError, "CLIENT_ERROR"},
    {UploadErrorReason::ProtocolError, "PROTOCOL_ERROR"},
    {UploadErrorReason::SourceReadError, "SOURCE_READ_ERROR"},
};
}  // namespace

std::string UploadStatusToString(UploadStatus status)
{
    for (auto const& n : StatusNames)
    {
        if (n.m_status == status)
            return n.m_name;
    }
    return "unknown(" + std::to_string(static_cast<int>(status)) + ")";
}

StatusOrVal<UploadStatus> ParseUploadStatus(std::string const& str)
{
    for (auto const& n : StatusNames)
    {
        if (str == n.m_name)
            return n.m_status;
    }
    return Status(StatusCode::InvalidArgument, "Unknown upload status <" + str + ">");
}

std::ostream& operator<<(std::ostream& os, UploadStatus status) { return os << UploadStatusToString(status); }

std::string UploadErrorReasonToString(UploadErrorReason reason)
{
    for (auto const& n : ReasonNames)
    {
        if (n.m_reason == reason)
            return n.m_name;
    }
    return "UNKNOWN_REASON=" + std::to_string(static_cast<int>(reason));
}

StatusOrVal<UploadErrorReason> ParseUploadErrorReason(std::string const& str)
{
    for (auto const& n : ReasonNames)
    {
        if (str == n.m_name)
            return n.m_reason;
    }
    return Status(StatusCode::InvalidArgument, "Unknown upload error reason <" + str + ">");
}

std::ostream& operator<<(std::ostream& os, UploadErrorReason reason) { return os << UploadErrorReasonToString(reason); }

std::ostream& operator<<(std::ostream& os, UploadError const& rhs)
{
    return os << "UploadError={reason=" << rhs.m_reason << ", status=" << rhs.m_status << "}";
}

bool operator==(UploadSession const& lhs, UploadSession const& rhs)
{
    return lhs.m_id == rhs.m_id && lhs.m_resourceHandle == rhs.m_resourceHandle &&
           lhs.m_totalBytes == rhs.m_totalBytes && lhs.m_committedBytes == rhs.m_committedBytes &&
           lhs.m_status == rhs.m_status && lhs.m_metadata == rhs.m_metadata && lhs.m_lastError == rhs.m_lastError &&
           lhs.m_createdAt == rhs.m_createdAt && lhs.m_updatedAt == rhs.m_updatedAt &&
           lhs.m_sourceName == rhs.m_sourceName;
}

std::ostream& operator<<(std::ostream& os, UploadSession const& rhs)
{
    os << "UploadSession={id=" << rhs.m_id << ", resourceHandle=" << rhs.m_resourceHandle
       << ", totalBytes=" << rhs.m_totalBytes << ", committedBytes=" << rhs.m_committedBytes
       << ", status=" << rhs.m_status << ", sourceName=" << rhs.m_sourceName << ", metadata={";
    char const* sep = "";
    for (auto const& kv : rhs.m_metadata)
    {
        os << sep << kv.first << "=" << kv.second;
        sep = ", ";
    }
    os << "}";
    if (rhs.m_lastError)
        os << ", lastError=" << *rhs.m_lastError;
    return os << ", createdAt=" << internal::FormatRfc3339(rhs.m_createdAt)
              << ", updatedAt=" << internal::FormatRfc3339(rhs.m_updatedAt) << "}";
}

std::string GenerateSessionId(std::chrono::system_clock::time_point now)
{
    static std::mutex mu;
    static internal::DefaultPRNG generator = internal::MakeDefaultPRNG();

    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::string suffix;
    {
        std::lock_guard<std::mutex> lk(mu);
        suffix = internal::Sample(generator, SessionIdSuffixLength, SessionIdAlphabet);
    }
    return "upload_" + std::to_string(millis) + "_" + suffix;
}

std::ostream& operator<<(std::ostream& os, UploadEvent const& rhs)
{
    os << "UploadEvent={sessionId=" << rhs.m_sessionId << ", status=" << rhs.m_status
       << ", committedBytes=" << rhs.m_committedBytes << ", totalBytes=" << rhs.m_totalBytes
       << ", speedBytesPerSecond=" << rhs.m_speedBytesPerSecond << ", estimatedSecondsRemaining=";
    if (rhs.m_estimatedSecondsRemaining)
        os << *rhs.m_estimatedSecondsRemaining;
    else
        os << "unknown";
    if (rhs.m_lastError)
        os << ", lastError=" << *rhs.m_lastError;
    return os << "}";
}

}  // namespace rup
