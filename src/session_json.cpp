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

#include "resumableupload/internal/session_json.h"
#include "resumableupload/internal/json_utils.h"
#include "resumableupload/internal/rfc3339_time.h"

namespace rup {
namespace internal {

nlohmann::json SessionToJson(UploadSession const& session)
{
    nlohmann::json json{
        {"id", session.m_id},
        {"resourceHandle", session.m_resourceHandle},
        {"totalBytes", session.m_totalBytes},
        {"committedBytes", session.m_committedBytes},
        {"status", UploadStatusToString(session.m_status)},
        {"metadata", session.m_metadata},
        {"createdAt", FormatRfc3339(session.m_createdAt)},
        {"updatedAt", FormatRfc3339(session.m_updatedAt)},
        {"sourceName", session.m_sourceName},
    };
    if (session.m_lastError)
    {
        json["lastError"] = nlohmann::json{
            {"reason", UploadErrorReasonToString(session.m_lastError->m_reason)},
            {"code", static_cast<int>(session.m_lastError->m_status.Code())},
            {"message", session.m_lastError->m_status.Message()},
        };
    }
    return json;
}

StatusOrVal<UploadSession> SessionFromJson(nlohmann::json const& json)
{
    if (!json.is_object())
        return Status(StatusCode::InvalidArgument, "Session record is not a JSON object");
    if (json.count("id") == 0)
        return Status(StatusCode::InvalidArgument, "Session record without an id");

    UploadSession result;
    auto id = JsonUtils::ParseString(json, "id");
    if (!id)
        return std::move(id).GetStatus();
    result.m_id = *std::move(id);

    auto handle = JsonUtils::ParseString(json, "resourceHandle");
    if (!handle)
        return std::move(handle).GetStatus();
    result.m_resourceHandle = *std::move(handle);

    auto total = JsonUtils::ParseUnsignedLong(json, "totalBytes");
    if (!total)
        return std::move(total).GetStatus();
    result.m_totalBytes = *total;

    auto committed = JsonUtils::ParseUnsignedLong(json, "committedBytes");
    if (!committed)
        return std::move(committed).GetStatus();
    result.m_committedBytes = *committed;
    if (result.m_committedBytes > result.m_totalBytes)
    {
        return Status(StatusCode::InvalidArgument, "Session record " + result.m_id + " has committedBytes=" +
                                                       std::to_string(result.m_committedBytes) + " > totalBytes=" +
                                                       std::to_string(result.m_totalBytes));
    }

    auto statusName = JsonUtils::ParseString(json, "status");
    if (!statusName)
        return std::move(statusName).GetStatus();
    auto status = ParseUploadStatus(*statusName);
    if (!status)
        return std::move(status).GetStatus();
    result.m_status = *status;

    auto metadata = JsonUtils::ParseStringMap(json, "metadata");
    if (!metadata)
        return std::move(metadata).GetStatus();
    result.m_metadata = *std::move(metadata);

    if (json.count("lastError") != 0 && !json["lastError"].is_null())
    {
        auto const& e = json["lastError"];
        auto reasonName = JsonUtils::ParseString(e, "reason");
        if (!reasonName)
            return std::move(reasonName).GetStatus();
        auto reason = ParseUploadErrorReason(*reasonName);
        if (!reason)
            return std::move(reason).GetStatus();
        auto code = JsonUtils::ParseUnsignedLong(e, "code");
        if (!code)
            return std::move(code).GetStatus();
        auto message = JsonUtils::ParseString(e, "message");
        if (!message)
            return std::move(message).GetStatus();
        result.m_lastError = UploadError{*reason, Status(static_cast<StatusCode>(*code), *std::move(message))};
    }

    auto createdAt = JsonUtils::ParseRFC3339Timestamp(json, "createdAt");
    if (!createdAt)
        return std::move(createdAt).GetStatus();
    result.m_createdAt = *createdAt;

    auto updatedAt = JsonUtils::ParseRFC3339Timestamp(json, "updatedAt");
    if (!updatedAt)
        return std::move(updatedAt).GetStatus();
    result.m_updatedAt = *updatedAt;

    auto sourceName = JsonUtils::ParseString(json, "sourceName");
    if (!sourceName)
        return std::move(sourceName).GetStatus();
    result.m_sourceName = *std::move(sourceName);

    return result;
}

StatusOrVal<UploadSession> ParseSession(std::string const& payload)
{
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded())
        return Status(StatusCode::InvalidArgument, "Invalid session record, failed to parse json");
    return SessionFromJson(json);
}

}  // namespace internal
}  // namespace rup
