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

// This file is expected to be included from log.h (spdlog based logger).

// spdlog uses fmtlib which provides std::ostream support including formatting of user-defined types.
// However, in order to make a type formattable via std::ostream
// you should provide a formatter specialization inherited from ostream_formatter.
// @see https://fmt.dev/latest/api.html?highlight=ostream#std-ostream-support

#include "resumableupload/internal/http_response.h"
#include "resumableupload/internal/ingest_requests.h"
#include "resumableupload/status.h"
#include "resumableupload/throughput_estimator.h"
#include "resumableupload/upload_session.h"

template <>
struct fmt::formatter<rup::Status> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::StatusCode> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::UploadStatus> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::UploadErrorReason> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::UploadError> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::UploadSession> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::UploadEvent> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::HttpResponse> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::CreateUploadRequest> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::QueryOffsetRequest> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::TransferChunkRequest> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::ReleaseUploadRequest> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::IngestResponse> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::internal::EmptyResponse> : ostream_formatter
{
};
template <>
struct fmt::formatter<rup::ThroughputReport> : ostream_formatter
{
};
