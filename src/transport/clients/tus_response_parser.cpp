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

#include "resumableupload/internal/clients/tus_response_parser.h"
#include "resumableupload/internal/clients/tus_utils.h"
#include <sstream>

namespace rup {
namespace internal {

namespace {
constexpr auto UploadOffsetHeader = "upload-offset";
constexpr auto UploadLengthHeader = "upload-length";
constexpr auto LocationHeader = "location";

Status ProtocolViolation(char const* where, std::string const& what, HttpResponse const& response)
{
    std::ostringstream os;
    os << where << "() " << what << ", response=" << response;
    return Status(StatusCode::DataLoss, std::move(os).str());
}

StatusOrVal<std::uint64_t> RequiredOffset(char const* where, HttpResponse const& response)
{
    auto header = response.Header(UploadOffsetHeader);
    if (!header)
        return ProtocolViolation(where, "missing Upload-Offset header", response);
    auto offset = TusUtils::ParseOffset(*header);
    if (!offset)
        return ProtocolViolation(where, offset.GetStatus().Message(), response);
    return offset;
}
}  // namespace

StatusOrVal<IngestResponse> TusResponseParser::ParseCreateResponse(std::string const& endpoint,
                                                                   HttpResponse const& response)
{
    if (response.m_statusCode >= HttpStatusCode::MinRedirects)
        return AsStatus(response);

    auto location = response.Header(LocationHeader);
    if (!location || location->empty())
        return ProtocolViolation(__func__, "missing Location header", response);

    IngestResponse result;
    result.m_resourceHandle = TusUtils::ResolveLocation(endpoint, *location);
    result.m_committedBytes = 0;
    return result;
}

StatusOrVal<IngestResponse> TusResponseParser::ParseQueryResponse(std::string const& resourceHandle,
                                                                  HttpResponse const& response)
{
    if (response.m_statusCode == HttpStatusCode::Forbidden || response.m_statusCode == HttpStatusCode::NotFound ||
        response.m_statusCode == HttpStatusCode::Gone)
    {
        // tus servers answer 403 to a HEAD of an upload they do not know.
        return Status(StatusCode::NotFound, "upload resource <" + resourceHandle + "> does not exist, http status " +
                                                std::to_string(response.m_statusCode));
    }
    if (response.m_statusCode >= HttpStatusCode::MinRedirects)
        return AsStatus(response);

    auto offset = RequiredOffset(__func__, response);
    if (!offset)
        return std::move(offset).GetStatus();

    IngestResponse result;
    result.m_resourceHandle = resourceHandle;
    result.m_committedBytes = *offset;
    if (auto length = response.Header(UploadLengthHeader))
    {
        auto total = TusUtils::ParseOffset(*length);
        if (!total)
            return ProtocolViolation(__func__, total.GetStatus().Message(), response);
        result.m_totalBytes = *total;
    }
    return result;
}

StatusOrVal<IngestResponse> TusResponseParser::ParseTransferResponse(std::string const& resourceHandle,
                                                                     HttpResponse const& response)
{
    IngestResponse result;
    result.m_resourceHandle = resourceHandle;
    if (response.m_statusCode == HttpStatusCode::Conflict)
    {
        result.m_offsetState = IngestResponse::OffsetState::Conflict;
        return result;
    }
    if (response.m_statusCode >= HttpStatusCode::MinRedirects)
        return AsStatus(response);

    auto offset = RequiredOffset(__func__, response);
    if (!offset)
        return std::move(offset).GetStatus();
    result.m_committedBytes = *offset;
    return result;
}

}  // namespace internal
}  // namespace rup
