// Copyright 2024 Andrew Karasyov
//
// Copyright 2018 Google LLC
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

#include "resumableupload/internal/logging_ingest_client.h"
#include "resumableupload/internal/ingest_client_wrapper_utils.h"
#include "resumableupload/internal/log.h"

namespace rup {
namespace internal {

namespace {
/**
 * Logs the input and results of each `IngestClient` operation.
 *
 * @tparam MemberFunction the signature of the member function.
 * @param client the IngestClient object to make the call through.
 * @param function the pointer to the member function to call.
 * @param request an initialized request parameter for the call.
 * @param context include this name in every log line.
 * @return the result from making the call;
 */
template <typename MemberFunction>
typename Signature<MemberFunction>::ReturnType MakeCall(IngestClient& client, MemberFunction function,
                                                        typename Signature<MemberFunction>::RequestType const& request,
                                                        char const* context)
{
    RUP_LOG_INFO("{}() << {}", context, request);

    auto response = (client.*function)(request);
    if (response.Ok())
    {
        RUP_LOG_INFO("{}() >> payload={{{}}}", context, response.Value());
    }
    else
    {
        RUP_LOG_INFO("{}() >> status={{{}}}", context, response.GetStatus());
    }
    return response;
}
}  // namespace

LoggingIngestClient::LoggingIngestClient(std::shared_ptr<IngestClient> client) : m_client(std::move(client)) {}

StatusOrVal<IngestResponse> LoggingIngestClient::CreateUpload(CreateUploadRequest const& request)
{
    return MakeCall(*m_client, &IngestClient::CreateUpload, request, __func__);
}

StatusOrVal<IngestResponse> LoggingIngestClient::QueryOffset(QueryOffsetRequest const& request)
{
    return MakeCall(*m_client, &IngestClient::QueryOffset, request, __func__);
}

StatusOrVal<IngestResponse> LoggingIngestClient::TransferChunk(TransferChunkRequest const& request)
{
    return MakeCall(*m_client, &IngestClient::TransferChunk, request, __func__);
}

StatusOrVal<EmptyResponse> LoggingIngestClient::ReleaseUpload(ReleaseUploadRequest const& request)
{
    return MakeCall(*m_client, &IngestClient::ReleaseUpload, request, __func__);
}

}  // namespace internal
}  // namespace rup
