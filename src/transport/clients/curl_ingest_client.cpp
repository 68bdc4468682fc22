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

#include "resumableupload/internal/clients/curl_ingest_client.h"
#include "resumableupload/internal/clients/tus_response_parser.h"
#include "resumableupload/internal/clients/tus_utils.h"
#include "resumableupload/upload_options.h"

namespace rup {
namespace internal {

namespace {
Status AbortedStatus(char const* where)
{
    return Status(StatusCode::Aborted, std::string(where) + "() request cancelled before it was sent");
}
}  // namespace

std::shared_ptr<CurlIngestClient> CurlIngestClient::Create(Options options)
{
    return std::make_shared<CurlIngestClient>(std::move(options));
}

CurlIngestClient::CurlIngestClient(Options options)
    : m_options(std::move(options)), m_factory(CreateCurlHandleFactory(m_options.Get<ConnectionPoolSizeOption>()))
{
    CurlInitializeOnce();
}

CurlRequestBuilder CurlIngestClient::MakeBuilder(std::string url, std::string method, IngestRequest const& request,
                                                 TransferChunkRequest::ProgressCallback progress)
{
    CurlRequestBuilder builder(std::move(url), m_factory);
    builder.ApplyOptions(m_options);
    builder.SetMethod(std::move(method));
    builder.AddHeader("Tus-Resumable", TusUtils::ProtocolVersion);

    auto token = request.GetCancellationToken();
    if (token || progress)
    {
        builder.SetProgressCallback([token, progress](std::uint64_t bytesSent) {
            if (progress)
                progress(bytesSent);
            return !(token && token->IsCancelled());
        });
    }
    return builder;
}

StatusOrVal<IngestResponse> CurlIngestClient::CreateUpload(CreateUploadRequest const& request)
{
    if (request.IsCancelled())
        return AbortedStatus(__func__);
    auto metadata = TusUtils::EncodeUploadMetadata(request.GetMetadata());
    if (!metadata)
        return std::move(metadata).GetStatus();

    auto builder = MakeBuilder(request.GetEndpoint(), "POST", request);
    builder.AddHeader("Upload-Length", std::to_string(request.GetTotalBytes()));
    if (!metadata->empty())
        builder.AddHeader("Upload-Metadata", *metadata);
    builder.AddHeader("Content-Length: 0");
    // libcurl adds a form content type to every POST, tus does not define one.
    builder.AddHeader("Content-Type:");

    auto response = builder.BuildRequest().MakeRequest(std::string{});
    if (!response)
        return std::move(response).GetStatus();
    return TusResponseParser::ParseCreateResponse(request.GetEndpoint(), *response);
}

StatusOrVal<IngestResponse> CurlIngestClient::QueryOffset(QueryOffsetRequest const& request)
{
    if (request.IsCancelled())
        return AbortedStatus(__func__);
    auto builder = MakeBuilder(request.GetResourceHandle(), "HEAD", request);
    builder.AddHeader("Cache-Control: no-store");

    auto response = builder.BuildRequest().MakeRequest(std::string{});
    if (!response)
        return std::move(response).GetStatus();
    return TusResponseParser::ParseQueryResponse(request.GetResourceHandle(), *response);
}

StatusOrVal<IngestResponse> CurlIngestClient::TransferChunk(TransferChunkRequest const& request)
{
    if (request.IsCancelled())
        return AbortedStatus(__func__);
    auto builder = MakeBuilder(request.GetResourceHandle(), "PATCH", request, request.GetProgressCallback());
    builder.AddHeader("Upload-Offset", std::to_string(request.GetOffset()));
    builder.AddHeader("Content-Type", TusUtils::OffsetContentType);
    builder.AddHeader("Content-Length", std::to_string(request.GetPayloadSize()));
    // The content length is known, disable chunked transfer encoding and the
    // "Expect: 100-continue" round trip libcurl adds to large bodies.
    builder.AddHeader("Transfer-Encoding:");
    builder.AddHeader("Expect:");

    auto response = builder.BuildRequest().MakeRequest(request.GetPayload());
    if (!response)
        return std::move(response).GetStatus();
    return TusResponseParser::ParseTransferResponse(request.GetResourceHandle(), *response);
}

StatusOrVal<EmptyResponse> CurlIngestClient::ReleaseUpload(ReleaseUploadRequest const& request)
{
    auto builder = MakeBuilder(request.GetResourceHandle(), "DELETE", request);
    auto response = builder.BuildRequest().MakeRequest(std::string{});
    if (!response)
        return std::move(response).GetStatus();
    if (response->m_statusCode >= HttpStatusCode::MinRedirects)
        return AsStatus(*response);
    return EmptyResponse{};
}

}  // namespace internal
}  // namespace rup
