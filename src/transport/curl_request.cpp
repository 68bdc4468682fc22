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

#include "resumableupload/internal/curl_request.h"

namespace rup {
namespace internal {

extern "C" std::size_t CurlRequestOnWriteData(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* request = reinterpret_cast<CurlRequest*>(userdata);
    return request->OnWriteData(ptr, size, nmemb);
}

extern "C" std::size_t CurlRequestOnHeaderData(char* contents, std::size_t size, std::size_t nitems, void* userdata)
{
    auto* request = reinterpret_cast<CurlRequest*>(userdata);
    return request->OnHeaderData(contents, size, nitems);
}

extern "C" int CurlRequestOnProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow)
{
    auto* request = reinterpret_cast<CurlRequest*>(clientp);
    return request->OnProgress(ulnow);
}

CurlRequest::CurlRequest(CurlHandle handle) : m_handle(std::move(handle)) {}

CurlRequest::~CurlRequest()
{
    if (m_factory)
    {
        m_factory->CleanupHandle(std::move(m_handle.m_handle));
    }
}

StatusOrVal<HttpResponse> CurlRequest::MakeRequest(std::string const& payload)
{
    // We get better performance using a slightly larger buffer (128KiB) than the
    // default buffer size set by libcurl (16KiB)
    auto constexpr DefaultBufferSize = 128 * 1024L;

    m_responsePayload.clear();
    m_receivedHeaders.clear();

    if (m_method == "HEAD")
    {
        m_handle.SetOption(CURLOPT_NOBODY, 1L);
    }
    else
    {
        if (m_method != "GET")
            m_handle.SetOption(CURLOPT_CUSTOMREQUEST, m_method.c_str());
        if (!payload.empty() || m_method == "POST" || m_method == "PATCH")
        {
            m_handle.SetOption(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
            m_handle.SetOption(CURLOPT_POSTFIELDS, payload.data());
        }
    }

    m_handle.SetOption(CURLOPT_BUFFERSIZE, DefaultBufferSize);
    m_handle.SetOption(CURLOPT_URL, m_url.c_str());
    m_handle.SetOption(CURLOPT_HTTPHEADER, m_headers.get());
    m_handle.SetOption(CURLOPT_USERAGENT, m_userAgent.c_str());
    m_handle.SetOption(CURLOPT_NOSIGNAL, 1L);
    m_handle.SetOption(CURLOPT_TCP_KEEPALIVE, 1L);
    if (m_requestTimeout.count() > 0)
        m_handle.SetOption(CURLOPT_TIMEOUT_MS, static_cast<long>(m_requestTimeout.count()));
    if (m_connectTimeout.count() > 0)
        m_handle.SetOption(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_connectTimeout.count()));
    m_handle.EnableLogging(m_loggingEnabled);
    m_handle.SetOption(CURLOPT_WRITEFUNCTION, &CurlRequestOnWriteData);
    m_handle.SetOption(CURLOPT_WRITEDATA, this);
    m_handle.SetOption(CURLOPT_HEADERFUNCTION, &CurlRequestOnHeaderData);
    m_handle.SetOption(CURLOPT_HEADERDATA, this);
    if (m_progressCallback)
    {
        m_handle.SetOption(CURLOPT_XFERINFOFUNCTION, &CurlRequestOnProgress);
        m_handle.SetOption(CURLOPT_XFERINFODATA, this);
        m_handle.SetOption(CURLOPT_NOPROGRESS, 0L);
    }
    auto status = m_handle.EasyPerform();
    if (m_loggingEnabled)
        m_handle.FlushDebug(__func__);
    if (!status.Ok())
        return status;

    auto code = m_handle.GetResponseCode();
    if (!code.Ok())
        return std::move(code).GetStatus();
    return HttpResponse{code.Value(), std::move(m_responsePayload), std::move(m_receivedHeaders)};
}

std::size_t CurlRequest::OnWriteData(char* contents, std::size_t size, std::size_t nmemb)
{
    m_responsePayload.append(contents, size * nmemb);
    return size * nmemb;
}

std::size_t CurlRequest::OnHeaderData(char* contents, std::size_t size, std::size_t nitems)
{
    return CurlAppendHeaderData(m_receivedHeaders, contents, size * nitems);
}

int CurlRequest::OnProgress(curl_off_t bytesSent)
{
    // Any non-zero value makes libcurl abort with CURLE_ABORTED_BY_CALLBACK.
    return m_progressCallback(static_cast<std::uint64_t>(bytesSent)) ? 0 : 1;
}

}  // namespace internal
}  // namespace rup
