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

#include "resumableupload/internal/curl_handle.h"
#include "resumableupload/internal/log.h"
#include "resumableupload/internal/utils.h"
#include <sstream>
#include <stdexcept>

namespace rup {
namespace internal {
namespace {

std::size_t const MaxDataDebugSize = 48;

extern "C" int CurlHandleDebugCallback(CURL*, curl_infotype type, char* data, std::size_t size, void* userptr)
{
    auto* debugBuffer = reinterpret_cast<std::string*>(userptr);
    switch (type)
    {
    case CURLINFO_TEXT:
        *debugBuffer += "== curl(Info): " + std::string(data, size);
        break;
    case CURLINFO_HEADER_IN:
        *debugBuffer += "<< curl(Recv Header): " + std::string(data, size);
        break;
    case CURLINFO_HEADER_OUT:
        *debugBuffer += ">> curl(Send Header): " + std::string(data, size);
        break;
    case CURLINFO_DATA_IN:
        *debugBuffer += "<< curl(Recv Data): size=" + std::to_string(size) + "\n";
        *debugBuffer += BinaryDataAsDebugString(data, size, MaxDataDebugSize);
        break;
    case CURLINFO_DATA_OUT:
        // Chunk payloads are large and binary, their size is enough.
        *debugBuffer += ">> curl(Send Data): size=" + std::to_string(size) + "\n";
        break;
    case CURLINFO_SSL_DATA_IN:
    case CURLINFO_SSL_DATA_OUT:
    case CURLINFO_END:
        break;
    }
    return 0;
}

}  // namespace

CurlHandle::CurlHandle(CurlPtr ptr) : m_handle(std::move(ptr))
{
    if (m_handle.get() == nullptr)
    {
        throw std::runtime_error("Cannot initialize CURL handle");
    }
}

CurlHandle::~CurlHandle() { FlushDebug(__func__); }

void CurlHandle::EnableLogging(bool enabled)
{
    if (enabled)
    {
        SetOption(CURLOPT_DEBUGDATA, &m_debugBuffer);
        SetOption(CURLOPT_DEBUGFUNCTION, &CurlHandleDebugCallback);
        SetOption(CURLOPT_VERBOSE, 1L);
    }
    else
    {
        SetOption(CURLOPT_DEBUGDATA, nullptr);
        SetOption(CURLOPT_DEBUGFUNCTION, nullptr);
        SetOption(CURLOPT_VERBOSE, 0L);
    }
}

void CurlHandle::DisableLogging() noexcept
{
    if (!m_handle)
        return;
    // Resetting these options cannot fail, the return codes carry no information.
    (void)curl_easy_setopt(m_handle.get(), CURLOPT_DEBUGDATA, nullptr);
    (void)curl_easy_setopt(m_handle.get(), CURLOPT_DEBUGFUNCTION, nullptr);
    (void)curl_easy_setopt(m_handle.get(), CURLOPT_VERBOSE, 0L);
}

void CurlHandle::FlushDebug(char const* where)
{
    if (!m_debugBuffer.empty())
    {
        RUP_LOG_DEBUG("{} {}", where, m_debugBuffer);
        m_debugBuffer.clear();
    }
}

Status CurlHandle::AsStatus(CURLcode e, char const* where)
{
    if (e == CURLE_OK)
    {
        return Status();
    }
    std::ostringstream os;
    os << where << "() - CURL error [" << e << "]=" << curl_easy_strerror(e);
    // Map the CURLE* errors using the documentation on:
    //   https://curl.haxx.se/libcurl/c/libcurl-errors.html
    StatusCode code;
    switch (e)
    {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_WEIRD_SERVER_REPLY:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
        code = StatusCode::Unavailable;
        break;
    case CURLE_REMOTE_ACCESS_DENIED:
        code = StatusCode::PermissionDenied;
        break;
    case CURLE_OPERATION_TIMEDOUT:
        code = StatusCode::DeadlineExceeded;
        break;
    case CURLE_ABORTED_BY_CALLBACK:
        // The progress callback asked to stop, i.e. the upload was paused or
        // cancelled.
        code = StatusCode::Aborted;
        break;
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        code = StatusCode::InvalidArgument;
        break;
    default:
        // There are ~82 error codes, some are not applicable (CURLE_FTP*), some
        // of them are not available on all versions, and some are explicitly
        // marked as obsolete. Instead of listing all of them, just default to
        // Unknown.
        code = StatusCode::Unknown;
        break;
    }

    return Status(code, std::move(os).str());
}

void CurlHandle::ThrowSetOptionError(CURLcode e, CURLoption opt, long param)
{
    std::ostringstream os;
    os << "Error [" << e << "]=" << curl_easy_strerror(e) << " while setting curl option [" << opt << "] to "
       << param;
    throw std::runtime_error(os.str());
}

void CurlHandle::ThrowSetOptionError(CURLcode e, CURLoption opt, char const* param)
{
    std::ostringstream os;
    os << "Error [" << e << "]=" << curl_easy_strerror(e) << " while setting curl option [" << opt << "] to "
       << param;
    throw std::runtime_error(os.str());
}

void CurlHandle::ThrowSetOptionError(CURLcode e, CURLoption opt, void* param)
{
    std::ostringstream os;
    os << "Error [" << e << "]=" << curl_easy_strerror(e) << " while setting curl option [" << opt << "] to "
       << param;
    throw std::runtime_error(os.str());
}

}  // namespace internal
}  // namespace rup
