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

#pragma once

#include "resumableupload/internal/curl_handle.h"
#include "resumableupload/internal/curl_handle_factory.h"
#include "resumableupload/internal/http_response.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rup {
namespace internal {

extern "C" std::size_t CurlRequestOnWriteData(char*, std::size_t, std::size_t, void*);
extern "C" std::size_t CurlRequestOnHeaderData(char*, std::size_t, std::size_t, void*);
extern "C" int CurlRequestOnProgress(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

/**
 * Makes RPC-like requests using CURL.
 *
 * The resumableupload library is using libcurl to make http requests,
 * this class manages the resources and workflow to make a simple RPC-like
 * request.
 */
class CurlRequest
{
public:
    /**
     * Called while the request body is sent with the number of bytes sent so
     * far. Returning false aborts the request, `MakeRequest()` then fails with
     * `StatusCode::Aborted`.
     */
    using ProgressCallback = std::function<bool(std::uint64_t bytesSent)>;

    ~CurlRequest();

    CurlRequest(CurlRequest&&) = default;
    CurlRequest& operator=(CurlRequest&&) = default;

    /**
     * Makes the prepared request.
     *
     * POST and PATCH requests always send @p payload as the request body, even
     * if it is empty. @p payload must remain valid until this function returns.
     *
     * @return The response HTTP error code, headers and the response payload.
     */
    StatusOrVal<HttpResponse> MakeRequest(std::string const& payload);

private:
    explicit CurlRequest(CurlHandle handle);

    friend class CurlRequestBuilder;
    friend std::size_t CurlRequestOnWriteData(char*, std::size_t, std::size_t, void*);
    friend std::size_t CurlRequestOnHeaderData(char*, std::size_t, std::size_t, void*);
    friend int CurlRequestOnProgress(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    std::size_t OnWriteData(char* contents, std::size_t size, std::size_t nmemb);
    std::size_t OnHeaderData(char* contents, std::size_t size, std::size_t nitems);
    int OnProgress(curl_off_t bytesSent);

    std::string m_url;
    std::string m_method;
    CurlHeaders m_headers = CurlHeaders(nullptr, &curl_slist_free_all);
    std::string m_userAgent;
    std::string m_responsePayload;
    CurlReceivedHeaders m_receivedHeaders;
    bool m_loggingEnabled = false;
    std::chrono::milliseconds m_requestTimeout{0};
    std::chrono::milliseconds m_connectTimeout{0};
    ProgressCallback m_progressCallback;
    CurlHandle m_handle;
    std::shared_ptr<CurlHandleFactory> m_factory;
};

}  // namespace internal
}  // namespace rup
