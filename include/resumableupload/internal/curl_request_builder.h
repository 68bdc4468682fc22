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

#include "resumableupload/internal/curl_handle_factory.h"
#include "resumableupload/internal/curl_request.h"
#include "resumableupload/options.h"
#include <memory>
#include <string>

namespace rup {
namespace internal {
/**
 * Implements the Builder pattern for CurlRequest.
 */
class CurlRequestBuilder
{
public:
    using RequestType = CurlRequest;

    explicit CurlRequestBuilder(std::string url, std::shared_ptr<CurlHandleFactory> factory);

    /**
     * Creates a http request.
     *
     * This function invalidates the builder. The application should not use this
     * builder once this function is called.
     */
    CurlRequest BuildRequest();

    // Adds a request header, formatted as `Name: value`.
    CurlRequestBuilder& AddHeader(std::string const& header);

    // Adds a request header.
    CurlRequestBuilder& AddHeader(std::string const& name, std::string const& value)
    {
        return AddHeader(name + ": " + value);
    }

    // Changes the http method used for this request, GET by default.
    CurlRequestBuilder& SetMethod(std::string method);

    // Reports the number of body bytes sent, and allows aborting the request.
    CurlRequestBuilder& SetProgressCallback(CurlRequest::ProgressCallback callback);

    /**
     * Copy interesting configuration parameters from the options.
     *
     * Uses `TracingComponentsOption`, `UserAgentProductsOption`,
     * `RequestTimeoutOption`, `ConnectTimeoutOption` and `CustomHeadersOption`.
     */
    CurlRequestBuilder& ApplyOptions(Options const& options);

    // Gets the user-agent suffix.
    std::string UserAgentSuffix() const;

private:
    void ValidateBuilderState(char const* where) const;

    std::shared_ptr<CurlHandleFactory> m_factory;

    CurlHandle m_handle;
    CurlHeaders m_headers;

    std::string m_url;
    std::string m_method;
    std::string m_userAgentPrefix;
    bool m_loggingEnabled;
    std::chrono::milliseconds m_requestTimeout;
    std::chrono::milliseconds m_connectTimeout;
    CurlRequest::ProgressCallback m_progressCallback;
};

}  // namespace internal
}  // namespace rup
