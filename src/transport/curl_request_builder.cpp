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

#include "resumableupload/internal/curl_request_builder.h"
#include "resumableupload/internal/algorithm.h"
#include "resumableupload/upload_options.h"
#include "resumableupload/version_info.h"
#include <stdexcept>

namespace rup {
namespace internal {

CurlRequestBuilder::CurlRequestBuilder(std::string url, std::shared_ptr<CurlHandleFactory> factory)
    : m_factory(std::move(factory)),
      m_handle(m_factory->CreateHandle()),
      m_headers(nullptr, &curl_slist_free_all),
      m_url(std::move(url)),
      m_method("GET"),
      m_loggingEnabled(false),
      m_requestTimeout(0),
      m_connectTimeout(0)
{
}

CurlRequest CurlRequestBuilder::BuildRequest()
{
    ValidateBuilderState(__func__);
    CurlRequest request(std::move(m_handle));
    request.m_url = std::move(m_url);
    request.m_method = std::move(m_method);
    request.m_headers = std::move(m_headers);
    request.m_userAgent = m_userAgentPrefix + UserAgentSuffix();
    request.m_loggingEnabled = m_loggingEnabled;
    request.m_requestTimeout = m_requestTimeout;
    request.m_connectTimeout = m_connectTimeout;
    request.m_progressCallback = std::move(m_progressCallback);
    request.m_factory = std::move(m_factory);
    return request;
}

CurlRequestBuilder& CurlRequestBuilder::ApplyOptions(Options const& options)
{
    ValidateBuilderState(__func__);
    m_loggingEnabled = Contains(options.Get<TracingComponentsOption>(), "http");
    auto agents = options.Get<UserAgentProductsOption>();
    if (!agents.empty())
    {
        agents.push_back(m_userAgentPrefix);
        m_userAgentPrefix = StrJoin(agents, " ");
    }
    m_requestTimeout = options.Get<RequestTimeoutOption>();
    m_connectTimeout = options.Get<ConnectTimeoutOption>();
    for (auto const& kv : options.Get<CustomHeadersOption>())
    {
        AddHeader(kv.first, kv.second);
    }
    return *this;
}

CurlRequestBuilder& CurlRequestBuilder::AddHeader(std::string const& header)
{
    ValidateBuilderState(__func__);
    auto newHeader = curl_slist_append(m_headers.get(), header.c_str());
    if (newHeader == nullptr)
        throw std::runtime_error("Cannot append header: " + header);
    (void)m_headers.release();
    m_headers.reset(newHeader);
    return *this;
}

CurlRequestBuilder& CurlRequestBuilder::SetMethod(std::string method)
{
    ValidateBuilderState(__func__);
    m_method = std::move(method);
    return *this;
}

CurlRequestBuilder& CurlRequestBuilder::SetProgressCallback(CurlRequest::ProgressCallback callback)
{
    ValidateBuilderState(__func__);
    m_progressCallback = std::move(callback);
    return *this;
}

std::string CurlRequestBuilder::UserAgentSuffix() const
{
    ValidateBuilderState(__func__);
    // Pre-compute and cache the user agent string:
    static std::string const UserAgentSuffix = [] {
        std::string agent = "rup/" + VersionString() + " ";
        agent += curl_version();
        return agent;
    }();
    return UserAgentSuffix;
}

void CurlRequestBuilder::ValidateBuilderState(char const* where) const
{
    if (m_handle.m_handle.get() == nullptr)
    {
        std::string msg = "Attempt to use invalidated CurlRequest in ";
        msg += where;
        throw std::runtime_error(msg);
    }
}

}  // namespace internal
}  // namespace rup
