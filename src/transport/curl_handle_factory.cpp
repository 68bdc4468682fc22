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

#include "resumableupload/internal/curl_handle_factory.h"
#include <stdexcept>

namespace rup {
namespace internal {

namespace {
CurlPtr MakeCurlPtr()
{
    CurlInitializeOnce();
    CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl)
        throw std::runtime_error("Cannot initialize CURL handle");
    return curl;
}
}  // namespace

std::shared_ptr<CurlHandleFactory> CreateCurlHandleFactory(std::size_t connectionPoolSize)
{
    if (connectionPoolSize == 0)
        return std::make_shared<DefaultCurlHandleFactory>();
    return std::make_shared<PooledCurlHandleFactory>(connectionPoolSize);
}

CurlPtr DefaultCurlHandleFactory::CreateHandle() { return MakeCurlPtr(); }

void DefaultCurlHandleFactory::CleanupHandle(CurlPtr&& h) { h.reset(); }

PooledCurlHandleFactory::PooledCurlHandleFactory(std::size_t maximumSize) : m_maximumSize(maximumSize) {}

PooledCurlHandleFactory::~PooledCurlHandleFactory()
{
    for (auto* h : m_handles)
    {
        curl_easy_cleanup(h);
    }
}

CurlPtr PooledCurlHandleFactory::CreateHandle()
{
    std::unique_lock<std::mutex> lk(m_mutex);
    if (!m_handles.empty())
    {
        CURL* handle = m_handles.back();
        // Clear all the options in the handle so we do not leak its previous state.
        curl_easy_reset(handle);
        m_handles.pop_back();
        return CurlPtr(handle, &curl_easy_cleanup);
    }
    lk.unlock();
    return MakeCurlPtr();
}

void PooledCurlHandleFactory::CleanupHandle(CurlPtr&& h)
{
    if (!h)
        return;
    std::unique_lock<std::mutex> lk(m_mutex);
    while (m_handles.size() >= m_maximumSize)
    {
        CURL* tmp = m_handles.front();
        m_handles.erase(m_handles.begin());
        curl_easy_cleanup(tmp);
    }
    // The m_handles vector now has ownership, so release it.
    m_handles.push_back(h.release());
}

}  // namespace internal
}  // namespace rup
