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

#include "resumableupload/internal/curl_wrappers.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rup {
namespace internal {
/**
 * Implements the Factory Pattern for CURL handles.
 */
class CurlHandleFactory
{
public:
    virtual ~CurlHandleFactory() = default;

    virtual CurlPtr CreateHandle() = 0;
    virtual void CleanupHandle(CurlPtr&&) = 0;
};

/**
 * Returns the factory matching `ConnectionPoolSizeOption`.
 *
 * A pool size of zero creates a handle per request.
 */
std::shared_ptr<CurlHandleFactory> CreateCurlHandleFactory(std::size_t connectionPoolSize);

/**
 * Implements the default CurlHandleFactory.
 *
 * This implementation of the CurlHandleFactory does not save handles, it
 * creates a new handle on each call to `CreateHandle()` and releases the
 * handle on `CleanupHandle()`.
 */
class DefaultCurlHandleFactory : public CurlHandleFactory
{
public:
    DefaultCurlHandleFactory() = default;

    CurlPtr CreateHandle() override;
    void CleanupHandle(CurlPtr&&) override;
};

/**
 * Implements a CurlHandleFactory that pools handles.
 *
 * This implementation keeps up to N handles in memory, they are only released
 * when the factory is destructed. Reusing a handle reuses its connection, a
 * session sending many chunks to the same server avoids a TLS handshake per
 * chunk.
 */
class PooledCurlHandleFactory : public CurlHandleFactory
{
public:
    explicit PooledCurlHandleFactory(std::size_t maximumSize);
    ~PooledCurlHandleFactory() override;

    CurlPtr CreateHandle() override;
    void CleanupHandle(CurlPtr&&) override;

    // Testing only.
    std::size_t CurrentHandleCount() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_handles.size();
    }

private:
    std::size_t m_maximumSize;
    mutable std::mutex m_mutex;
    std::vector<CURL*> m_handles;
};

}  // namespace internal
}  // namespace rup
