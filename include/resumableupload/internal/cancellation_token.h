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

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace rup {
namespace internal {

/**
 * Signals a session worker to stop at its next suspension point.
 *
 * Each run of the worker owns one token. In-flight requests poll it from the
 * libcurl progress callback, backoff waits block on it.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(CancellationToken const&) = delete;
    CancellationToken& operator=(CancellationToken const&) = delete;

    /// Idempotent. Wakes every thread blocked in `WaitFor()`.
    void Cancel()
    {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cancelled.store(true);
        }
        m_cv.notify_all();
    }

    bool IsCancelled() const { return m_cancelled.load(); }

    /**
     * Blocks for @p delay or until the token is cancelled.
     *
     * @return true if the token was cancelled.
     */
    bool WaitFor(std::chrono::milliseconds delay)
    {
        std::unique_lock<std::mutex> lk(m_mu);
        return m_cv.wait_for(lk, delay, [this] { return m_cancelled.load(); });
    }

private:
    std::mutex m_mu;
    std::condition_variable m_cv;
    std::atomic<bool> m_cancelled{false};
};

}  // namespace internal
}  // namespace rup
