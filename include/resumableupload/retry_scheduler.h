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

#include "resumableupload/options.h"
#include "resumableupload/status_or_val.h"
#include <chrono>
#include <optional>
#include <vector>

namespace rup {

enum class ErrorClass
{
    Retryable,
    Fatal,
};

namespace internal {
struct StatusTraits
{
    /**
     * Network failures, timeouts, throttling and server errors are transient,
     * everything else fails the operation right away.
     */
    static bool IsPermanentFailure(Status const& status)
    {
        return status.Code() != StatusCode::DeadlineExceeded && status.Code() != StatusCode::Internal &&
               status.Code() != StatusCode::ResourceExhausted && status.Code() != StatusCode::Unavailable;
    }
};
}  // namespace internal

inline ErrorClass ClassifyStatus(Status const& status)
{
    return internal::StatusTraits::IsPermanentFailure(status) ? ErrorClass::Fatal : ErrorClass::Retryable;
}

/**
 * Maps the number of consecutive failures of a chunk to the delay before the
 * next attempt.
 *
 * The scheduler holds no state besides its configuration: the same inputs
 * always produce the same delay, the caller owns the attempt counter.
 *
 * @code
 * int attempt = 0;
 * for (;;)
 * {
 *     auto status = TransferWindow();
 *     if (status.Ok())
 *         break;
 *     auto delay = scheduler.NextDelay(++attempt, ClassifyStatus(status));
 *     if (!delay)
 *         return Fail(status);
 *     Wait(*delay);
 * }
 * @endcode
 */
class RetryScheduler
{
public:
    /// Uses the default sequence `{0s, 3s, 5s, 10s, 20s}` and five attempts.
    RetryScheduler();

    /**
     * Validates and creates a scheduler.
     *
     * @return InvalidArgument if @p delays is empty, contains a negative delay,
     *     is not non-decreasing, or if @p maxAttempts is smaller than one.
     */
    static StatusOrVal<RetryScheduler> Create(std::vector<std::chrono::milliseconds> delays, int maxAttempts);

    /// Creates a scheduler from `RetryDelaysOption` and `MaxRetryAttemptsOption`.
    static StatusOrVal<RetryScheduler> Create(Options const& options);

    /**
     * The delay before the next attempt, or none when the failure must not be
     * retried.
     *
     * @param attempt the number of consecutive failures of the current window.
     *     Zero names the first attempt, so `delays[0]` is only returned for it.
     */
    std::optional<std::chrono::milliseconds> NextDelay(int attempt, ErrorClass errorClass) const;

    int MaxAttempts() const { return m_maxAttempts; }
    std::vector<std::chrono::milliseconds> const& Delays() const { return m_delays; }

private:
    RetryScheduler(std::vector<std::chrono::milliseconds> delays, int maxAttempts);

    std::vector<std::chrono::milliseconds> m_delays;
    int m_maxAttempts;
};

}  // namespace rup
