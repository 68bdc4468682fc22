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

#include "resumableupload/retry_scheduler.h"
#include "resumableupload/upload_options.h"
#include <algorithm>

namespace rup {

namespace {
std::vector<std::chrono::milliseconds> DefaultDelays()
{
    using std::chrono::seconds;
    return {std::chrono::milliseconds(0), seconds(3), seconds(5), seconds(10), seconds(20)};
}

int constexpr DefaultMaxAttempts = 5;
}  // namespace

RetryScheduler::RetryScheduler() : RetryScheduler(DefaultDelays(), DefaultMaxAttempts) {}

RetryScheduler::RetryScheduler(std::vector<std::chrono::milliseconds> delays, int maxAttempts)
    : m_delays(std::move(delays)), m_maxAttempts(maxAttempts)
{
}

StatusOrVal<RetryScheduler> RetryScheduler::Create(std::vector<std::chrono::milliseconds> delays, int maxAttempts)
{
    if (delays.empty())
        return Status(StatusCode::InvalidArgument, "RetryScheduler: the delay sequence is empty");
    if (maxAttempts < 1)
    {
        return Status(StatusCode::InvalidArgument,
                      "RetryScheduler: maxAttempts must be positive, got " + std::to_string(maxAttempts));
    }
    if (delays.front() < std::chrono::milliseconds(0))
        return Status(StatusCode::InvalidArgument, "RetryScheduler: negative delay");
    if (!std::is_sorted(delays.begin(), delays.end()))
        return Status(StatusCode::InvalidArgument, "RetryScheduler: the delay sequence must be non-decreasing");
    return RetryScheduler(std::move(delays), maxAttempts);
}

StatusOrVal<RetryScheduler> RetryScheduler::Create(Options const& options)
{
    auto delays = options.Has<RetryDelaysOption>() ? options.Get<RetryDelaysOption>() : DefaultDelays();
    auto maxAttempts =
        options.Has<MaxRetryAttemptsOption>() ? options.Get<MaxRetryAttemptsOption>() : DefaultMaxAttempts;
    return Create(std::move(delays), maxAttempts);
}

std::optional<std::chrono::milliseconds> RetryScheduler::NextDelay(int attempt, ErrorClass errorClass) const
{
    if (errorClass == ErrorClass::Fatal)
        return std::nullopt;
    if (attempt >= m_maxAttempts)
        return std::nullopt;
    auto const index = std::min(static_cast<std::size_t>(std::max(attempt, 0)), m_delays.size() - 1);
    return m_delays[index];
}

}  // namespace rup
