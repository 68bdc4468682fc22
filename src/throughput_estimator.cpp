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

#include "resumableupload/throughput_estimator.h"
#include <iostream>

namespace rup {

std::ostream& operator<<(std::ostream& os, ThroughputReport const& rhs)
{
    os << "ThroughputReport={bytesUploaded=" << rhs.m_bytesUploaded << ", speedBytesPerSecond="
       << rhs.m_speedBytesPerSecond << ", estimatedSecondsRemaining=";
    if (rhs.m_estimatedSecondsRemaining)
        os << *rhs.m_estimatedSecondsRemaining;
    else
        os << "unknown";
    return os << "}";
}

ThroughputEstimator::ThroughputEstimator(std::uint64_t totalBytes, std::chrono::milliseconds samplingInterval)
    : m_totalBytes(totalBytes), m_samplingInterval(samplingInterval)
{
}

std::optional<ThroughputReport> ThroughputEstimator::AddSample(std::uint64_t bytesUploaded,
                                                               std::chrono::steady_clock::time_point now)
{
    if (!m_windowBytes)
    {
        m_windowBytes = bytesUploaded;
        m_windowStart = now;
        return std::nullopt;
    }

    auto const elapsed = now - m_windowStart;
    if (elapsed < m_samplingInterval || elapsed.count() <= 0)
        return std::nullopt;

    // A failed attempt discards the bytes sent in flight, the counter may go
    // back. That interval made no progress.
    auto const delta = bytesUploaded > *m_windowBytes ? bytesUploaded - *m_windowBytes : 0;
    auto const seconds = std::chrono::duration<double>(elapsed).count();

    ThroughputReport report;
    report.m_bytesUploaded = bytesUploaded;
    report.m_speedBytesPerSecond = static_cast<double>(delta) / seconds;
    if (report.m_speedBytesPerSecond > 0.0)
    {
        auto const remaining = bytesUploaded < m_totalBytes ? m_totalBytes - bytesUploaded : 0;
        report.m_estimatedSecondsRemaining = static_cast<double>(remaining) / report.m_speedBytesPerSecond;
    }

    m_windowBytes = bytesUploaded;
    m_windowStart = now;
    m_lastReport = report;
    return report;
}

void ThroughputEstimator::Reset()
{
    m_windowBytes.reset();
    m_lastReport.reset();
}

}  // namespace rup
