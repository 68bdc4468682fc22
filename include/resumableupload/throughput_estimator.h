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

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>

namespace rup {

/**
 * The speed of the most recent sampling interval and the remaining time it
 * predicts.
 */
struct ThroughputReport
{
    std::uint64_t m_bytesUploaded = 0;
    double m_speedBytesPerSecond = 0.0;
    // Unknown while the speed is zero.
    std::optional<double> m_estimatedSecondsRemaining;
};

std::ostream& operator<<(std::ostream& os, ThroughputReport const& rhs);

/**
 * Computes instantaneous upload speed and the estimated remaining time from
 * `(bytes uploaded so far, timestamp)` samples.
 *
 * The speed is the delta over the most recent sampling interval, not a lifetime
 * average. After construction and after `Reset()` the first sample only seeds
 * the window, so a paused gap never shows up as a speed drop or spike.
 *
 * This class is not thread safe.
 */
class ThroughputEstimator
{
public:
    explicit ThroughputEstimator(std::uint64_t totalBytes,
                                 std::chrono::milliseconds samplingInterval = std::chrono::seconds(1));

    /**
     * Adds a sample.
     *
     * @return a report when at least one sampling interval passed since the
     *     previous report (or the seeding sample), none otherwise.
     */
    std::optional<ThroughputReport> AddSample(std::uint64_t bytesUploaded, std::chrono::steady_clock::time_point now);

    /// Forgets the window, the next sample seeds a new one.
    void Reset();

    std::optional<ThroughputReport> const& LastReport() const { return m_lastReport; }
    std::chrono::milliseconds SamplingInterval() const { return m_samplingInterval; }

private:
    std::uint64_t m_totalBytes;
    std::chrono::milliseconds m_samplingInterval;
    std::optional<std::uint64_t> m_windowBytes;
    std::chrono::steady_clock::time_point m_windowStart;
    std::optional<ThroughputReport> m_lastReport;
};

}  // namespace rup
