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
#include <gmock/gmock.h>
#include <sstream>

namespace rup {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;
using ::testing::DoubleEq;
using ::testing::HasSubstr;

class ThroughputEstimatorTest : public ::testing::Test
{
protected:
    std::chrono::steady_clock::time_point const m_t0 = std::chrono::steady_clock::now();
};

TEST_F(ThroughputEstimatorTest, FirstSampleSeedsWindow)
{
    ThroughputEstimator estimator(100000000);
    EXPECT_FALSE(estimator.AddSample(0, m_t0).has_value());
    EXPECT_FALSE(estimator.LastReport().has_value());
}

TEST_F(ThroughputEstimatorTest, ReportsSpeedAndEta)
{
    ThroughputEstimator estimator(100000000);
    estimator.AddSample(0, m_t0);
    auto report = estimator.AddSample(1000000, m_t0 + seconds(1));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(1000000U, report->m_bytesUploaded);
    EXPECT_THAT(report->m_speedBytesPerSecond, DoubleEq(1000000.0));
    ASSERT_TRUE(report->m_estimatedSecondsRemaining.has_value());
    EXPECT_THAT(*report->m_estimatedSecondsRemaining, DoubleEq(99.0));
}

TEST_F(ThroughputEstimatorTest, UsesMostRecentInterval)
{
    ThroughputEstimator estimator(10000);
    estimator.AddSample(0, m_t0);
    estimator.AddSample(4000, m_t0 + seconds(1));
    auto report = estimator.AddSample(5000, m_t0 + seconds(2));
    ASSERT_TRUE(report.has_value());
    EXPECT_THAT(report->m_speedBytesPerSecond, DoubleEq(1000.0));
    EXPECT_THAT(report->m_estimatedSecondsRemaining.value_or(-1), DoubleEq(5.0));
}

TEST_F(ThroughputEstimatorTest, WaitsForSamplingInterval)
{
    ThroughputEstimator estimator(10000, seconds(1));
    estimator.AddSample(0, m_t0);
    EXPECT_FALSE(estimator.AddSample(100, m_t0 + milliseconds(400)).has_value());
    EXPECT_FALSE(estimator.AddSample(200, m_t0 + milliseconds(999)).has_value());
    auto report = estimator.AddSample(2000, m_t0 + milliseconds(2000));
    ASSERT_TRUE(report.has_value());
    EXPECT_THAT(report->m_speedBytesPerSecond, DoubleEq(1000.0));
}

TEST_F(ThroughputEstimatorTest, NoProgressHasUnknownEta)
{
    ThroughputEstimator estimator(10000);
    estimator.AddSample(500, m_t0);
    auto report = estimator.AddSample(500, m_t0 + seconds(3));
    ASSERT_TRUE(report.has_value());
    EXPECT_THAT(report->m_speedBytesPerSecond, DoubleEq(0.0));
    EXPECT_FALSE(report->m_estimatedSecondsRemaining.has_value());
}

TEST_F(ThroughputEstimatorTest, DiscardedBytesCountAsNoProgress)
{
    ThroughputEstimator estimator(10000);
    estimator.AddSample(800, m_t0);
    auto report = estimator.AddSample(300, m_t0 + seconds(1));
    ASSERT_TRUE(report.has_value());
    EXPECT_THAT(report->m_speedBytesPerSecond, DoubleEq(0.0));
}

TEST_F(ThroughputEstimatorTest, ResetIgnoresPausedGap)
{
    ThroughputEstimator estimator(10000);
    estimator.AddSample(0, m_t0);
    estimator.AddSample(1000, m_t0 + seconds(1));
    estimator.Reset();
    EXPECT_FALSE(estimator.LastReport().has_value());

    // One hour paused, the first sample after the reset only seeds the window.
    EXPECT_FALSE(estimator.AddSample(1000, m_t0 + seconds(3601)).has_value());
    auto report = estimator.AddSample(3000, m_t0 + seconds(3602));
    ASSERT_TRUE(report.has_value());
    EXPECT_THAT(report->m_speedBytesPerSecond, DoubleEq(2000.0));
}

TEST_F(ThroughputEstimatorTest, Streaming)
{
    ThroughputReport report;
    report.m_bytesUploaded = 10;
    std::ostringstream os;
    os << report;
    EXPECT_THAT(os.str(), HasSubstr("bytesUploaded=10"));
    EXPECT_THAT(os.str(), HasSubstr("estimatedSecondsRemaining=unknown"));
}

}  // namespace
}  // namespace rup
