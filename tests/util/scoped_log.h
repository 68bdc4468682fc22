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

#include "resumableupload/internal/log.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rup {
namespace testing {
namespace internal {

/**
 * Captures the log lines written while it is alive.
 *
 * @code
 * ScopedLog log;
 * engine.Pause();
 * EXPECT_THAT(log.ExtractLines(), Contains(HasSubstr("Paused upload")));
 * @endcode
 */
class ScopedLog
{
public:
    class Sink : public rup::internal::SinkBase
    {
    public:
        std::vector<std::string> ExtractLines();
        void SinkRecord(rup::internal::LogRecord const& logRec) override;
        void Flush() override {}

    private:
        std::mutex m_mu;
        std::vector<std::string> m_lines;
    };

    ScopedLog() : m_sink(std::make_shared<Sink>()), m_id(rup::internal::GetLogger()->AddSink(m_sink)) {}
    ~ScopedLog() { rup::internal::GetLogger()->RemoveSink(m_id); }

    ScopedLog(ScopedLog const&) = delete;
    ScopedLog& operator=(ScopedLog const&) = delete;

    std::vector<std::string> ExtractLines() { return m_sink->ExtractLines(); }

private:
    std::shared_ptr<Sink> m_sink;
    long m_id;
};

}  // namespace internal
}  // namespace testing
}  // namespace rup
