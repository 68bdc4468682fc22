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

#include "resumableupload/byte_source.h"
#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rup {
namespace testing {
namespace internal {

/**
 * A `ByteSource` of any size whose byte at offset `i` is `i % 251`, nothing is
 * kept in memory.
 */
class PatternByteSource : public ByteSource
{
public:
    explicit PatternByteSource(std::uint64_t size, std::string name = "pattern.bin")
        : m_size(size), m_name(std::move(name))
    {
    }

    static char ByteAt(std::uint64_t offset) { return static_cast<char>(offset % 251); }

    std::uint64_t Size() const override { return m_size; }
    std::string Name() const override { return m_name; }

    StatusOrVal<std::string> Read(std::uint64_t offset, std::size_t length) override
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_reads.emplace_back(offset, length);
        if (m_failReads)
            return Status(StatusCode::DataLoss, "disk error");
        if (offset > m_size)
            return Status(StatusCode::OutOfRange, "offset beyond the end");
        auto const n = static_cast<std::size_t>(std::min<std::uint64_t>(length, m_size - offset));
        std::string result(n, '\0');
        for (std::size_t i = 0; i != n; ++i)
            result[i] = ByteAt(offset + i);
        return result;
    }

    void FailReads(bool fail)
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_failReads = fail;
    }

    std::vector<std::pair<std::uint64_t, std::size_t>> Reads()
    {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_reads;
    }

private:
    std::uint64_t m_size;
    std::string m_name;
    std::mutex m_mu;
    bool m_failReads = false;
    std::vector<std::pair<std::uint64_t, std::size_t>> m_reads;
};

}  // namespace internal
}  // namespace testing
}  // namespace rup
