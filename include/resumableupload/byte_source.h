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

#include "resumableupload/status_or_val.h"
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace rup {

/**
 * A seekable, read-only input of known size.
 *
 * The engine reads one window at a time at arbitrary offsets, a resumed
 * session starts reading in the middle of the source.
 */
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    virtual std::uint64_t Size() const = 0;

    /**
     * Reads up to @p length bytes at @p offset.
     *
     * Returns fewer bytes only at the end of the source.
     */
    virtual StatusOrVal<std::string> Read(std::uint64_t offset, std::size_t length) = 0;

    /// A display name, e.g. the file name, empty if the source has none.
    virtual std::string Name() const = 0;
};

/**
 * Reads a local file.
 */
class FileByteSource : public ByteSource
{
public:
    /**
     * Opens @p path and determines its size.
     *
     * @return NotFound if the file cannot be opened.
     */
    static StatusOrVal<std::unique_ptr<FileByteSource>> Open(std::string const& path);

    std::uint64_t Size() const override { return m_size; }
    StatusOrVal<std::string> Read(std::uint64_t offset, std::size_t length) override;
    std::string Name() const override { return m_name; }

    std::string const& Path() const { return m_path; }

private:
    FileByteSource(std::string path, std::ifstream stream, std::uint64_t size);

    std::string m_path;
    std::string m_name;
    std::mutex m_mu;
    std::ifstream m_stream;
    std::uint64_t m_size;
};

/**
 * Serves bytes held in memory.
 */
class MemoryByteSource : public ByteSource
{
public:
    explicit MemoryByteSource(std::string data, std::string name = {})
        : m_data(std::move(data)), m_name(std::move(name))
    {
    }

    std::uint64_t Size() const override { return m_data.size(); }
    StatusOrVal<std::string> Read(std::uint64_t offset, std::size_t length) override;
    std::string Name() const override { return m_name; }

private:
    std::string m_data;
    std::string m_name;
};

}  // namespace rup
