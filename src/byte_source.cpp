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

#include "resumableupload/byte_source.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace rup {

namespace {
std::string BaseName(std::string const& path)
{
    auto const pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

Status OutOfRangeRead(std::uint64_t offset, std::uint64_t size)
{
    return Status(StatusCode::OutOfRange,
                  "Read offset " + std::to_string(offset) + " is beyond the source size " + std::to_string(size));
}
}  // namespace

StatusOrVal<std::unique_ptr<FileByteSource>> FileByteSource::Open(std::string const& path)
{
    std::error_code ec;
    auto const fileStatus = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(fileStatus))
        return Status(StatusCode::NotFound, "Cannot open file <" + path + ">");
    if (!std::filesystem::is_regular_file(fileStatus))
    {
        // Pipes and devices have no stable size and cannot be re-read at an
        // offset after a restart.
        return Status(StatusCode::InvalidArgument, "<" + path + "> is not a regular file");
    }
    auto const fileSize = std::filesystem::file_size(path, ec);
    if (ec)
        return Status(StatusCode::NotFound, ec.message());

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
        return Status(StatusCode::PermissionDenied, "Cannot open file <" + path + "> for reading");
    return std::unique_ptr<FileByteSource>(
        new FileByteSource(path, std::move(stream), static_cast<std::uint64_t>(fileSize)));
}

FileByteSource::FileByteSource(std::string path, std::ifstream stream, std::uint64_t size)
    : m_path(std::move(path)), m_name(BaseName(m_path)), m_stream(std::move(stream)), m_size(size)
{
}

StatusOrVal<std::string> FileByteSource::Read(std::uint64_t offset, std::size_t length)
{
    if (offset > m_size)
        return OutOfRangeRead(offset, m_size);
    auto const toRead = static_cast<std::size_t>(std::min<std::uint64_t>(length, m_size - offset));

    std::lock_guard<std::mutex> lk(m_mu);
    m_stream.clear();
    m_stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!m_stream)
        return Status(StatusCode::Unknown, "Cannot seek to offset " + std::to_string(offset) + " in <" + m_path + ">");

    std::string buffer(toRead, '\0');
    m_stream.read(&buffer[0], static_cast<std::streamsize>(toRead));
    auto const got = static_cast<std::size_t>(m_stream.gcount());
    if (got != toRead)
    {
        return Status(StatusCode::DataLoss, "Short read from <" + m_path + ">: expected " + std::to_string(toRead) +
                                                " bytes at offset " + std::to_string(offset) + ", got " +
                                                std::to_string(got));
    }
    return buffer;
}

StatusOrVal<std::string> MemoryByteSource::Read(std::uint64_t offset, std::size_t length)
{
    if (offset > m_data.size())
        return OutOfRangeRead(offset, m_data.size());
    return m_data.substr(static_cast<std::size_t>(offset), length);
}

}  // namespace rup
