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

#include "resumableupload/internal/utils.h"
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace rup {
namespace internal {

namespace {
auto constexpr Base64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}  // namespace

std::optional<std::string> GetEnv(char const* variable)
{
#if _WIN32
    // On Windows, std::getenv() is not thread-safe. It returns a pointer that
    // can be invalidated by _putenv_s().
    char* buffer;
    std::size_t size;
    _dupenv_s(&buffer, &size, variable);
    std::unique_ptr<char, decltype(&free)> release(buffer, &free);
#else
    char* buffer = std::getenv(variable);
#endif  // _WIN32
    if (buffer == nullptr)
        return std::nullopt;

    return std::string{buffer};
}

void UnsetEnv(char const* variable)
{
#ifdef _WIN32
    (void)_putenv_s(variable, "");
#else
    unsetenv(variable);
#endif  // _WIN32
}

void SetEnv(char const* variable, std::optional<std::string> const& value)
{
    if (!value.has_value())
    {
        UnsetEnv(variable);
        return;
    }
#ifdef _WIN32
    (void)_putenv_s(variable, value->c_str());
#else
    (void)setenv(variable, value->c_str(), 1);
#endif  // _WIN32
}

std::string BinaryDataAsDebugString(char const* data, std::size_t size, std::size_t maxOutputBytes)
{
    std::size_t const textWidth = 24;
    std::string result;
    std::string textColumn(textWidth, ' ');
    std::string hexColumn(2 * textWidth, ' ');

    auto flush = [&result, &textColumn, &hexColumn, textWidth] {
        result += textColumn;
        result += ' ';
        result += hexColumn;
        result += '\n';
        textColumn = std::string(textWidth, ' ');
        hexColumn = std::string(2 * textWidth, ' ');
    };

    std::size_t n = size;
    if (maxOutputBytes > 0 && maxOutputBytes < size)
        n = maxOutputBytes;

    std::size_t count = 0;
    for (char const* c = data; c != data + n; ++c)
    {
        // std::isprint() takes an int, avoid sign extension of negative chars.
        int cval = static_cast<unsigned char>(*c);
        textColumn[count] = std::isprint(cval) != 0 ? *c : '.';
        std::array<char, 3> buf{};
        std::snprintf(buf.data(), buf.size(), "%02x", cval);
        hexColumn[2 * count] = buf[0];
        hexColumn[2 * count + 1] = buf[1];
        if (++count == textWidth)
        {
            flush();
            count = 0;
        }
    }
    if (count != 0)
        flush();
    return result;
}

std::string Base64Encode(std::string const& bytes)
{
    std::string result;
    result.reserve((bytes.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3)
    {
        auto const n = (std::uint32_t(static_cast<unsigned char>(bytes[i])) << 16) |
                       (std::uint32_t(static_cast<unsigned char>(bytes[i + 1])) << 8) |
                       std::uint32_t(static_cast<unsigned char>(bytes[i + 2]));
        result += Base64Alphabet[(n >> 18) & 0x3F];
        result += Base64Alphabet[(n >> 12) & 0x3F];
        result += Base64Alphabet[(n >> 6) & 0x3F];
        result += Base64Alphabet[n & 0x3F];
    }
    auto const rest = bytes.size() - i;
    if (rest == 1)
    {
        auto const n = std::uint32_t(static_cast<unsigned char>(bytes[i])) << 16;
        result += Base64Alphabet[(n >> 18) & 0x3F];
        result += Base64Alphabet[(n >> 12) & 0x3F];
        result += "==";
    }
    else if (rest == 2)
    {
        auto const n = (std::uint32_t(static_cast<unsigned char>(bytes[i])) << 16) |
                       (std::uint32_t(static_cast<unsigned char>(bytes[i + 1])) << 8);
        result += Base64Alphabet[(n >> 18) & 0x3F];
        result += Base64Alphabet[(n >> 12) & 0x3F];
        result += Base64Alphabet[(n >> 6) & 0x3F];
        result += '=';
    }
    return result;
}

}  // namespace internal
}  // namespace rup
