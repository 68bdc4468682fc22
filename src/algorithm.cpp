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

#include "resumableupload/internal/algorithm.h"
#include <cctype>
#include <numeric>
#include <sstream>

namespace rup {
namespace internal {

std::vector<std::string> StrSplit(const std::string& str, char delim)
{
    std::vector<std::string> result;
    std::istringstream input{str};
    for (std::string token; std::getline(input, token, delim);)
    {
        result.emplace_back(std::move(token));
    }
    return result;
}

std::string StrJoin(const std::vector<std::string>& arr, const std::string& delim)
{
    if (arr.empty())
        return "";
    return std::accumulate(std::next(arr.begin()), arr.end(), *(arr.begin()),
                           [&delim](auto res, const auto& s) { return std::move(res) + delim + s; });
}

std::string StrTrim(std::string const& str)
{
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    auto first = std::find_if_not(str.begin(), str.end(), isSpace);
    auto last = std::find_if_not(str.rbegin(), str.rend(), isSpace).base();
    if (first >= last)
        return std::string();
    return std::string(first, last);
}

std::string StrToLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return str;
}

}  // namespace internal
}  // namespace rup
