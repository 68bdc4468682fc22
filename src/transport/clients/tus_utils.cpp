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

#include "resumableupload/internal/clients/tus_utils.h"
#include "resumableupload/internal/algorithm.h"
#include "resumableupload/internal/utils.h"
#include <cerrno>
#include <cstdlib>

namespace rup {
namespace internal {

namespace {
bool HasScheme(std::string const& url)
{
    auto const lower = StrToLower(url.substr(0, 8));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

// Returns "scheme://authority" of @p url.
std::string Origin(std::string const& url)
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
        return std::string();
    auto const pathStart = url.find_first_of("/?#", schemeEnd + 3);
    return url.substr(0, pathStart);
}
}  // namespace

StatusOrVal<std::string> TusUtils::EncodeUploadMetadata(UploadMetadata const& metadata)
{
    std::vector<std::string> pairs;
    pairs.reserve(metadata.size());
    for (auto const& kv : metadata)
    {
        if (kv.first.empty() || kv.first.find_first_of(" ,") != std::string::npos)
        {
            return Status(StatusCode::InvalidArgument,
                          "Upload metadata keys must be non-empty and contain neither spaces nor commas, key=<" +
                              kv.first + ">");
        }
        if (kv.second.empty())
            pairs.push_back(kv.first);
        else
            pairs.push_back(kv.first + " " + Base64Encode(kv.second));
    }
    return StrJoin(pairs, ",");
}

std::string TusUtils::ResolveLocation(std::string const& endpoint, std::string const& location)
{
    if (location.empty() || HasScheme(location))
        return location;
    if (location.rfind("//", 0) == 0)
    {
        auto const schemeEnd = endpoint.find("://");
        return schemeEnd == std::string::npos ? location : endpoint.substr(0, schemeEnd + 1) + location;
    }
    if (location.front() == '/')
        return Origin(endpoint) + location;

    // Relative to the directory of the endpoint path, without its query.
    auto base = endpoint.substr(0, endpoint.find_first_of("?#"));
    auto const origin = Origin(base);
    auto const lastSlash = base.rfind('/');
    if (lastSlash == std::string::npos || lastSlash < origin.size())
        return origin + "/" + location;
    return base.substr(0, lastSlash + 1) + location;
}

StatusOrVal<std::uint64_t> TusUtils::ParseOffset(std::string const& value)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        return Status(StatusCode::DataLoss, "Invalid offset header value <" + value + ">");
    errno = 0;
    char* end = nullptr;
    auto const result = std::strtoull(value.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0')
        return Status(StatusCode::DataLoss, "Offset header value out of range <" + value + ">");
    return static_cast<std::uint64_t>(result);
}

}  // namespace internal
}  // namespace rup
