// Copyright 2024 Andrew Karasyov
//
// Copyright 2018 Google LLC
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

#include "resumableupload/internal/curl_wrappers.h"
#include "resumableupload/internal/algorithm.h"
#include "resumableupload/internal/log.h"
#include <mutex>
#include <stdexcept>

namespace rup {
namespace internal {

std::size_t CurlAppendHeaderData(CurlReceivedHeaders& receivedHeaders, char const* data, std::size_t size)
{
    if (size <= 2)
    {
        // Empty header (including the \r\n), ignore.
        return size;
    }
    std::string const line(data, size);
    auto const colon = line.find(':');
    if (colon == std::string::npos)
    {
        // The status line ("HTTP/1.1 204 No Content") and other non-headers.
        return size;
    }
    auto name = StrToLower(StrTrim(line.substr(0, colon)));
    auto value = StrTrim(line.substr(colon + 1));
    receivedHeaders.emplace(std::move(name), std::move(value));
    return size;
}

void CurlInitializeOnce()
{
    static std::once_flag initialized;
    std::call_once(initialized, [] {
        auto const e = curl_global_init(CURL_GLOBAL_ALL);
        if (e != CURLE_OK)
        {
            RUP_LOG_ERROR("curl_global_init() failed: [{}] {}", static_cast<int>(e), curl_easy_strerror(e));
            throw std::runtime_error(std::string("Cannot initialize libcurl: ") + curl_easy_strerror(e));
        }
        auto const* info = curl_version_info(CURLVERSION_NOW);
        RUP_LOG_DEBUG("libcurl {} initialized, ssl={}", info->version, info->ssl_version ? info->ssl_version : "none");
    });
}

}  // namespace internal
}  // namespace rup
