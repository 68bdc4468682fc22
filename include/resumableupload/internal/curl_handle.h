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

#pragma once

#include "resumableupload/internal/curl_wrappers.h"
#include "resumableupload/status_or_val.h"
#include <curl/curl.h>
#include <string>
#include <typeinfo>
#include <utility>

namespace rup {
namespace internal {
/**
 * Wraps CURL* handles in a safer C++ interface.
 *
 * This is a fairly straightforward wrapper around the CURL* handle. It provides
 * nicer C++-style API for the curl_*() functions, and some helpers to ease
 * the use of the API.
 */
class CurlHandle
{
public:
    /// Takes ownership of a handle created by a `CurlHandleFactory`.
    explicit CurlHandle(CurlPtr ptr);
    ~CurlHandle();

    // This class holds unique ptrs, disable copying.
    CurlHandle(CurlHandle const&) = delete;
    CurlHandle& operator=(CurlHandle const&) = delete;

    // Allow moves, they immediately disable the debug callback, it points into
    // the moved-from object.
    CurlHandle(CurlHandle&& rhs) noexcept : m_handle(std::move(rhs.m_handle)) { DisableLogging(); }

    CurlHandle& operator=(CurlHandle&& rhs) noexcept
    {
        m_handle = std::move(rhs.m_handle);
        DisableLogging();
        return *this;
    }

    template <typename T>
    void SetOption(CURLoption option, T&& param)
    {
        auto e = curl_easy_setopt(m_handle.get(), option, std::forward<T>(param));
        if (e == CURLE_OK)
        {
            return;
        }
        ThrowSetOptionError(e, option, std::forward<T>(param));
    }

    Status EasyPerform()
    {
        auto e = curl_easy_perform(m_handle.get());
        return AsStatus(e, __func__);
    }

    StatusOrVal<long> GetResponseCode()
    {
        long code;
        auto e = curl_easy_getinfo(m_handle.get(), CURLINFO_RESPONSE_CODE, &code);
        if (e == CURLE_OK)
        {
            return code;
        }
        return AsStatus(e, __func__);
    }

    void EnableLogging(bool enabled);

    // Flushes any debug data using RUP_LOG_DEBUG().
    void FlushDebug(char const* where);

    // Convert a CURLE_* error code to a rup::Status().
    static Status AsStatus(CURLcode e, char const* where);

private:
    friend class CurlRequest;
    friend class CurlRequestBuilder;

    void DisableLogging() noexcept;

    [[noreturn]] void ThrowSetOptionError(CURLcode e, CURLoption opt, long param);
    [[noreturn]] void ThrowSetOptionError(CURLcode e, CURLoption opt, char const* param);
    [[noreturn]] void ThrowSetOptionError(CURLcode e, CURLoption opt, void* param);
    template <typename T>
    [[noreturn]] void ThrowSetOptionError(CURLcode e, CURLoption opt, T)
    {
        std::string param = "complex-type=<";
        param += typeid(T).name();
        param += ">";
        ThrowSetOptionError(e, opt, param.c_str());
    }

    CurlPtr m_handle;
    std::string m_debugBuffer;
};

}  // namespace internal
}  // namespace rup
