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

#include "resumableupload/internal/curl_handle.h"
#include "resumableupload/internal/curl_handle_factory.h"
#include <gmock/gmock.h>

namespace rup {
namespace internal {
namespace {

using ::testing::HasSubstr;

TEST(CurlHandleTest, AsStatus)
{
    struct
    {
        CURLcode curl;
        StatusCode expected;
    } expectedCodes[]{
        {CURLE_OK, StatusCode::Ok},
        {CURLE_RECV_ERROR, StatusCode::Unavailable},
        {CURLE_SEND_ERROR, StatusCode::Unavailable},
        {CURLE_PARTIAL_FILE, StatusCode::Unavailable},
        {CURLE_SSL_CONNECT_ERROR, StatusCode::Unavailable},
        {CURLE_COULDNT_RESOLVE_HOST, StatusCode::Unavailable},
        {CURLE_COULDNT_RESOLVE_PROXY, StatusCode::Unavailable},
        {CURLE_COULDNT_CONNECT, StatusCode::Unavailable},
        {CURLE_GOT_NOTHING, StatusCode::Unavailable},
        {CURLE_WEIRD_SERVER_REPLY, StatusCode::Unavailable},
        {CURLE_HTTP2, StatusCode::Unavailable},
        {CURLE_HTTP2_STREAM, StatusCode::Unavailable},
        {CURLE_REMOTE_ACCESS_DENIED, StatusCode::PermissionDenied},
        {CURLE_OPERATION_TIMEDOUT, StatusCode::DeadlineExceeded},
        {CURLE_ABORTED_BY_CALLBACK, StatusCode::Aborted},
        {CURLE_URL_MALFORMAT, StatusCode::InvalidArgument},
        {CURLE_UNSUPPORTED_PROTOCOL, StatusCode::InvalidArgument},
        {CURLE_FAILED_INIT, StatusCode::Unknown},
        {CURLE_AGAIN, StatusCode::Unknown},
    };

    for (auto const& codes : expectedCodes)
    {
        auto const actual = CurlHandle::AsStatus(codes.curl, "in-test");
        EXPECT_EQ(codes.expected, actual.Code()) << "CURL code=" << codes.curl;
        if (!actual.Ok())
        {
            EXPECT_THAT(actual.Message(), HasSubstr("in-test"));
            EXPECT_THAT(actual.Message(), HasSubstr(curl_easy_strerror(codes.curl)));
        }
    }
}

TEST(CurlHandleTest, SetOptionErrorThrows)
{
    DefaultCurlHandleFactory factory;
    CurlHandle handle(factory.CreateHandle());
    // CURLOPT_SSLVERSION rejects values beyond the known TLS versions.
    EXPECT_THROW(handle.SetOption(CURLOPT_SSLVERSION, 1000L), std::runtime_error);
}

}  // namespace
}  // namespace internal
}  // namespace rup
