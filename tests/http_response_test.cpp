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

#include "resumableupload/internal/http_response.h"
#include <gmock/gmock.h>
#include <sstream>

namespace rup {
namespace internal {
namespace {

using ::testing::HasSubstr;

TEST(HttpResponseTest, AsStatus)
{
    struct
    {
        long httpCode;
        StatusCode expected;
    } cases[]{
        {100, StatusCode::Ok},
        {200, StatusCode::Ok},
        {201, StatusCode::Ok},
        {204, StatusCode::Ok},
        {302, StatusCode::Unknown},
        {400, StatusCode::InvalidArgument},
        {401, StatusCode::Unauthenticated},
        {403, StatusCode::PermissionDenied},
        {404, StatusCode::NotFound},
        {405, StatusCode::PermissionDenied},
        {408, StatusCode::Unavailable},
        {409, StatusCode::Aborted},
        {410, StatusCode::NotFound},
        {412, StatusCode::FailedPrecondition},
        {413, StatusCode::OutOfRange},
        {415, StatusCode::InvalidArgument},
        {429, StatusCode::Unavailable},
        {460, StatusCode::InvalidArgument},
        {500, StatusCode::Unavailable},
        {501, StatusCode::Internal},
        {502, StatusCode::Unavailable},
        {503, StatusCode::Unavailable},
        {504, StatusCode::Unavailable},
        {599, StatusCode::Internal},
        {600, StatusCode::Unknown},
        {0, StatusCode::Unknown},
    };

    for (auto const& c : cases)
    {
        auto const status = AsStatus(HttpResponse{c.httpCode, "body", {}});
        EXPECT_EQ(c.expected, status.Code()) << "HTTP code=" << c.httpCode;
        if (!status.Ok())
            EXPECT_EQ("body", status.Message()) << "HTTP code=" << c.httpCode;
    }
}

TEST(HttpResponseTest, Header)
{
    HttpResponse response{204, "", {{"upload-offset", "1024"}, {"tus-resumable", "1.0.0"}}};
    EXPECT_EQ("1024", response.Header("upload-offset").value_or(""));
    EXPECT_FALSE(response.Header("Upload-Offset").has_value());
    EXPECT_FALSE(response.Header("location").has_value());
}

TEST(HttpResponseTest, Streaming)
{
    HttpResponse response{201, "created", {{"location", "/files/abc"}}};
    std::ostringstream os;
    os << response;
    EXPECT_THAT(os.str(), HasSubstr("m_statusCode=201"));
    EXPECT_THAT(os.str(), HasSubstr("location: /files/abc"));
    EXPECT_THAT(os.str(), HasSubstr("payload=<created>"));
}

}  // namespace
}  // namespace internal
}  // namespace rup
