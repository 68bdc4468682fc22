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
#include "util/status_matchers.h"
#include <gmock/gmock.h>

namespace rup {
namespace internal {
namespace {

using testing::util::StatusIs;

TEST(TusUtilsTest, EncodeUploadMetadata)
{
    EXPECT_EQ("", TusUtils::EncodeUploadMetadata({}).Value());
    EXPECT_EQ("filename dmlkZW8ubXA0,is_confidential,sessionId dXBsb2FkXzE=",
              TusUtils::EncodeUploadMetadata(
                  {{"filename", "video.mp4"}, {"sessionId", "upload_1"}, {"is_confidential", ""}})
                  .Value());
}

TEST(TusUtilsTest, EncodeUploadMetadataRejectsBadKeys)
{
    EXPECT_THAT(TusUtils::EncodeUploadMetadata({{"", "x"}}), StatusIs(StatusCode::InvalidArgument));
    EXPECT_THAT(TusUtils::EncodeUploadMetadata({{"file name", "x"}}), StatusIs(StatusCode::InvalidArgument));
    EXPECT_THAT(TusUtils::EncodeUploadMetadata({{"a,b", "x"}}), StatusIs(StatusCode::InvalidArgument));
}

TEST(TusUtilsTest, ResolveLocation)
{
    auto const endpoint = std::string("https://tus.example.com/api/files/");
    EXPECT_EQ("https://cdn.example.com/files/abc",
              TusUtils::ResolveLocation(endpoint, "https://cdn.example.com/files/abc"));
    EXPECT_EQ("https://tus.example.com/files/abc", TusUtils::ResolveLocation(endpoint, "/files/abc"));
    EXPECT_EQ("https://tus.example.com/api/files/abc", TusUtils::ResolveLocation(endpoint, "abc"));
    EXPECT_EQ("https://other.example.com/abc", TusUtils::ResolveLocation(endpoint, "//other.example.com/abc"));
    EXPECT_EQ("http://localhost:1080/files/abc",
              TusUtils::ResolveLocation("http://localhost:1080/files?token=1", "/files/abc"));
    EXPECT_EQ("http://localhost:1080/abc", TusUtils::ResolveLocation("http://localhost:1080", "abc"));
}

TEST(TusUtilsTest, ParseOffset)
{
    EXPECT_EQ(0U, TusUtils::ParseOffset("0").Value());
    EXPECT_EQ(40000000U, TusUtils::ParseOffset("40000000").Value());
    EXPECT_EQ(18446744073709551615ULL, TusUtils::ParseOffset("18446744073709551615").Value());
    EXPECT_THAT(TusUtils::ParseOffset(""), StatusIs(StatusCode::DataLoss));
    EXPECT_THAT(TusUtils::ParseOffset("-1"), StatusIs(StatusCode::DataLoss));
    EXPECT_THAT(TusUtils::ParseOffset("+1"), StatusIs(StatusCode::DataLoss));
    EXPECT_THAT(TusUtils::ParseOffset("12 "), StatusIs(StatusCode::DataLoss));
    EXPECT_THAT(TusUtils::ParseOffset("18446744073709551616"), StatusIs(StatusCode::DataLoss));
}

}  // namespace
}  // namespace internal
}  // namespace rup
