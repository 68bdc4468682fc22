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

#include "resumableupload/internal/utils.h"
#include "util/scoped_environment.h"
#include <gmock/gmock.h>
#include <algorithm>

namespace rup {
namespace internal {
namespace {

using testing::internal::ScopedEnvironment;
using ::testing::HasSubstr;

auto constexpr VarName = "RUP_UTILS_TEST_VAR";

TEST(SetEnvTest, SetEmptyEnvVar)
{
    ScopedEnvironment env(VarName, std::nullopt);
    SetEnv(VarName, "");
#ifdef _WIN32
    EXPECT_FALSE(GetEnv(VarName).has_value());
#else
    EXPECT_THAT(GetEnv(VarName), ::testing::Optional(std::string{}));
#endif
}

TEST(SetEnvTest, UnsetEnv)
{
    ScopedEnvironment env(VarName, "foo");
    EXPECT_EQ("foo", GetEnv(VarName).value_or(""));
    UnsetEnv(VarName);
    EXPECT_FALSE(GetEnv(VarName).has_value());
}

TEST(BinaryDataAsDebugStringTest, Simple)
{
    auto actual = BinaryDataAsDebugString("123abc", 6);
    EXPECT_EQ("123abc" + std::string(18, ' ') + " 313233616263" + std::string(36, ' ') + "\n", actual);
}

TEST(BinaryDataAsDebugStringTest, NonPrintable)
{
    auto actual = BinaryDataAsDebugString("\x03\xf1 abc", 6);
    EXPECT_EQ(".. abc" + std::string(18, ' ') + " 03f120616263" + std::string(36, ' ') + "\n", actual);
}

TEST(BinaryDataAsDebugStringTest, Wraps)
{
    std::string data(30, 'x');
    auto actual = BinaryDataAsDebugString(data.data(), data.size());
    EXPECT_EQ(2, std::count(actual.begin(), actual.end(), '\n'));
}

TEST(BinaryDataAsDebugStringTest, Limit)
{
    auto actual = BinaryDataAsDebugString("0123456789abcdefghijklmnopqrstuvwxyz", 36, 8);
    EXPECT_THAT(actual, HasSubstr("01234567 "));
    EXPECT_THAT(actual, ::testing::Not(HasSubstr("89")));
}

TEST(Base64Test, Encode)
{
    EXPECT_EQ("", Base64Encode(""));
    EXPECT_EQ("Zg==", Base64Encode("f"));
    EXPECT_EQ("Zm8=", Base64Encode("fo"));
    EXPECT_EQ("Zm9v", Base64Encode("foo"));
    EXPECT_EQ("dmlkZW8ubXA0", Base64Encode("video.mp4"));
    EXPECT_EQ("AP8=", Base64Encode(std::string("\x00\xff", 2)));
}

}  // namespace
}  // namespace internal
}  // namespace rup
