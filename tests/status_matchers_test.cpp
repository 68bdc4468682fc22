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

#include "util/status_matchers.h"
#include <gmock/gmock.h>

namespace rup {
namespace testing {
namespace util {
namespace {

using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;

TEST(StatusIsTest, OkStatus)
{
    Status status;
    EXPECT_THAT(status, StatusIs(StatusCode::Ok));
    EXPECT_THAT(status, IsOk());
    EXPECT_STATUS_OK(status);
}

TEST(StatusIsTest, CodeAndMessage)
{
    Status status(StatusCode::Unavailable, "connection reset by peer");
    EXPECT_THAT(status, StatusIs(StatusCode::Unavailable));
    EXPECT_THAT(status, StatusIs(StatusCode::Unavailable, "connection reset by peer"));
    EXPECT_THAT(status, StatusIs(StatusCode::Unavailable, HasSubstr("reset")));
    EXPECT_THAT(status, StatusIs(AnyOf(StatusCode::Unavailable, StatusCode::DeadlineExceeded)));
    EXPECT_THAT(status, Not(StatusIs(StatusCode::NotFound)));
    EXPECT_THAT(status, Not(StatusIs(StatusCode::Unavailable, Eq("other"))));
    EXPECT_THAT(status, Not(IsOk()));
}

TEST(StatusIsTest, StatusOrVal)
{
    StatusOrVal<int> value(42);
    EXPECT_THAT(value, IsOk());
    ASSERT_STATUS_OK(value);

    StatusOrVal<int> error(Status(StatusCode::NotFound, "no record"));
    EXPECT_THAT(error, StatusIs(StatusCode::NotFound, "no record"));
    EXPECT_THAT(error, Not(IsOk()));
}

TEST(StatusIsTest, Description)
{
    auto const matcher = ::testing::Matcher<Status>(StatusIs(StatusCode::Aborted, "stop"));
    EXPECT_THAT(::testing::DescribeMatcher<Status>(matcher), HasSubstr("ABORTED"));
    EXPECT_THAT(::testing::DescribeMatcher<Status>(matcher, true), HasSubstr("ABORTED"));
}

}  // namespace
}  // namespace util
}  // namespace testing
}  // namespace rup
