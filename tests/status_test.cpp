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

#include "resumableupload/status.h"
#include <gmock/gmock.h>
#include <sstream>

namespace rup {
namespace {
using ::testing::HasSubstr;

TEST(Status, StatusCodeToString)
{
    EXPECT_EQ("OK", StatusCodeToString(StatusCode::Ok));
    EXPECT_EQ("CANCELLED", StatusCodeToString(StatusCode::Cancelled));
    EXPECT_EQ("UNKNOWN", StatusCodeToString(StatusCode::Unknown));
    EXPECT_EQ("INVALID_ARGUMENT", StatusCodeToString(StatusCode::InvalidArgument));
    EXPECT_EQ("DEADLINE_EXCEEDED", StatusCodeToString(StatusCode::DeadlineExceeded));
    EXPECT_EQ("NOT_FOUND", StatusCodeToString(StatusCode::NotFound));
    EXPECT_EQ("ALREADY_EXISTS", StatusCodeToString(StatusCode::AlreadyExists));
    EXPECT_EQ("PERMISSION_DENIED", StatusCodeToString(StatusCode::PermissionDenied));
    EXPECT_EQ("RESOURCE_EXHAUSTED", StatusCodeToString(StatusCode::ResourceExhausted));
    EXPECT_EQ("FAILED_PRECONDITION", StatusCodeToString(StatusCode::FailedPrecondition));
    EXPECT_EQ("ABORTED", StatusCodeToString(StatusCode::Aborted));
    EXPECT_EQ("OUT_OF_RANGE", StatusCodeToString(StatusCode::OutOfRange));
    EXPECT_EQ("UNIMPLEMENTED", StatusCodeToString(StatusCode::Unimplemented));
    EXPECT_EQ("INTERNAL", StatusCodeToString(StatusCode::Internal));
    EXPECT_EQ("UNAVAILABLE", StatusCodeToString(StatusCode::Unavailable));
    EXPECT_EQ("DATA_LOSS", StatusCodeToString(StatusCode::DataLoss));
    EXPECT_EQ("UNAUTHENTICATED", StatusCodeToString(StatusCode::Unauthenticated));
    EXPECT_EQ("UNEXPECTED_STATUS_CODE=42", StatusCodeToString(static_cast<StatusCode>(42)));
}

TEST(Status, DefaultIsOk)
{
    Status status;
    EXPECT_TRUE(status.Ok());
    EXPECT_EQ(StatusCode::Ok, status.Code());
    EXPECT_TRUE(status.Message().empty());
}

TEST(Status, Streaming)
{
    std::ostringstream os;
    os << Status(StatusCode::Unavailable, "connection reset");
    EXPECT_EQ("connection reset [UNAVAILABLE]", os.str());
}

TEST(Status, Equality)
{
    EXPECT_EQ(Status(StatusCode::NotFound, "a"), Status(StatusCode::NotFound, "a"));
    EXPECT_NE(Status(StatusCode::NotFound, "a"), Status(StatusCode::NotFound, "b"));
    EXPECT_NE(Status(StatusCode::NotFound, "a"), Status(StatusCode::Aborted, "a"));
}

TEST(Status, RuntimeStatusError)
{
    RuntimeStatusError ex(Status(StatusCode::InvalidArgument, "bad chunk size"));
    EXPECT_EQ(StatusCode::InvalidArgument, ex.GetStatus().Code());
    EXPECT_THAT(ex.what(), HasSubstr("bad chunk size"));
}

}  // namespace
}  // namespace rup
