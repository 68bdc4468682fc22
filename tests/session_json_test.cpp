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

#include "resumableupload/internal/session_json.h"
#include "util/status_matchers.h"
#include <gmock/gmock.h>

namespace rup {
namespace internal {
namespace {

using testing::util::StatusIs;
using ::testing::HasSubstr;

UploadSession MakeSession()
{
    UploadSession session;
    session.m_id = "upload_1700000000000_a1b2c3d4e";
    session.m_resourceHandle = "https://tus.example.com/files/24e533e0";
    session.m_totalBytes = 104857600;
    session.m_committedBytes = 41943040;
    session.m_status = UploadStatus::Paused;
    session.m_metadata = {{"filename", "movie.mp4"}, {"sessionId", session.m_id}};
    session.m_createdAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    session.m_updatedAt = session.m_createdAt + std::chrono::minutes(5);
    session.m_sourceName = "movie.mp4";
    return session;
}

TEST(SessionJsonTest, Document)
{
    auto json = SessionToJson(MakeSession());
    EXPECT_EQ("upload_1700000000000_a1b2c3d4e", json["id"].get<std::string>());
    EXPECT_EQ(104857600U, json["totalBytes"].get<std::uint64_t>());
    EXPECT_EQ(41943040U, json["committedBytes"].get<std::uint64_t>());
    EXPECT_EQ("paused", json["status"].get<std::string>());
    EXPECT_EQ("movie.mp4", json["metadata"]["filename"].get<std::string>());
    EXPECT_EQ("2023-11-14T22:13:20.123Z", json["createdAt"].get<std::string>());
    EXPECT_EQ("2023-11-14T22:18:20.123Z", json["updatedAt"].get<std::string>());
    EXPECT_EQ(0U, json.count("lastError"));
}

TEST(SessionJsonTest, ParsesBack)
{
    auto session = MakeSession();
    session.m_status = UploadStatus::Failed;
    session.m_lastError = UploadError{UploadErrorReason::RetryExhausted, Status(StatusCode::Unavailable, "reset")};

    auto json = SessionToJson(session);
    EXPECT_EQ("RETRY_EXHAUSTED", json["lastError"]["reason"].get<std::string>());
    EXPECT_EQ(14, json["lastError"]["code"].get<int>());

    auto parsed = ParseSession(json.dump());
    ASSERT_STATUS_OK(parsed);
    EXPECT_EQ(session, *parsed);
}

TEST(SessionJsonTest, AcceptsStringCounters)
{
    auto parsed = ParseSession(R"""({
        "id": "upload_1",
        "totalBytes": "100",
        "committedBytes": "40",
        "status": "paused",
        "createdAt": "2023-11-14T22:13:20Z",
        "updatedAt": "2023-11-14T22:13:20Z"
    })""");
    ASSERT_STATUS_OK(parsed);
    EXPECT_EQ(100U, parsed->m_totalBytes);
    EXPECT_EQ(40U, parsed->m_committedBytes);
    EXPECT_TRUE(parsed->m_resourceHandle.empty());
    EXPECT_FALSE(parsed->m_lastError.has_value());
}

TEST(SessionJsonTest, RejectsInvalidRecords)
{
    EXPECT_THAT(ParseSession("{not json"), StatusIs(StatusCode::InvalidArgument));
    EXPECT_THAT(ParseSession("[1, 2]"), StatusIs(StatusCode::InvalidArgument));
    EXPECT_THAT(ParseSession(R"""({"status": "paused"})"""), StatusIs(StatusCode::InvalidArgument, HasSubstr("id")));
    EXPECT_THAT(ParseSession(R"""({"id": "u", "status": "sleeping"})"""), StatusIs(StatusCode::InvalidArgument));
    EXPECT_THAT(ParseSession(R"""({"id": "u", "status": "paused", "totalBytes": 10, "committedBytes": 11})"""),
                StatusIs(StatusCode::InvalidArgument, HasSubstr("committedBytes=11")));
    EXPECT_THAT(ParseSession(R"""({"id": "u", "status": "failed", "lastError": {"reason": "OOPS"}})"""),
                StatusIs(StatusCode::InvalidArgument));
    EXPECT_THAT(ParseSession(R"""({"id": "u", "status": "paused", "createdAt": "yesterday"})"""),
                StatusIs(StatusCode::InvalidArgument));
}

}  // namespace
}  // namespace internal
}  // namespace rup
