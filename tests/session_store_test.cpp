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

#include "resumableupload/session_store.h"
#include "util/scoped_log.h"
#include "util/status_matchers.h"
#include "util/temp_directory.h"
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <thread>

namespace rup {
namespace {

using std::chrono::hours;
using std::chrono::milliseconds;
using testing::internal::ScopedLog;
using testing::internal::TempDirectory;
using testing::util::StatusIs;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

std::chrono::system_clock::time_point const Epoch(std::chrono::seconds(1700000000));

UploadSession MakeSession(std::string id, UploadStatus status, std::chrono::system_clock::time_point createdAt = Epoch)
{
    UploadSession session;
    session.m_id = std::move(id);
    session.m_resourceHandle = "https://tus.example.com/files/" + session.m_id;
    session.m_totalBytes = 1000;
    session.m_status = status;
    session.m_createdAt = createdAt;
    session.m_updatedAt = createdAt;
    return session;
}

std::vector<std::string> Ids(std::vector<UploadSession> const& sessions)
{
    std::vector<std::string> ids;
    for (auto const& s : sessions)
        ids.push_back(s.m_id);
    return ids;
}

TEST(FileSessionStoreTest, SaveLoadDelete)
{
    TempDirectory dir;
    FileSessionStore store(dir.Join("sessions"), milliseconds(0));

    auto session = MakeSession("upload_1", UploadStatus::Paused);
    session.m_committedBytes = 400;
    session.m_metadata = {{"filename", "a.bin"}};
    ASSERT_STATUS_OK(store.Save(session));
    EXPECT_TRUE(std::filesystem::exists(store.PathFor("upload_1")));

    auto loaded = store.Load("upload_1");
    ASSERT_STATUS_OK(loaded);
    EXPECT_EQ(session, *loaded);

    ASSERT_STATUS_OK(store.Delete("upload_1"));
    EXPECT_FALSE(std::filesystem::exists(store.PathFor("upload_1")));
    EXPECT_THAT(store.Load("upload_1"), StatusIs(StatusCode::NotFound));
    EXPECT_STATUS_OK(store.Delete("upload_1"));
}

TEST(FileSessionStoreTest, RecordsSurviveTheStore)
{
    TempDirectory dir;
    {
        FileSessionStore store(dir.Path());
        ASSERT_STATUS_OK(store.Save(MakeSession("upload_1", UploadStatus::Uploading)));
    }
    FileSessionStore store(dir.Path());
    auto loaded = store.Load("upload_1");
    ASSERT_STATUS_OK(loaded);
    EXPECT_EQ(UploadStatus::Uploading, loaded->m_status);
}

TEST(FileSessionStoreTest, NoTemporaryFilesLeft)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), milliseconds(0));
    auto session = MakeSession("upload_1", UploadStatus::Uploading);
    for (std::uint64_t offset = 0; offset <= 1000; offset += 100)
    {
        session.m_committedBytes = offset;
        ASSERT_STATUS_OK(store.Save(session));
    }
    std::vector<std::string> files;
    for (auto const& f : std::filesystem::directory_iterator(dir.Path()))
        files.push_back(f.path().filename().string());
    EXPECT_THAT(files, ElementsAre("upload_1.json"));
    EXPECT_EQ(1000U, store.Load("upload_1").Value().m_committedBytes);
}

TEST(FileSessionStoreTest, CoalescesProgressSaves)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), hours(1));
    auto session = MakeSession("upload_1", UploadStatus::Uploading);
    ASSERT_STATUS_OK(store.Save(session));

    session.m_committedBytes = 500;
    ASSERT_STATUS_OK(store.Save(session));

    // The deferred record is visible, the file still holds the first one.
    EXPECT_EQ(500U, store.Load("upload_1").Value().m_committedBytes);
    FileSessionStore reader(dir.Path());
    EXPECT_EQ(0U, reader.Load("upload_1").Value().m_committedBytes);

    ASSERT_STATUS_OK(store.Flush());
    EXPECT_EQ(500U, reader.Load("upload_1").Value().m_committedBytes);
}

TEST(FileSessionStoreTest, StatusChangeIsWrittenImmediately)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), hours(1));
    auto session = MakeSession("upload_1", UploadStatus::Uploading);
    ASSERT_STATUS_OK(store.Save(session));

    session.m_committedBytes = 700;
    session.m_status = UploadStatus::Paused;
    ASSERT_STATUS_OK(store.Save(session));

    FileSessionStore reader(dir.Path());
    auto loaded = reader.Load("upload_1");
    ASSERT_STATUS_OK(loaded);
    EXPECT_EQ(UploadStatus::Paused, loaded->m_status);
    EXPECT_EQ(700U, loaded->m_committedBytes);
}

TEST(FileSessionStoreTest, DestructorFlushes)
{
    TempDirectory dir;
    {
        FileSessionStore store(dir.Path(), hours(1));
        auto session = MakeSession("upload_1", UploadStatus::Uploading);
        ASSERT_STATUS_OK(store.Save(session));
        session.m_committedBytes = 900;
        ASSERT_STATUS_OK(store.Save(session));
    }
    FileSessionStore reader(dir.Path());
    EXPECT_EQ(900U, reader.Load("upload_1").Value().m_committedBytes);
}

TEST(FileSessionStoreTest, DeleteDropsDeferredRecord)
{
    TempDirectory dir;
    {
        FileSessionStore store(dir.Path(), hours(1));
        auto session = MakeSession("upload_1", UploadStatus::Uploading);
        ASSERT_STATUS_OK(store.Save(session));
        session.m_committedBytes = 900;
        ASSERT_STATUS_OK(store.Save(session));
        ASSERT_STATUS_OK(store.Delete("upload_1"));
        EXPECT_THAT(store.Load("upload_1"), StatusIs(StatusCode::NotFound));
    }
    EXPECT_FALSE(std::filesystem::exists(FileSessionStore(dir.Path()).PathFor("upload_1")));
}

TEST(FileSessionStoreTest, DeleteForgetsTheSession)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), hours(1));
    for (auto const* id : {"upload_1", "upload_2", "upload_3"})
    {
        auto session = MakeSession(id, UploadStatus::Uploading);
        ASSERT_STATUS_OK(store.Save(session));
        session.m_committedBytes = 500;
        ASSERT_STATUS_OK(store.Save(session));
    }
    EXPECT_EQ(3U, store.TrackedSessionCount());

    for (auto const* id : {"upload_1", "upload_2", "upload_3", "never_saved"})
        ASSERT_STATUS_OK(store.Delete(id));
    EXPECT_EQ(0U, store.TrackedSessionCount());

    // A session saved again after its deletion is written right away.
    auto session = MakeSession("upload_1", UploadStatus::Uploading);
    ASSERT_STATUS_OK(store.Save(session));
    EXPECT_TRUE(std::filesystem::exists(store.PathFor("upload_1")));
    EXPECT_EQ(1U, store.TrackedSessionCount());
}

TEST(FileSessionStoreTest, EscapesIds)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), milliseconds(0));
    EXPECT_EQ(dir.Join("upload_1.json"), store.PathFor("upload_1"));
    EXPECT_EQ(dir.Join("%2E.%2Fescape.json"), store.PathFor("../escape"));

    auto session = MakeSession("a/b c", UploadStatus::Paused);
    ASSERT_STATUS_OK(store.Save(session));
    EXPECT_EQ("a/b c", store.Load("a/b c").Value().m_id);
}

TEST(FileSessionStoreTest, ListAllSkipsCorruptRecords)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), milliseconds(0));
    ASSERT_STATUS_OK(store.Save(MakeSession("upload_b", UploadStatus::Paused, Epoch + hours(1))));
    ASSERT_STATUS_OK(store.Save(MakeSession("upload_a", UploadStatus::Failed, Epoch + hours(2))));
    ASSERT_STATUS_OK(store.Save(MakeSession("upload_c", UploadStatus::Paused, Epoch)));
    std::ofstream(dir.Join("broken.json")) << "{\"id\": ";
    std::ofstream(dir.Join("notes.txt")) << "not a record";

    ScopedLog log;
    auto sessions = store.ListAll();
    ASSERT_STATUS_OK(sessions);
    EXPECT_THAT(Ids(*sessions), ElementsAre("upload_c", "upload_b", "upload_a"));
    EXPECT_THAT(log.ExtractLines(), Contains(HasSubstr("broken.json")));

    EXPECT_THAT(store.Load("broken"), StatusIs(StatusCode::Unavailable, HasSubstr("corrupt")));
}

TEST(FileSessionStoreTest, ListAllOfMissingDirectory)
{
    TempDirectory dir;
    FileSessionStore store(dir.Join("not-created-yet"));
    auto sessions = store.ListAll();
    ASSERT_STATUS_OK(sessions);
    EXPECT_THAT(*sessions, IsEmpty());
}

TEST(FileSessionStoreTest, ListAllSeesDeferredRecords)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), hours(1));
    auto session = MakeSession("upload_1", UploadStatus::Uploading);
    ASSERT_STATUS_OK(store.Save(session));
    session.m_committedBytes = 300;
    ASSERT_STATUS_OK(store.Save(session));

    auto sessions = store.ListAll();
    ASSERT_STATUS_OK(sessions);
    ASSERT_EQ(1U, sessions->size());
    EXPECT_EQ(300U, sessions->front().m_committedBytes);
}

TEST(FileSessionStoreTest, UnwritableDirectory)
{
    TempDirectory dir;
    auto const blocker = dir.Join("file");
    std::ofstream(blocker) << "x";
    FileSessionStore store(blocker + "/sessions", milliseconds(0));
    EXPECT_THAT(store.Save(MakeSession("upload_1", UploadStatus::Paused)),
                StatusIs(StatusCode::Unavailable, HasSubstr("Session store")));
}

TEST(FileSessionStoreTest, ConcurrentSaves)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), milliseconds(10));
    std::vector<std::thread> threads;
    for (int t = 0; t != 4; ++t)
    {
        threads.emplace_back([&store, t] {
            auto session = MakeSession("upload_" + std::to_string(t), UploadStatus::Uploading);
            for (std::uint64_t i = 0; i <= 100; ++i)
            {
                session.m_committedBytes = i * 10;
                EXPECT_STATUS_OK(store.Save(session));
            }
        });
    }
    for (auto& t : threads)
        t.join();
    ASSERT_STATUS_OK(store.Flush());

    FileSessionStore reader(dir.Path());
    for (int t = 0; t != 4; ++t)
        EXPECT_EQ(1000U, reader.Load("upload_" + std::to_string(t)).Value().m_committedBytes);
}

TEST(SessionStoreHelpersTest, EvictStaleSessions)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), milliseconds(0));
    ASSERT_STATUS_OK(store.Save(MakeSession("old", UploadStatus::Paused, Epoch)));
    ASSERT_STATUS_OK(store.Save(MakeSession("recent", UploadStatus::Paused, Epoch + hours(47))));

    ScopedLog log;
    auto evicted = EvictStaleSessions(store, hours(24), Epoch + hours(48));
    ASSERT_STATUS_OK(evicted);
    EXPECT_EQ(1U, *evicted);
    EXPECT_THAT(store.Load("old"), StatusIs(StatusCode::NotFound));
    EXPECT_STATUS_OK(store.Load("recent"));
    EXPECT_THAT(log.ExtractLines(), Contains(HasSubstr("Evicted stale session old")));
}

TEST(SessionStoreHelpersTest, ListResumableSessions)
{
    TempDirectory dir;
    FileSessionStore store(dir.Path(), milliseconds(0));
    ASSERT_STATUS_OK(store.Save(MakeSession("paused", UploadStatus::Paused, Epoch + hours(1))));
    ASSERT_STATUS_OK(store.Save(MakeSession("failed", UploadStatus::Failed, Epoch + hours(2))));
    ASSERT_STATUS_OK(store.Save(MakeSession("uploading", UploadStatus::Uploading, Epoch)));
    ASSERT_STATUS_OK(store.Save(MakeSession("done", UploadStatus::Completed, Epoch)));
    ASSERT_STATUS_OK(store.Save(MakeSession("cancelled", UploadStatus::Cancelled, Epoch)));

    auto sessions = ListResumableSessions(store);
    ASSERT_STATUS_OK(sessions);
    EXPECT_THAT(Ids(*sessions), ElementsAre("uploading", "paused", "failed"));
}

}  // namespace
}  // namespace rup
