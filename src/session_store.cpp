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
#include "resumableupload/internal/log.h"
#include "resumableupload/internal/rfc3339_time.h"
#include "resumableupload/internal/session_json.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace rup {

namespace {
constexpr auto RecordExtension = ".json";
constexpr auto TempExtension = ".tmp";

// Session ids become file names, anything outside [A-Za-z0-9._-] is escaped.
std::string EscapeId(std::string const& id)
{
    static char const Hex[] = "0123456789ABCDEF";
    std::string result;
    for (auto c : id)
    {
        auto const u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '_' || c == '-' || (c == '.' && !result.empty()))
        {
            result.push_back(c);
            continue;
        }
        result.push_back('%');
        result.push_back(Hex[u >> 4]);
        result.push_back(Hex[u & 0x0F]);
    }
    return result;
}

Status StoreUnavailable(std::string const& what, std::string const& path, std::error_code const& ec = {})
{
    std::ostringstream os;
    os << "Session store: " << what << " <" << path << ">";
    if (ec)
        os << ": " << ec.message();
    return Status(StatusCode::Unavailable, std::move(os).str());
}

void SortByCreation(std::vector<UploadSession>& sessions)
{
    std::sort(sessions.begin(), sessions.end(), [](UploadSession const& a, UploadSession const& b) {
        if (a.m_createdAt != b.m_createdAt)
            return a.m_createdAt < b.m_createdAt;
        return a.m_id < b.m_id;
    });
}
}  // namespace

FileSessionStore::FileSessionStore(std::string directory, std::chrono::milliseconds coalesceInterval)
    : m_directory(std::move(directory)), m_coalesceInterval(coalesceInterval)
{
}

FileSessionStore::~FileSessionStore()
{
    auto status = Flush();
    if (!status.Ok())
        RUP_LOG_ERROR("Cannot write pending session records: {}", status);
}

std::string FileSessionStore::PathFor(std::string const& id) const
{
    return (std::filesystem::path(m_directory) / (EscapeId(id) + RecordExtension)).string();
}

std::shared_ptr<FileSessionStore::Entry> FileSessionStore::GetEntry(std::string const& id)
{
    std::lock_guard<std::mutex> lk(m_mu);
    auto& entry = m_entries[id];
    if (!entry)
        entry = std::make_shared<Entry>();
    return entry;
}

std::shared_ptr<FileSessionStore::Entry> FileSessionStore::FindEntry(std::string const& id)
{
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : it->second;
}

Status FileSessionStore::Save(UploadSession const& session)
{
    auto entry = GetEntry(session.m_id);
    std::lock_guard<std::mutex> lk(entry->m_mu);
    auto const now = std::chrono::steady_clock::now();
    if (m_coalesceInterval.count() > 0 && entry->m_writtenStatus == session.m_status &&
        now - entry->m_writtenAt < m_coalesceInterval)
    {
        entry->m_pending = session;
        return Status();
    }

    auto status = WriteRecord(session);
    if (!status.Ok())
    {
        // Keep it, the next save or Flush() tries again.
        entry->m_pending = session;
        return status;
    }
    entry->m_pending.reset();
    entry->m_writtenStatus = session.m_status;
    entry->m_writtenAt = now;
    return Status();
}

StatusOrVal<UploadSession> FileSessionStore::Load(std::string const& id)
{
    auto entry = FindEntry(id);
    if (entry)
    {
        std::lock_guard<std::mutex> lk(entry->m_mu);
        if (entry->m_pending)
            return *entry->m_pending;
        return ReadRecord(PathFor(id));
    }
    return ReadRecord(PathFor(id));
}

Status FileSessionStore::Delete(std::string const& id)
{
    auto entry = GetEntry(id);
    Status status;
    {
        std::lock_guard<std::mutex> lk(entry->m_mu);
        entry->m_pending.reset();
        entry->m_writtenStatus.reset();

        auto const path = PathFor(id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
            status = StoreUnavailable("cannot delete", path, ec);
    }

    // Entries are only handed out under m_mu, if nobody else holds this one
    // it can go.
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_entries.find(id);
    if (it != m_entries.end() && it->second == entry && entry.use_count() == 2)
        m_entries.erase(it);
    return status;
}

StatusOrVal<std::vector<UploadSession>> FileSessionStore::ListAll()
{
    std::map<std::string, UploadSession> sessions;

    std::error_code ec;
    if (std::filesystem::exists(m_directory, ec))
    {
        std::filesystem::directory_iterator it(m_directory, ec);
        if (ec)
            return StoreUnavailable("cannot list", m_directory, ec);
        for (auto const& file : it)
        {
            auto const& path = file.path();
            if (!file.is_regular_file(ec) || path.extension() != RecordExtension)
                continue;
            auto session = ReadRecord(path.string());
            if (!session)
            {
                RUP_LOG_WARNING("Skipping unreadable session record {}: {}", path.string(), session.GetStatus());
                continue;
            }
            auto id = session->m_id;
            sessions[id] = *std::move(session);
        }
    }

    // Deferred records are newer than their files.
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> entries;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        entries.assign(m_entries.begin(), m_entries.end());
    }
    for (auto const& kv : entries)
    {
        std::lock_guard<std::mutex> lk(kv.second->m_mu);
        if (kv.second->m_pending)
            sessions[kv.first] = *kv.second->m_pending;
    }

    std::vector<UploadSession> result;
    result.reserve(sessions.size());
    for (auto& kv : sessions)
        result.push_back(std::move(kv.second));
    SortByCreation(result);
    return result;
}

Status FileSessionStore::Flush()
{
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        for (auto const& kv : m_entries)
            entries.push_back(kv.second);
    }

    Status result;
    for (auto const& entry : entries)
    {
        std::lock_guard<std::mutex> lk(entry->m_mu);
        if (!entry->m_pending)
            continue;
        auto status = WriteRecord(*entry->m_pending);
        if (!status.Ok())
        {
            result = std::move(status);
            continue;
        }
        entry->m_writtenStatus = entry->m_pending->m_status;
        entry->m_writtenAt = std::chrono::steady_clock::now();
        entry->m_pending.reset();
    }
    return result;
}

Status FileSessionStore::WriteRecord(UploadSession const& session)
{
    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec)
        return StoreUnavailable("cannot create directory", m_directory, ec);

    auto const path = PathFor(session.m_id);
    auto const tmpPath = path + TempExtension;
    {
        std::ofstream os(tmpPath, std::ios::binary | std::ios::trunc);
        if (!os.is_open())
            return StoreUnavailable("cannot open", tmpPath);
        os << internal::SessionToJson(session).dump(2);
        os.flush();
        if (!os)
        {
            os.close();
            std::filesystem::remove(tmpPath, ec);
            return StoreUnavailable("cannot write", tmpPath);
        }
    }
    std::filesystem::rename(tmpPath, path, ec);
    if (ec)
    {
        auto status = StoreUnavailable("cannot replace", path, ec);
        std::filesystem::remove(tmpPath, ec);
        return status;
    }
    RUP_LOG_TRACE("Saved session {} to {}", session.m_id, path);
    return Status();
}

StatusOrVal<UploadSession> FileSessionStore::ReadRecord(std::string const& path)
{
    std::ifstream is(path, std::ios::binary);
    if (!is.is_open())
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec)
            return Status(StatusCode::NotFound, "No session record <" + path + ">");
        return StoreUnavailable("cannot open", path, ec);
    }
    std::string payload{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    if (is.bad())
        return StoreUnavailable("cannot read", path);

    auto session = internal::ParseSession(payload);
    if (!session)
        return StoreUnavailable("corrupt record (" + session.GetStatus().Message() + ")", path);
    return session;
}

StatusOrVal<std::size_t> EvictStaleSessions(SessionStore& store, std::chrono::system_clock::duration maxAge,
                                            std::chrono::system_clock::time_point now)
{
    auto sessions = store.ListAll();
    if (!sessions)
        return std::move(sessions).GetStatus();

    std::size_t evicted = 0;
    auto const threshold = now - maxAge;
    for (auto const& session : *sessions)
    {
        if (session.m_updatedAt >= threshold)
            continue;
        auto status = store.Delete(session.m_id);
        if (!status.Ok())
            return status;
        RUP_LOG_INFO("Evicted stale session {} (status={}, updatedAt={})", session.m_id, session.m_status,
                     internal::FormatRfc3339(session.m_updatedAt));
        ++evicted;
    }
    return evicted;
}

StatusOrVal<std::vector<UploadSession>> ListResumableSessions(SessionStore& store)
{
    auto sessions = store.ListAll();
    if (!sessions)
        return sessions;

    std::vector<UploadSession> result;
    for (auto& session : *sessions)
    {
        if (!IsTerminal(session.m_status))
            result.push_back(std::move(session));
    }
    SortByCreation(result);
    return result;
}

}  // namespace rup
