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

#pragma once

#include "resumableupload/status_or_val.h"
#include "resumableupload/upload_session.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rup {

/**
 * Durable mapping from session id to the session record.
 *
 * The store never interprets the records, the engine owns their semantics.
 * Implementations must be safe to use from several engines at once. Failures
 * of the underlying storage are reported as `StatusCode::Unavailable`.
 */
class SessionStore
{
public:
    virtual ~SessionStore() = default;

    /// Inserts or replaces the record of `session.m_id`.
    virtual Status Save(UploadSession const& session) = 0;

    /// @return NotFound if there is no record for @p id.
    virtual StatusOrVal<UploadSession> Load(std::string const& id) = 0;

    /// Removes the record of @p id, removing a missing record succeeds.
    virtual Status Delete(std::string const& id) = 0;

    virtual StatusOrVal<std::vector<UploadSession>> ListAll() = 0;

    /// Writes any record whose save was deferred.
    virtual Status Flush() = 0;
};

/**
 * Stores every session as one JSON document `<directory>/<id>.json`.
 *
 * Documents are replaced atomically (written to a temporary file, then
 * renamed), a crash never leaves a truncated record behind.
 *
 * Saves of the same session that do not change its status are coalesced: at
 * most one write per `coalesceInterval`, the latest record waits in memory and
 * is visible to `Load()` and `ListAll()`. It is written by the next save after
 * the interval, by `Flush()`, or when the store is destroyed.
 */
class FileSessionStore : public SessionStore
{
public:
    explicit FileSessionStore(std::string directory,
                              std::chrono::milliseconds coalesceInterval = std::chrono::seconds(1));
    ~FileSessionStore() override;

    FileSessionStore(FileSessionStore const&) = delete;
    FileSessionStore& operator=(FileSessionStore const&) = delete;

    Status Save(UploadSession const& session) override;
    StatusOrVal<UploadSession> Load(std::string const& id) override;
    Status Delete(std::string const& id) override;
    StatusOrVal<std::vector<UploadSession>> ListAll() override;
    Status Flush() override;

    std::string const& Directory() const { return m_directory; }

    /// The file holding the record of @p id.
    std::string PathFor(std::string const& id) const;

    // Testing only.
    std::size_t TrackedSessionCount() const
    {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_entries.size();
    }

private:
    struct Entry
    {
        std::mutex m_mu;
        // The latest record, not written yet.
        std::optional<UploadSession> m_pending;
        std::optional<UploadStatus> m_writtenStatus;
        std::chrono::steady_clock::time_point m_writtenAt;
    };

    std::shared_ptr<Entry> GetEntry(std::string const& id);
    std::shared_ptr<Entry> FindEntry(std::string const& id);
    Status WriteRecord(UploadSession const& session);
    StatusOrVal<UploadSession> ReadRecord(std::string const& path);

    std::string m_directory;
    std::chrono::milliseconds m_coalesceInterval;
    mutable std::mutex m_mu;
    std::map<std::string, std::shared_ptr<Entry>> m_entries;
};

/**
 * Deletes the records whose `m_updatedAt` is older than `now - maxAge`.
 *
 * @return the number of deleted records.
 */
StatusOrVal<std::size_t> EvictStaleSessions(SessionStore& store, std::chrono::system_clock::duration maxAge,
                                            std::chrono::system_clock::time_point now);

/**
 * Returns the stored sessions that can still be resumed, i.e. neither
 * completed nor cancelled, oldest first.
 */
StatusOrVal<std::vector<UploadSession>> ListResumableSessions(SessionStore& store);

}  // namespace rup
