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
#include <nlohmann/json.hpp>
#include <string>

namespace rup {
namespace internal {

/**
 * Converts a session to its persisted JSON document.
 *
 * The document holds exactly the session fields, timestamps as RFC 3339
 * strings and the status as its lower-case name:
 *
 * @code
 * {
 *   "id": "upload_1700000000000_a1b2c3d4e",
 *   "resourceHandle": "https://tus.example.com/files/24e533e0",
 *   "totalBytes": 104857600,
 *   "committedBytes": 41943040,
 *   "status": "paused",
 *   "metadata": {"filename": "movie.mp4"},
 *   "lastError": {"reason": "RETRY_EXHAUSTED", "code": 14, "message": "..."},
 *   "createdAt": "2024-03-01T10:00:00.123Z",
 *   "updatedAt": "2024-03-01T10:05:00.456Z",
 *   "sourceName": "movie.mp4"
 * }
 * @endcode
 */
nlohmann::json SessionToJson(UploadSession const& session);

/// Parses a document created by `SessionToJson()`.
StatusOrVal<UploadSession> SessionFromJson(nlohmann::json const& json);

/// Parses the text of a document created by `SessionToJson()`.
StatusOrVal<UploadSession> ParseSession(std::string const& payload);

}  // namespace internal
}  // namespace rup
