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
#include <string>

namespace rup {
namespace internal {

/**
 * Request building helpers of the tus 1.0.0 resumable upload protocol.
 *
 * @see https://tus.io/protocols/resumable-upload
 */
class TusUtils
{
public:
    static constexpr char const* ProtocolVersion = "1.0.0";
    static constexpr char const* OffsetContentType = "application/offset+octet-stream";

    TusUtils() = delete;

    /**
     * Formats the `Upload-Metadata` header value.
     *
     * Every pair is the key and the base64 encoded value separated by a space,
     * pairs are separated by commas. A key with an empty value is sent alone.
     *
     * @return InvalidArgument when a key is empty or contains a space or a comma.
     */
    static StatusOrVal<std::string> EncodeUploadMetadata(UploadMetadata const& metadata);

    /**
     * Resolves the `Location` header of a creation response.
     *
     * Servers may answer with an absolute URL, an absolute path or a path
     * relative to the creation endpoint.
     */
    static std::string ResolveLocation(std::string const& endpoint, std::string const& location);

    /// Parses a decimal offset header value, rejects signs and trailing data.
    static StatusOrVal<std::uint64_t> ParseOffset(std::string const& value);
};

}  // namespace internal
}  // namespace rup
