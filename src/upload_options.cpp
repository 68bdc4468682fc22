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

#include "resumableupload/upload_options.h"
#include "resumableupload/internal/algorithm.h"
#include "resumableupload/internal/utils.h"

namespace rup {
namespace internal {

namespace {
auto constexpr DefaultEndpoint = "https://tusd.tusdemo.net/files/";
auto constexpr DefaultSessionDirectory = "./upload_sessions";
std::size_t constexpr DefaultChunkSize = 8 * 1024 * 1024;
int constexpr DefaultMaxRetryAttempts = 5;
std::size_t constexpr DefaultConnectionPoolSize = 4;

std::set<std::string> TracingFromEnvironment()
{
    auto const tracing = GetEnv("RUP_ENABLE_TRACING");
    if (!tracing)
        return {};
    auto components = StrSplit(*tracing, ',');
    return std::set<std::string>(components.begin(), components.end());
}
}  // namespace

Options DefaultUploadOptions(Options opts)
{
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    auto endpoint = GetEnv("RUP_ENDPOINT");
    auto sessionDir = GetEnv("RUP_SESSION_DIR");

    auto defaults = Options{}
                        .Set<EndpointOption>(endpoint ? *endpoint : DefaultEndpoint)
                        .Set<ChunkSizeOption>(DefaultChunkSize)
                        .Set<RetryDelaysOption>({milliseconds(0), seconds(3), seconds(5), seconds(10), seconds(20)})
                        .Set<MaxRetryAttemptsOption>(DefaultMaxRetryAttempts)
                        .Set<RequestTimeoutOption>(seconds(120))
                        .Set<ConnectTimeoutOption>(seconds(30))
                        .Set<SessionStoreDirectoryOption>(sessionDir ? *sessionDir : DefaultSessionDirectory)
                        .Set<SaveCoalesceIntervalOption>(seconds(1))
                        .Set<ProgressIntervalOption>(seconds(1))
                        .Set<ConnectionPoolSizeOption>(DefaultConnectionPoolSize)
                        .Set<TracingComponentsOption>(TracingFromEnvironment());
    return MergeOptions(std::move(opts), std::move(defaults));
}

}  // namespace internal
}  // namespace rup
