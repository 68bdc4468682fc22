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

#include "resumableupload/options.h"
#include "resumableupload/upload_session.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rup {

/**
 * The ingest endpoint new uploads are created at.
 *
 * Defaults to the `RUP_ENDPOINT` environment variable, or the public tus demo
 * server when it is unset.
 */
struct EndpointOption
{
    using Type = std::string;
};

/**
 * Size of the window sent in one chunk transfer.
 *
 * Every chunk but the last one has exactly this size. Defaults to 8 MiB.
 */
struct ChunkSizeOption
{
    using Type = std::size_t;
};

/**
 * Delays to wait before each attempt of a chunk.
 *
 * Element 0 belongs to the first attempt of a window, which the engine sends
 * right away, so it is never waited. After the n-th consecutive failure of a
 * window the engine waits element n, the last element repeats. The sequence
 * must be non-decreasing. Defaults to `{0s, 3s, 5s, 10s, 20s}`, i.e. retries
 * after 3, 5, 10 and 20 seconds.
 */
struct RetryDelaysOption
{
    using Type = std::vector<std::chrono::milliseconds>;
};

/**
 * Number of consecutive failed attempts of one window after which the session
 * fails with `RETRY_EXHAUSTED`. Defaults to 5.
 */
struct MaxRetryAttemptsOption
{
    using Type = int;
};

/**
 * Deadline of a single request to the ingest endpoint. Defaults to 120s.
 */
struct RequestTimeoutOption
{
    using Type = std::chrono::milliseconds;
};

/// Deadline to establish a connection. Defaults to 30s.
struct ConnectTimeoutOption
{
    using Type = std::chrono::milliseconds;
};

/**
 * Directory of the default file based session store.
 *
 * Defaults to the `RUP_SESSION_DIR` environment variable, or
 * `./upload_sessions`.
 */
struct SessionStoreDirectoryOption
{
    using Type = std::string;
};

/**
 * Saves of the same session with an unchanged status within this interval are
 * coalesced into one write. Defaults to 1s. Zero disables coalescing.
 */
struct SaveCoalesceIntervalOption
{
    using Type = std::chrono::milliseconds;
};

/// Sampling interval of the throughput estimator. Defaults to 1s.
struct ProgressIntervalOption
{
    using Type = std::chrono::milliseconds;
};

/**
 * Receives every `UploadEvent` of a session.
 *
 * The callback is invoked from the session worker thread (or from the thread
 * calling a control operation), never while the engine holds its locks.
 */
struct EventCallbackOption
{
    using Type = std::function<void(UploadEvent const&)>;
};

/**
 * Extra headers sent with every request, e.g. `Authorization`.
 */
struct CustomHeadersOption
{
    using Type = std::map<std::string, std::string>;
};

/**
 * Set the maximum connection pool size.
 *
 * Once a request completes the curl handle is returned to the pool so the
 * next request reuses its connection. Zero disables pooling.
 */
struct ConnectionPoolSizeOption
{
    using Type = std::size_t;
};

/**
 * User-agent products to include with each request.
 *
 * @see https://tools.ietf.org/html/rfc7231#section-5.5.3
 */
struct UserAgentProductsOption
{
    using Type = std::vector<std::string>;
};

/**
 * Enables tracing for the given components.
 *
 * Valid components are currently:
 *
 * - http: logs the libcurl debug output of every request.
 * - raw-client: logs every call to the ingest endpoint and its outcome.
 */
struct TracingComponentsOption
{
    using Type = std::set<std::string>;
};

namespace internal {
/**
 * Replaces the backoff wait of the upload engine.
 *
 * Only used in tests, the function is called with the delay instead of
 * waiting for it.
 */
struct SleepFunctionOption
{
    using Type = std::function<void(std::chrono::milliseconds)>;
};

/// Fills in the defaults of every option not set in @p opts.
Options DefaultUploadOptions(Options opts);
}  // namespace internal

using UploadEngineOptionList =
    OptionList<EndpointOption, ChunkSizeOption, RetryDelaysOption, MaxRetryAttemptsOption, RequestTimeoutOption,
               ConnectTimeoutOption, SessionStoreDirectoryOption, SaveCoalesceIntervalOption, ProgressIntervalOption,
               EventCallbackOption, CustomHeadersOption, ConnectionPoolSizeOption, UserAgentProductsOption,
               TracingComponentsOption, internal::SleepFunctionOption>;

}  // namespace rup
