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

/**
 * This interface abstracts out the underlying log implementation.
 * Currently spdlog is used https://github.com/gabime/spdlog.
 *
 * Note: spdlog doesn't support operator<<() to chain output like
 * LOG() << a << b << c;
 * Use fmt-style format strings instead:
 * RUP_LOG_INFO("{}() session={} offset={}", __func__, id, offset);
 *
 * User defined types are printed through their operator<<(), see
 * log_spdlog_fmt_support_user_defined_types.h.
 */

#define RUP_LOG_LEVEL_TRACE 0
#define RUP_LOG_LEVEL_DEBUG 1
#define RUP_LOG_LEVEL_INFO 2
#define RUP_LOG_LEVEL_WARN 3
#define RUP_LOG_LEVEL_ERROR 4
#define RUP_LOG_LEVEL_OFF 6

/**
 * Make it possible to define compile time logging level like
 * -DRUP_LOG_ACTIVE_LOG_LEVEL=RUP_LOG_LEVEL_TRACE
 */
#ifndef RUP_LOG_ACTIVE_LOG_LEVEL
#ifndef NDEBUG
#define RUP_LOG_ACTIVE_LOG_LEVEL RUP_LOG_LEVEL_TRACE  // in debug switch on full logging
#else
#define RUP_LOG_ACTIVE_LOG_LEVEL RUP_LOG_LEVEL_INFO  // in release keep INFO logging level
#endif                                               // #ifndef NDEBUG
#endif                                               // #ifndef RUP_LOG_ACTIVE_LOG_LEVEL

// Need to define this to enable corresponding logging level
#define SPDLOG_ACTIVE_LEVEL RUP_LOG_ACTIVE_LOG_LEVEL

#include "spdlog/fmt/ostr.h"  // must be included to enable operator<< for user defined types to work for logging.
#include "spdlog/sinks/base_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/spdlog.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rup {
namespace internal {

class SinkBase;
struct LogRecord;

namespace detail {
/**
 * Forwards spdlog messages to a `SinkBase` owned by the application.
 *
 * The proxy only keeps a weak reference, so an expired sink is skipped and
 * later removed from the spdlog logger.
 */
class SpdSinkProxy : public spdlog::sinks::base_sink<std::mutex>
{
public:
    void SetSink(std::weak_ptr<SinkBase> sink);
    bool IsExpired() const;

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;

private:
    std::weak_ptr<SinkBase> m_sink;
};
}  // namespace detail

enum class ELogLevel : int
{
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Off
};

struct LogRecord
{
    ELogLevel m_logLevel = ELogLevel::Off;
    std::string m_file;
    std::string m_functionName;
    int m_lineNo = 0;
    std::chrono::system_clock::time_point m_timestamp;
    std::string m_message;
};

/**
 * Base class for application defined log destinations.
 */
class SinkBase
{
public:
    SinkBase();
    virtual ~SinkBase() = default;

    virtual void SinkRecord(LogRecord const& logRec) = 0;
    virtual void Flush() = 0;

private:
    friend class Logger;
    std::shared_ptr<detail::SpdSinkProxy> m_spdSinkProxy;
};

class Logger
{
public:
    static std::shared_ptr<Logger> Instance()
    {
        static auto instance = std::shared_ptr<Logger>(new Logger());
        return instance;
    }

    ~Logger() { spdlog::drop(m_spdLogger->name()); }

    long AddSink(std::shared_ptr<SinkBase> sink);
    void RemoveSink(long id);
    void ClearSinks();
    std::size_t GetSinkCount() const;
    void SetLevel(ELogLevel level);
    void Flush();

    template <typename... Args>
    void Log(char const* file, char const* function, int lineNo, ELogLevel logLevel, std::string const& fmt,
             const Args&... args)
    {
        if (ELogLevel::Off == logLevel)
            return;

        m_spdLogger->log(spdlog::source_loc{file, lineNo, function}, ToSpdLevel(logLevel), fmt::runtime(fmt),
                         args...);
    }

private:
    mutable std::mutex m_mu;
    long m_nextId = 0;
    std::map<long, std::shared_ptr<SinkBase>> m_sinks;
    std::shared_ptr<spdlog::logger> m_spdLogger;

    Logger();

    static spdlog::level::level_enum ToSpdLevel(ELogLevel level);
    void ClearSpdlogSinks();
};

// Get logger
inline std::shared_ptr<Logger> GetLogger() { return Logger::Instance(); }

#if RUP_LOG_ACTIVE_LOG_LEVEL <= RUP_LOG_LEVEL_TRACE
#define RUP_LOG_TRACE(...) \
    rup::internal::GetLogger()->Log(__FILE__, __func__, __LINE__, rup::internal::ELogLevel::Trace, __VA_ARGS__)
#else
#define RUP_LOG_TRACE(...) (void)0
#endif

#if RUP_LOG_ACTIVE_LOG_LEVEL <= RUP_LOG_LEVEL_DEBUG
#define RUP_LOG_DEBUG(...) \
    rup::internal::GetLogger()->Log(__FILE__, __func__, __LINE__, rup::internal::ELogLevel::Debug, __VA_ARGS__)
#else
#define RUP_LOG_DEBUG(...) (void)0
#endif

#if RUP_LOG_ACTIVE_LOG_LEVEL <= RUP_LOG_LEVEL_INFO
#define RUP_LOG_INFO(...) \
    rup::internal::GetLogger()->Log(__FILE__, __func__, __LINE__, rup::internal::ELogLevel::Info, __VA_ARGS__)
#else
#define RUP_LOG_INFO(...) (void)0
#endif

#if RUP_LOG_ACTIVE_LOG_LEVEL <= RUP_LOG_LEVEL_WARN
#define RUP_LOG_WARNING(...) \
    rup::internal::GetLogger()->Log(__FILE__, __func__, __LINE__, rup::internal::ELogLevel::Warning, __VA_ARGS__)
#else
#define RUP_LOG_WARNING(...) (void)0
#endif

#if RUP_LOG_ACTIVE_LOG_LEVEL <= RUP_LOG_LEVEL_ERROR
#define RUP_LOG_ERROR(...) \
    rup::internal::GetLogger()->Log(__FILE__, __func__, __LINE__, rup::internal::ELogLevel::Error, __VA_ARGS__)
#else
#define RUP_LOG_ERROR(...) (void)0
#endif

}  // namespace internal
}  // namespace rup

#include "resumableupload/internal/log_spdlog_fmt_support_user_defined_types.h"
