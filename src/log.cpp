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

#include "resumableupload/internal/log.h"
#include <algorithm>

namespace rup {
namespace internal {

namespace {
auto constexpr LoggerName = "rup_upload_logger";
auto constexpr LogFileName = "rup_upload.log";
std::size_t constexpr MaxLogFileSize = 1024 * 1024 * 5;
std::size_t constexpr MaxLogFiles = 10;

ELogLevel FromSpdLevel(spdlog::level::level_enum level)
{
    switch (level)
    {
    case spdlog::level::level_enum::trace:
        return ELogLevel::Trace;
    case spdlog::level::level_enum::debug:
        return ELogLevel::Debug;
    case spdlog::level::level_enum::info:
        return ELogLevel::Info;
    case spdlog::level::level_enum::warn:
        return ELogLevel::Warning;
    default:
        return ELogLevel::Error;
    }
}

LogRecord ConvertLogMsg(spdlog::details::log_msg const& msg)
{
    LogRecord res;
    res.m_file = msg.source.filename ? msg.source.filename : "";
    res.m_functionName = msg.source.funcname ? msg.source.funcname : "";
    res.m_lineNo = msg.source.line;
    res.m_message = std::string(msg.payload.begin(), msg.payload.end());
    res.m_timestamp = msg.time;
    res.m_logLevel = FromSpdLevel(msg.level);
    return res;
}
}  // namespace

namespace detail {

void SpdSinkProxy::SetSink(std::weak_ptr<SinkBase> sink) { m_sink = std::move(sink); }

bool SpdSinkProxy::IsExpired() const { return m_sink.expired(); }

void SpdSinkProxy::sink_it_(const spdlog::details::log_msg& msg)
{
    if (auto sinkObj = m_sink.lock())
        sinkObj->SinkRecord(ConvertLogMsg(msg));
}

void SpdSinkProxy::flush_()
{
    if (auto sinkObj = m_sink.lock())
        sinkObj->Flush();
}

}  // namespace detail

SinkBase::SinkBase() : m_spdSinkProxy(std::make_shared<detail::SpdSinkProxy>()) {}

Logger::Logger()
{
    m_spdLogger = spdlog::rotating_logger_mt(LoggerName, LogFileName, MaxLogFileSize, MaxLogFiles);
    m_spdLogger->set_level(ToSpdLevel(static_cast<ELogLevel>(RUP_LOG_ACTIVE_LOG_LEVEL)));
}

spdlog::level::level_enum Logger::ToSpdLevel(ELogLevel level)
{
    switch (level)
    {
    case ELogLevel::Trace:
        return spdlog::level::level_enum::trace;
    case ELogLevel::Debug:
        return spdlog::level::level_enum::debug;
    case ELogLevel::Info:
        return spdlog::level::level_enum::info;
    case ELogLevel::Warning:
        return spdlog::level::level_enum::warn;
    case ELogLevel::Error:
        return spdlog::level::level_enum::err;
    case ELogLevel::Off:
        break;
    }
    return spdlog::level::level_enum::off;
}

long Logger::AddSink(std::shared_ptr<SinkBase> sink)
{
    sink->m_spdSinkProxy->SetSink(sink);
    std::lock_guard<std::mutex> lk(m_mu);
    long id = ++m_nextId;
    m_spdLogger->sinks().push_back(sink->m_spdSinkProxy);
    m_sinks.emplace(id, std::move(sink));
    return id;
}

void Logger::RemoveSink(long id)
{
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_sinks.find(id);
    if (m_sinks.end() != it)
    {
        // Expire the proxy right away, another owner may keep the sink alive.
        it->second->m_spdSinkProxy->SetSink(std::weak_ptr<SinkBase>());
        m_sinks.erase(it);
    }
    ClearSpdlogSinks();
}

void Logger::ClearSinks()
{
    std::lock_guard<std::mutex> lk(m_mu);
    for (auto& kv : m_sinks)
        kv.second->m_spdSinkProxy->SetSink(std::weak_ptr<SinkBase>());
    m_sinks.clear();
    ClearSpdlogSinks();
}

std::size_t Logger::GetSinkCount() const
{
    std::lock_guard<std::mutex> lk(m_mu);
    return m_sinks.size();
}

void Logger::SetLevel(ELogLevel level) { m_spdLogger->set_level(ToSpdLevel(level)); }

void Logger::Flush() { m_spdLogger->flush(); }

void Logger::ClearSpdlogSinks()
{
    auto& sinks = m_spdLogger->sinks();
    sinks.erase(std::remove_if(sinks.begin(), sinks.end(),
                               [](auto const& sink) {
                                   auto* proxy = dynamic_cast<detail::SpdSinkProxy*>(sink.get());
                                   return proxy && proxy->IsExpired();
                               }),
                sinks.end());
}

}  // namespace internal
}  // namespace rup
