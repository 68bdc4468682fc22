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

#include "resumableupload/upload_engine.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

class NeedUsage : public std::runtime_error
{
public:
    NeedUsage(const char* const msg) : std::runtime_error(msg) {}
    NeedUsage(std::string const& msg) : std::runtime_error(msg.c_str()) {}
};

auto constexpr UploadUsage = "upload <file> [key=value...]";
auto constexpr ResumeUsage = "resume <session-id> <file>";
auto constexpr ListUsage = "list";
auto constexpr CancelUsage = "cancel <session-id> <file>";
auto constexpr EvictUsage = "evict <max-age-hours>";

std::string commandUsage;
std::atomic<bool> interrupted{false};

void OnInterrupt(int) { interrupted = true; }

void PrintUsage(int argc, char* argv[], std::string const& msg)
{
    std::string const cmd = argc > 0 ? argv[0] : "rup_example";
    auto lastSlash = cmd.find_last_of("/\\");
    auto program = cmd.substr(lastSlash == std::string::npos ? 0 : lastSlash + 1);
    std::cerr << msg << "\nUsage: " << program << " <command> [arguments]\n\n"
              << "Commands:\n"
              << commandUsage << "\nThe endpoint is read from RUP_ENDPOINT, sessions are kept in RUP_SESSION_DIR."
              << std::endl;
}

void PrintEvent(rup::UploadEvent const& event)
{
    auto const percent =
        event.m_totalBytes == 0 ? 100.0 : 100.0 * static_cast<double>(event.m_committedBytes) / event.m_totalBytes;
    std::cout << event.m_sessionId << " " << event.m_status << " " << std::fixed << std::setprecision(1) << percent
              << "% (" << event.m_committedBytes << "/" << event.m_totalBytes << ")";
    if (event.m_speedBytesPerSecond > 0)
        std::cout << " " << std::setprecision(0) << event.m_speedBytesPerSecond / 1024 << " KiB/s";
    if (event.m_estimatedSecondsRemaining)
        std::cout << " eta " << std::setprecision(0) << *event.m_estimatedSecondsRemaining << "s";
    if (event.m_lastError)
        std::cout << " " << *event.m_lastError;
    std::cout << std::endl;
}

std::unique_ptr<rup::UploadEngine> MakeEngine()
{
    return rup::MakeUploadEngine(rup::Options{}.Set<rup::EventCallbackOption>(&PrintEvent));
}

std::shared_ptr<rup::SessionStore> MakeStore()
{
    auto options = rup::internal::DefaultUploadOptions(rup::Options{});
    return std::make_shared<rup::FileSessionStore>(options.Get<rup::SessionStoreDirectoryOption>());
}

std::shared_ptr<rup::ByteSource> OpenFile(std::string const& path)
{
    auto source = rup::FileByteSource::Open(path);
    if (!source)
        throw std::runtime_error(source.GetStatus().Message());
    return *std::move(source);
}

// Waits for the upload to stop, pauses it on Ctrl-C.
int WaitForUpload(rup::UploadEngine& engine)
{
    std::signal(SIGINT, &OnInterrupt);
    while (engine.GetSnapshot().m_status == rup::UploadStatus::Uploading)
    {
        if (interrupted)
        {
            auto status = engine.Pause();
            if (!status.Ok())
                std::cerr << "Cannot pause: " << status << std::endl;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    auto const result = engine.Wait();
    auto const session = engine.GetSession();
    if (result == rup::UploadStatus::Paused)
        std::cout << "Paused, continue with: resume " << session.m_id << " <file>" << std::endl;
    return result == rup::UploadStatus::Completed || result == rup::UploadStatus::Paused ? 0 : 1;
}

int Upload(std::vector<std::string> const& argv)
{
    if (argv.empty())
        throw NeedUsage(UploadUsage);

    rup::UploadMetadata metadata;
    for (auto it = argv.begin() + 1; it != argv.end(); ++it)
    {
        auto const pos = it->find('=');
        if (pos == std::string::npos)
            throw NeedUsage("Metadata must be given as key=value, got " + *it);
        metadata[it->substr(0, pos)] = it->substr(pos + 1);
    }

    auto engine = MakeEngine();
    auto id = engine->Start(OpenFile(argv.at(0)), std::move(metadata));
    if (!id)
    {
        std::cerr << "Cannot start upload: " << id.GetStatus() << std::endl;
        return 1;
    }
    std::cout << "Started upload " << *id << std::endl;
    return WaitForUpload(*engine);
}

int Resume(std::vector<std::string> const& argv)
{
    if (argv.size() != 2)
        throw NeedUsage(ResumeUsage);

    auto engine = MakeEngine();
    auto status = engine->Resume(argv.at(0), OpenFile(argv.at(1)));
    if (!status.Ok())
    {
        std::cerr << "Cannot resume " << argv.at(0) << ": " << status << std::endl;
        return 1;
    }
    return WaitForUpload(*engine);
}

int List(std::vector<std::string> const& argv)
{
    if (!argv.empty())
        throw NeedUsage(ListUsage);

    auto sessions = rup::ListResumableSessions(*MakeStore());
    if (!sessions)
    {
        std::cerr << "Cannot list sessions: " << sessions.GetStatus() << std::endl;
        return 1;
    }
    for (auto const& session : *sessions)
    {
        std::cout << session.m_id << "\t" << session.m_status << "\t" << session.m_committedBytes << "/"
                  << session.m_totalBytes << "\t" << session.m_sourceName << std::endl;
    }
    return 0;
}

int Cancel(std::vector<std::string> const& argv)
{
    if (argv.size() != 2)
        throw NeedUsage(CancelUsage);

    auto engine = MakeEngine();
    auto status = engine->Resume(argv.at(0), OpenFile(argv.at(1)));
    if (status.Ok())
        status = engine->Cancel();
    else if (status.Code() == rup::StatusCode::FailedPrecondition)
        status = MakeStore()->Delete(argv.at(0));  // Not resumable, only the record is left.
    if (!status.Ok())
    {
        std::cerr << "Cannot cancel " << argv.at(0) << ": " << status << std::endl;
        return 1;
    }
    return 0;
}

int Evict(std::vector<std::string> const& argv)
{
    if (argv.size() != 1)
        throw NeedUsage(EvictUsage);

    auto evicted = rup::EvictStaleSessions(*MakeStore(), std::chrono::hours(std::stoi(argv.at(0))),
                                           std::chrono::system_clock::now());
    if (!evicted)
    {
        std::cerr << "Cannot evict sessions: " << evicted.GetStatus() << std::endl;
        return 1;
    }
    std::cout << "Evicted " << *evicted << " session(s)" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[])
try
{
    using CmdFn = std::function<int(std::vector<std::string> const&)>;
    std::map<std::string, CmdFn> cmdMap = {
        {"upload", &Upload}, {"resume", &Resume}, {"list", &List}, {"cancel", &Cancel}, {"evict", &Evict},
    };
    for (auto const* usage : {UploadUsage, ResumeUsage, ListUsage, CancelUsage, EvictUsage})
    {
        commandUsage += "\t";
        commandUsage += usage;
        commandUsage += "\n";
    }

    if (argc < 2)
        throw NeedUsage("Missing command.");

    std::string cmd = argv[1];
    auto cmdIt = cmdMap.find(cmd);
    if (cmdIt == std::end(cmdMap))
        throw NeedUsage("Unknown command: " + cmd);

    return cmdIt->second({argv + 2, argv + argc});
}
catch (NeedUsage const& ex)
{
    PrintUsage(argc, argv, ex.what());
    return 0;
}
catch (std::exception const& ex)
{
    std::cerr << "Standard C++ exception raised: " << ex.what() << "\n";
    return 1;
}
