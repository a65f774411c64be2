#include "launcher/launcher.hpp"
#include "download/download_plan.hpp"
#include "download/downloader.hpp"
#include "memory/memory_buffer.hpp"
#include "process/process_handoff.hpp"
#include "utils/log.hpp"
#include <exception>
#include <utility>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::launcher {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
Launcher::Launcher(download::ObjectStore& store, download::ObjectLocator locator, string program, vector<string> args, string placeholder, Executor executor)
    : _store(store), _locator(move(locator)), _program(move(program)), _args(move(args)), _placeholder(move(placeholder)), _executor(move(executor)), _state(State::Idle), _failedStage(), _timer()
// Constructor
{
    if (!_executor)
        _executor = process::ProcessHandoff::execReplace;
}
//---------------------------------------------------------------------------
string_view Launcher::getStateName(State state)
// The state names
{
    switch (state) {
        case State::Idle: return "Idle";
        case State::Planning: return "Planning";
        case State::Downloading: return "Downloading";
        case State::Materialized: return "Materialized";
        case State::HandedOff: return "HandedOff";
        case State::Failed: return "Failed";
    }
    return "Unknown";
}
//---------------------------------------------------------------------------
const char* Launcher::findVariable(const char* const* environment, string_view name)
// NAME=value lookup
{
    if (!environment)
        return nullptr;
    for (auto entry = environment; *entry; ++entry) {
        string_view view(*entry);
        if (view.size() > name.size() && view.starts_with(name) && view[name.size()] == '=')
            return *entry + name.size() + 1;
    }
    return nullptr;
}
//---------------------------------------------------------------------------
void Launcher::transition(State next)
// States are never re-entered
{
    utils::Log::debug("State ", getStateName(_state), " -> ", getStateName(next));
    _state = next;
}
//---------------------------------------------------------------------------
void Launcher::run(const char* const* environment)
// Idle -> Planning -> Downloading -> Materialized -> HandedOff
{
    if (_state != State::Idle)
        throw logic_error("launcher already ran");

    utils::Timer::TimerGuard overall(utils::Timer::Overall, &_timer);
    try {
        utils::Log::info("Starting download of ", _locator.bucket, "/", _locator.key, " for ", _program);
        transition(State::Planning);
        // Fail before downloading if the program cannot be started
        auto program = process::ProcessHandoff::resolveProgram(_program, findVariable(environment, "PATH"));
        download::Downloader downloader(_store, _locator);
        download::DownloadPlan plan;
        {
            utils::Timer::TimerGuard guard(utils::Timer::Metadata, &_timer);
            plan = downloader.plan();
        }

        transition(State::Downloading);
        auto buffer = [&] {
            utils::Timer::TimerGuard guard(utils::Timer::Allocation, &_timer);
            return memory::MemoryBuffer::create("memrun");
        }();
        downloader.setProgressCallback([](const download::Progress& progress) {
            if (progress.completedRanges % 10 == 0 || progress.completedRanges == progress.totalRanges)
                utils::Log::info("Download progress: ", progress.completedRanges, "/", progress.totalRanges, " ranges (", progress.completedBytes * 100 / max<uint64_t>(progress.totalBytes, 1), "%)");
        });
        {
            utils::Timer::TimerGuard guard(utils::Timer::Download, &_timer);
            downloader.execute(plan, buffer);
        }
        utils::Log::info("Download completed, ", plan.totalSize, " bytes (", _timer.getMilliseconds(utils::Timer::Download), " ms)");

        transition(State::Materialized);
        utils::Timer::TimerGuard guard(utils::Timer::Handoff, &_timer);
        auto reference = process::ProcessHandoff::finalize(move(buffer));
        auto args = process::ProcessHandoff::substitutePlaceholder(_args, _placeholder, reference);
        auto childEnvironment = process::ProcessHandoff::buildEnvironment(reference, environment);
        utils::Log::debug("Memory file at ", reference.getPath(), ", ", args.size(), " arguments");
        utils::Log::info("Executing program: ", program);
        utils::Log::debug(_timer.summary());
        _executor(program, _program, args, childEnvironment);

        // Only a substituted executor returns
        transition(State::HandedOff);
    } catch (const utils::Error& e) {
        _failedStage = e.getStage();
        transition(State::Failed);
        throw;
    } catch (const exception&) {
        transition(State::Failed);
        throw;
    }
}
//---------------------------------------------------------------------------
} // namespace memrun::launcher
