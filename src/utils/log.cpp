#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
/// The minimal level
atomic<Log::Level> minLevel{Log::Level::Info};
/// The output, nullptr means stderr
ostream* outStream = nullptr;
/// Serializes the lines
mutex outMutex;
} // namespace
//---------------------------------------------------------------------------
void Log::setLevel(Level level)
// Sets the level
{
    minLevel = level;
}
//---------------------------------------------------------------------------
Log::Level Log::getLevel()
// Gets the level
{
    return minLevel;
}
//---------------------------------------------------------------------------
bool Log::enabled(Level level)
// Checks the level
{
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel.load());
}
//---------------------------------------------------------------------------
void Log::setOutStream(ostream* stream)
// Sets the stream
{
    lock_guard lock(outMutex);
    outStream = stream;
}
//---------------------------------------------------------------------------
bool Log::parseLevel(string_view name, Level& level)
// Parses the level name
{
    static constexpr Level levels[] = {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error};
    for (auto l : levels) {
        if (equalsIgnoreCase(name, getLevelName(l))) {
            level = l;
            return true;
        }
    }
    if (equalsIgnoreCase(name, "warning")) {
        level = Level::Warn;
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
string_view Log::getLevelName(Level level)
// The level as string
{
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "UNKNOWN";
}
//---------------------------------------------------------------------------
string Log::getCurrentTimestamp()
// Local time with milliseconds
{
    auto now = chrono::system_clock::now();
    auto time = chrono::system_clock::to_time_t(now);
    auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;
    tm local;
    localtime_r(&time, &local);

    ostringstream timestamp;
    timestamp << put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << setfill('0') << setw(3) << ms.count();
    return timestamp.str();
}
//---------------------------------------------------------------------------
void Log::write(Level level, string_view message)
// Writes a line
{
    if (!enabled(level))
        return;
    auto timestamp = getCurrentTimestamp();
    lock_guard lock(outMutex);
    auto& stream = outStream ? *outStream : cerr;
    stream << timestamp << " [" << getLevelName(level) << "] " << message << '\n';
    stream.flush();
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace memrun
