#pragma once
#include <cstdint>
#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::utils {
//---------------------------------------------------------------------------
/// Process wide leveled logger, writes timestamped lines to stderr.
/// Completion callbacks log from the network threads, a line is written atomically.
class Log {
    public:
    /// The severity
    enum class Level : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error
    };

    /// Set the minimal level that is printed
    static void setLevel(Level level);
    /// Get the minimal level
    [[nodiscard]] static Level getLevel();
    /// Is the level printed
    [[nodiscard]] static bool enabled(Level level);
    /// Redirect the output, nullptr resets to stderr
    static void setOutStream(std::ostream* outStream);
    /// Parse a level name (trace, debug, info, warn, error)
    [[nodiscard]] static bool parseLevel(std::string_view name, Level& level);
    /// The upper case level name
    [[nodiscard]] static std::string_view getLevelName(Level level);
    /// Write one line
    static void write(Level level, std::string_view message);

    /// Streams all arguments into one line
    template <typename... Args>
    static void log(Level level, const Args&... args) {
        if (!enabled(level))
            return;
        std::ostringstream stream;
        (stream << ... << args);
        write(level, stream.str());
    }
    /// Trace line
    template <typename... Args>
    static void trace(const Args&... args) { log(Level::Trace, args...); }
    /// Debug line
    template <typename... Args>
    static void debug(const Args&... args) { log(Level::Debug, args...); }
    /// Info line
    template <typename... Args>
    static void info(const Args&... args) { log(Level::Info, args...); }
    /// Warning line
    template <typename... Args>
    static void warn(const Args&... args) { log(Level::Warn, args...); }
    /// Error line
    template <typename... Args>
    static void error(const Args&... args) { log(Level::Error, args...); }

    private:
    /// The current timestamp
    static std::string getCurrentTimestamp();
};
//---------------------------------------------------------------------------
} // namespace memrun::utils
