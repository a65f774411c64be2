#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <unordered_map>
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
/// Accumulates wall time per run stage
class Timer {
    public:
    enum Steps : uint64_t {
        Overall,
        Metadata,
        Allocation,
        Download,
        Handoff
    };

    /// Timer Guard
    class TimerGuard {
        /// The guarded step
        Steps step;
        /// The current timer
        Timer* timer;

        public:
        /// Constructor
        TimerGuard(Steps step, Timer* timer) : step(step), timer(timer) {
            if (timer)
                timer->start(step);
        }
        /// Destructor
        ~TimerGuard() {
            if (timer)
                timer->stop(step);
        }
    };

    private:
    /// Currently active timer
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> _currentTimer;
    /// Total time in ns
    std::unordered_map<uint64_t, uint64_t> _totalTimer;

    public:
    /// Starts the timer for step s
    void start(Steps s);
    /// Stop the timer and adds to totalTimer for step s
    void stop(Steps s);
    /// Total time of a step in milliseconds
    [[nodiscard]] double getMilliseconds(Steps s) const;
    /// Prints the result as csv
    void printResult(std::ostream& s) const;
    /// One line summary of all measured steps
    [[nodiscard]] std::string summary() const;
    /// The step name
    [[nodiscard]] static const char* getStepName(Steps s);
};
//---------------------------------------------------------------------------
} // namespace memrun::utils
