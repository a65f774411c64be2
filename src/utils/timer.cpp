#include "utils/timer.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
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
void Timer::start(Steps s)
// Starts timer for step s
{
    _currentTimer[s] = chrono::steady_clock::now();
}
//---------------------------------------------------------------------------
void Timer::stop(Steps s)
// Stops timer for step s
{
    auto it = _currentTimer.find(s);
    if (it == _currentTimer.end())
        return;
    auto time = chrono::duration_cast<chrono::nanoseconds>(chrono::steady_clock::now() - it->second).count();
    _totalTimer[s] += static_cast<uint64_t>(time);
    _currentTimer.erase(it);
}
//---------------------------------------------------------------------------
double Timer::getMilliseconds(Steps s) const
// The accumulated time
{
    auto it = _totalTimer.find(s);
    if (it == _totalTimer.end())
        return 0;
    return static_cast<double>(it->second) / (1000 * 1000);
}
//---------------------------------------------------------------------------
const char* Timer::getStepName(Steps s)
// The step names
{
    static const char* names[] = {"Overall", "Metadata", "Allocation", "Download", "Handoff"};
    return names[s];
}
//---------------------------------------------------------------------------
void Timer::printResult(ostream& s) const
// Print results
{
    s << "Step,Time" << endl;
    for (uint64_t step = Overall; step <= Handoff; step++) {
        auto it = _totalTimer.find(step);
        if (it != _totalTimer.end())
            s << getStepName(static_cast<Steps>(step)) << "," << static_cast<double>(it->second) / (1000 * 1000) << endl;
    }
}
//---------------------------------------------------------------------------
string Timer::summary() const
// Steps in fixed order
{
    ostringstream s;
    s << fixed << setprecision(1);
    auto first = true;
    for (uint64_t step = Overall; step <= Handoff; step++) {
        auto it = _totalTimer.find(step);
        if (it == _totalTimer.end())
            continue;
        if (!first)
            s << " ";
        first = false;
        s << getStepName(static_cast<Steps>(step)) << "=" << static_cast<double>(it->second) / (1000 * 1000) << "ms";
    }
    return s.str();
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace memrun
