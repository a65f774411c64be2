#pragma once
#include "download/object_store.hpp"
#include "utils/error.hpp"
#include "utils/timer.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
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
/// One run from the object locator to the replaced process image.
/// The states are passed in order, Failed is terminal and reachable from every state before HandedOff.
/// The program is resolved in Planning, so an unknown program fails there with an ExecError
/// before any byte is fetched. An ExecError thrown by the executor fails the run after
/// Materialized, once the descriptor has been closed again.
class Launcher {
    public:
    /// The run state
    enum class State : uint8_t {
        Idle,
        Planning,
        Downloading,
        Materialized,
        HandedOff,
        Failed
    };

    /// Replaces the process image, the real one never returns
    using Executor = std::function<void(const std::string& path, const std::string& name, const std::vector<std::string>& args, const std::vector<std::string>& environment)>;

    private:
    /// The store
    download::ObjectStore& _store;
    /// The object
    download::ObjectLocator _locator;
    /// The program
    std::string _program;
    /// The program arguments with placeholders
    std::vector<std::string> _args;
    /// The placeholder
    std::string _placeholder;
    /// The executor
    Executor _executor;
    /// The state
    State _state;
    /// The stage of the failure
    std::optional<utils::Stage> _failedStage;
    /// The step timings
    utils::Timer _timer;

    /// Moves to the next state
    void transition(State next);

    public:
    /// Constructor
    Launcher(download::ObjectStore& store, download::ObjectLocator locator, std::string program, std::vector<std::string> args, std::string placeholder, Executor executor = Executor());

    /// Downloads the object and hands it to the program, throws utils::Error and leaves the launcher Failed
    void run(const char* const* environment);

    /// The state
    [[nodiscard]] State getState() const { return _state; }
    /// The failed stage, if any
    [[nodiscard]] std::optional<utils::Stage> getFailedStage() const { return _failedStage; }
    /// The timings
    [[nodiscard]] const utils::Timer& getTimer() const { return _timer; }
    /// The state name
    [[nodiscard]] static std::string_view getStateName(State state);
    /// Looks up a variable in an environment block
    [[nodiscard]] static const char* findVariable(const char* const* environment, std::string_view name);
};
//---------------------------------------------------------------------------
} // namespace memrun::launcher
