#include "download/downloader.hpp"
#include "memory/memory_buffer.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <semaphore>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace download {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
/// State shared between the admitting thread and the completions
struct ExecutionState {
    /// Admission slots
    counting_semaphore<> slots;
    /// Protects the counters and the error
    std::mutex stateMutex;
    /// Signals a drained fetch
    condition_variable drained;
    /// Admitted but unsettled fetches
    uint64_t inFlight = 0;
    /// Written ranges
    uint64_t completedRanges = 0;
    /// Written bytes
    uint64_t completedBytes = 0;
    /// The first failure
    exception_ptr firstError;

    /// Constructor
    explicit ExecutionState(unsigned concurrency) : slots(concurrency) {}

    /// Has a fetch failed
    bool failed() {
        lock_guard lock(stateMutex);
        return firstError != nullptr;
    }
    /// Keeps the first error only
    void fail(exception_ptr error) {
        lock_guard lock(stateMutex);
        if (!firstError)
            firstError = move(error);
    }
};
} // namespace
//---------------------------------------------------------------------------
Downloader::Downloader(ObjectStore& store, ObjectLocator locator) : _store(store), _locator(move(locator))
// Constructor
{
}
//---------------------------------------------------------------------------
DownloadPlan Downloader::plan() const
// Builds the plan from the object size
{
    auto totalSize = _store.headSize(_locator);
    auto plan = DownloadPlan::build(totalSize);
    utils::Log::info("Object size: ", totalSize, " bytes, chunk size: ", plan.chunkSize, " bytes, ranges: ", plan.ranges.size(), ", concurrency: ", plan.concurrency);
    return plan;
}
//---------------------------------------------------------------------------
void Downloader::execute(const DownloadPlan& plan, memory::MemoryBuffer& buffer) const
// Runs the bounded fan out
{
    buffer.preallocate(plan.totalSize);
    if (plan.ranges.empty())
        return;

    auto state = make_shared<ExecutionState>(plan.concurrency ? plan.concurrency : 1);
    auto totalRanges = plan.ranges.size();
    auto totalBytes = plan.totalSize;
    auto progress = _progress;

    for (auto& range : plan.ranges) {
        state->slots.acquire();
        if (state->failed()) {
            state->slots.release();
            break;
        }
        {
            lock_guard lock(state->stateMutex);
            state->inFlight++;
        }
        utils::Log::trace("Admitted range ", range.start, "-", range.end);

        auto completion = [state, range, &buffer, totalRanges, totalBytes, progress](ChunkResult&& result) {
            // A failed fetch or write is recorded before its slot can admit the next range
            auto received = false;
            try {
                if (!result.success())
                    throw utils::TransferError(range.start, range.end, result.error.empty() ? "no response" : result.error);
                if (result.body().size() != range.length())
                    throw utils::TransferError(range.start, range.end, "expected " + to_string(range.length()) + " bytes, received " + to_string(result.body().size()));
                received = true;
            } catch (const exception&) {
                state->fail(current_exception());
            }
            auto written = false;
            if (received) {
                try {
                    buffer.writeAt(result.body(), range.start);
                    written = true;
                } catch (const exception&) {
                    state->fail(current_exception());
                }
            }
            state->slots.release();
            result.buffer.reset();

            Progress snapshot{};
            {
                lock_guard lock(state->stateMutex);
                if (written) {
                    state->completedRanges++;
                    state->completedBytes += range.length();
                }
                snapshot = {state->completedRanges, totalRanges, state->completedBytes, totalBytes};
            }
            if (written && progress)
                progress(snapshot);

            lock_guard lock(state->stateMutex);
            state->inFlight--;
            state->drained.notify_all();
        };

        try {
            _store.rangedGet(_locator, range, move(completion));
        } catch (const exception& e) {
            // The fetch was never issued, no completion follows
            state->fail(make_exception_ptr(utils::TransferError(range.start, range.end, e.what())));
            state->slots.release();
            lock_guard lock(state->stateMutex);
            state->inFlight--;
            break;
        }
    }

    unique_lock lock(state->stateMutex);
    state->drained.wait(lock, [&] { return state->inFlight == 0; });
    if (state->firstError)
        rethrow_exception(state->firstError);
}
//---------------------------------------------------------------------------
}; // namespace download
}; // namespace memrun
