#pragma once

#include "chunkdl/worker_pool.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <future>
#include <vector>

namespace chunkdl::detail {

// Runs fn(0) .. fn(count - 1) on `pool` and waits for all of them.
// The first failure raises `stop`; units that have not started yet skip fn.
// After every unit finished, the failure of the lowest index is rethrown.
// Must not be called from a task of the same pool.
template <typename Fn>
void runConcurrently(WorkerPool& pool, std::size_t count, std::atomic<bool>& stop, Fn fn) {
    std::vector<std::future<void>> units;
    units.reserve(count);

    auto unit = [&stop, &fn](std::size_t i) {
        if (stop.load()) {
            return;
        }
        try {
            fn(i);
        } catch (...) {
            stop.store(true);
            throw;
        }
    };

    auto waitAll = [&units]() {
        for (auto& future : units) {
            future.wait();
        }
    };

    try {
        for (std::size_t i = 0; i < count; ++i) {
            units.push_back(pool.submitTask(unit, i));
        }
    } catch (...) {
        // Queued units still reference this frame.
        stop.store(true);
        waitAll();
        throw;
    }

    waitAll();
    for (auto& future : units) {
        future.get();
    }
}

} // namespace chunkdl::detail
