#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(), plus an indexed parallel loop
// that batch parsing runs its per-buffer work through.
//
// Internal header -- not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <cstddef>
#include <exception>
#include <vector>

namespace litedoc_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Call fn(i) for every i in [0, count). Counts below `serial_below` run
// on the calling thread. Every index runs even when some throw; the
// exception of the lowest failing index is rethrown afterwards.
template <typename Fn>
void for_each_index(std::size_t count, Fn&& fn, std::size_t serial_below = 2) {
    auto failures = std::vector<std::exception_ptr>(count);
    auto guarded = [&](std::size_t i) {
        try {
            fn(i);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    };

    if (count < serial_below) {
        for (std::size_t i = 0; i < count; ++i) guarded(i);
    } else {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, count, std::size_t{1}, guarded);
        global_executor().run(taskflow).wait();
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }
}

}  // namespace litedoc_cpp::detail
